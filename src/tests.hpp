#ifndef GAPSYNC_TESTS_HPP
#define GAPSYNC_TESTS_HPP

/** Runs the built-in test suite in a scratch directory under the system temporary directory.
 * @return zero when every test passed */
int run_tests();

#endif // GAPSYNC_TESTS_HPP
