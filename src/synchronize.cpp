#include "synchronize.hpp"
#include "constants.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "synchronize_two_way.hpp"
#include "configuration/configuration.hpp"

namespace fs = std::filesystem;

std::ostream &operator<<(std::ostream &stream, const SyncStatistics &statistics) {
	stream << statistics.files_copied << " file(s) copied, "
		<< statistics.directories_created << " directory(ies) created, "
		<< statistics.skipped() << " skipped, "
		<< statistics.entries_failed << " failed";
	return stream;
}

/** Verifies the given path is an existing directory.
 * @param path one of the two synchronized root directories
 * @return A program-wide error code. If none occurs, default to zero. */
int verify_directory(const fs::path &path) {
	std::error_code error;
	const fs::file_status status = fs::status(path, error);

	if (status.type() == fs::file_type::not_found) {
		std::cerr << "Error: Directory " << path << " does not exist." << std::endl;
		return EXIT_CODE_INVALID_DIRECTORY;
	}
	if (error) {
		std::cerr << "Error: Failed to check the directory details of " << path
			<< ": " << error.message() << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}
	if (!fs::is_directory(status)) {
		std::cerr << "Error: " << path << " is not a directory." << std::endl;
		return EXIT_CODE_INVALID_DIRECTORY;
	}

	return 0;
}

/** Returns true if `child` is `parent` itself or lies somewhere below it.
 * Both paths are expected to be canonical. */
bool is_nested_within(const fs::path &parent, const fs::path &child) {
	const auto [parent_end, _] = std::mismatch(parent.begin(), parent.end(), child.begin(), child.end());
	return parent_end == parent.end();
}

/** Checks that neither root lies strictly inside the other. Sweeping into a subdirectory
 * of the tree being walked would keep feeding the walk with its own copies.
 * @param same_directory output flag, set when both paths resolve to one directory
 * (every file trivially exists on the other side) */
int verify_disjoint_roots(const fs::path &left, const fs::path &right, bool &same_directory) {
	std::error_code error;
	const fs::path left_canonical = fs::canonical(left, error);
	if (error) {
		std::cerr << "Error: Failed to resolve " << left << ": " << error.message() << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}
	const fs::path right_canonical = fs::canonical(right, error);
	if (error) {
		std::cerr << "Error: Failed to resolve " << right << ": " << error.message() << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}

	same_directory = left_canonical == right_canonical;
	if (same_directory) return 0;

	if (is_nested_within(left_canonical, right_canonical)
		|| is_nested_within(right_canonical, left_canonical)) {
		std::cerr << "Error: Directories " << left << " and " << right
			<< " overlap; one of them lies inside the other." << std::endl;
		return EXIT_CODE_INVALID_DIRECTORY;
	}
	return 0;
}

/** Makes the path absolute so that the copy log names full paths. */
int absolute_root(const std::string &input, fs::path &output) {
	if (input.empty()) {
		std::cerr << "Error: Empty directory path." << std::endl;
		return EXIT_CODE_INVALID_DIRECTORY;
	}

	std::error_code error;
	output = fs::absolute(input, error);
	if (error) {
		std::cerr << "Error: Failed to resolve " << input << ": " << error.message() << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}
	output = output.lexically_normal();
	return 0;
}

/** Validates both roots and fills the gaps of each tree with the files of the other.
 * Every check that can reject the run happens before the first filesystem mutation:
 * root existence, root overlap and the root directory configurations.
 * @param arguments the processed CLI arguments, dictating synchronization details
 * @param statistics output counters of the run
 * @return An error code. If none occurs, defaults to zero. */
int synchronize_directories(const ProgramArguments &arguments, SyncStatistics &statistics) {
	if (arguments.is_verbose())
		arguments.print(std::cout);

	fs::path left_path, right_path;
	int error = absolute_root(arguments.get_left_path(), left_path);
	if (error) return error;
	error = absolute_root(arguments.get_right_path(), right_path);
	if (error) return error;

	error = verify_directory(left_path);
	if (error) return error;
	error = verify_directory(right_path);
	if (error) return error;
	bool same_directory = false;
	error = verify_disjoint_roots(left_path, right_path, same_directory);
	if (error) return error;

	// a broken root configuration would otherwise surface halfway through the first sweep
	OptionalConfiguration root_configuration;
	error = get_directory_configuration(left_path, arguments, root_configuration);
	if (error) return error;
	error = get_directory_configuration(right_path, arguments, root_configuration);
	if (error) return error;

	if (same_directory) {
		std::cout << "Both paths name the same directory, nothing to copy." << std::endl;
		std::cout << "Sync complete: " << statistics << "." << std::endl;
		return 0;
	}

	BidirectionalContext context(arguments, statistics, left_path, right_path);
	BidirectionalSynchronizer synchronizer(context);
	error = synchronizer.synchronize();
	if (error) {
		std::cerr << "Sync aborted: " << statistics << "." << std::endl;
		return error;
	}

	std::cout << (arguments.is_dry_run() ? "Dry run complete: " : "Sync complete: ")
		<< statistics << "." << std::endl;

	if (statistics.entries_failed > 0)
		return EXIT_CODE_FILES_FAILED;
	return 0;
}

int synchronize_directories(const ProgramArguments &arguments) {
	SyncStatistics statistics;
	return synchronize_directories(arguments, statistics);
}
