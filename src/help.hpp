#ifndef GAPSYNC_HELP_HPP
#define GAPSYNC_HELP_HPP

void print_help();
void print_version();

#endif // GAPSYNC_HELP_HPP
