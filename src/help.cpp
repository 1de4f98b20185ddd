#include "help.hpp"

#include <iostream>

#include "constants.hpp"

const char *HELP =
	"Usage: gapsync [OPTIONS] <left-directory> <right-directory>\n"
	"\n"
	"The gapsync utility fills the gaps between two directory trees: every file\n"
	"present in one tree but missing at the same relative path in the other is copied\n"
	"over, keeping its modification time and permissions. Existing files are never\n"
	"overwritten or deleted, even when their content differs.\n"
	"OPTIONS:\n"
	"-h, --help:	Display help information and exit. No positional arguments are needed.\n"
	"--version:	Display the program version and exit.\n"
	"--verbose:	Output detailed information during synchronization (directories created, files skipped, etc.).\n"
	"--dry-run:	Report the files that would be copied without copying anything or creating directories.\n"
	"--fail-fast:	Stop at the first file that cannot be copied. By default, such files are reported and skipped, and the program exits with code 7 at the end.\n"
	"--copy-configs, --copy-configurations:	Copy directory configuration files (.gapsync.json) themselves, if missing on the other side.\n"
	"--test:	Runs implementation tests. Used by developers and testers.\n"
	"\n"
	"DIRECTORY CONFIGURATION:\n"
	"A .gapsync.json file inside any directory of either tree applies to that directory and below:\n"
	"  {\"configVersion\": {\"major\": 0, \"minor\": 1, \"patch\": 0},\n"
	"   \"exclusionPatterns\": [\"*.tmp\", \"images\"], \"maxFileSize\": 1048576}\n"
	"Matching entries are neither copied out of nor into the configured directory.\n";

void print_help() {
	std::cout << HELP << std::endl;
}

void print_version() {
	std::cout << "gapsync " << PROGRAM_VERSION << std::endl;
}
