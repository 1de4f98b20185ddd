#include "configuration.hpp"

#include <iostream>
#include <system_error>

#include "configuration-json.hpp"
#include "../wildcards.hpp"

namespace fs = std::filesystem;
using Reader = DirectoryConfigurationReader;
using Result = DirectoryConfigurationReadResult;

bool is_config_file(const fs::path &path) {
	return path.filename().string() == CONFIG_FILE_NAME;
}

bool DirectoryConfiguration::accepts(const fs::directory_entry &entry) const {
	const std::string filename = entry.path().filename().string();

	for (const std::string &pattern : exclusion_patterns) {
		if (wildcard_matches(pattern, filename))
			return false;
	}

	if (max_file_size.has_value()) {
		std::error_code error;
		if (entry.is_regular_file(error)) {
			const std::uintmax_t size = entry.file_size(error);
			// an unreadable size is left for the copy itself to fail on
			if (!error && size > *max_file_size) return false;
		}
	}

	return true;
}

/** Reads and parses the local configuration of one directory.
 * Checks the config version upon parsing.
 * A parse error or an incompatible version is written to the standard error stream.
 * @param directory the directory in which to load a local configuration
 * @param arguments the processed CLI program arguments
 * @param configuration Output parameter of the configuration. Has no value
 * if no configuration file was present or an error occurred.
 * @return A program-wide error code. If none occurs, defaults to zero. */
int get_directory_configuration(
	const fs::path &directory,
	const ProgramArguments &arguments,
	std::optional<DirectoryConfiguration> &configuration
) {
	configuration.reset();

	const Reader &reader = JsonDirConfigReader();
	// add other readers when the program is extended

	const Result result = reader.read_from_directory(directory);
	const fs::path config_file_path = directory / reader.config_file_name();

	if (std::holds_alternative<DirectoryConfigurationParseError>(result)) {
		std::cerr << "Error: Parse error in " << config_file_path << std::endl;
		return EXIT_CODE_CONFIG_FILE_PARSE_ERROR;
	} else if (std::holds_alternative<DirectoryConfigurationIncompatible>(result)) {
		std::cerr << "Error: Incompatible configuration version in " << config_file_path
			<< ", expected " << PROGRAM_VERSION << std::endl;
		return EXIT_CODE_CONFIG_VERSION_INCOMPATIBLE;
	} else if (const auto *error = std::get_if<fs::filesystem_error>(&result)) {
		std::cerr << "Error: " << error->what() << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}

	const DirectoryConfiguration *config = std::get_if<DirectoryConfiguration>(&result);
	if (config == nullptr) return 0;

	if (arguments.is_verbose()) {
		std::cout << "Loaded configuration " << config_file_path
			<< " (version " << config->get_version()
			<< ", " << config->get_exclusion_patterns().size() << " exclusion pattern(s)";
		if (config->get_max_file_size().has_value())
			std::cout << ", max file size " << *config->get_max_file_size() << " B";
		std::cout << ")\n";
	}
	configuration = *config;
	return 0;
}
