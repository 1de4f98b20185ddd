#include "configuration-json.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "configuration.hpp"

namespace fs = std::filesystem;
using Json = nlohmann::json;

AUTOGENERATE_JSON_CONVERSION(Version, major, minor, patch)

const char *CONFIGURATION_VERSION_KEY = "configVersion";
const char *EXCLUSION_PATTERNS_KEY = "exclusionPatterns";
const char *MAX_FILE_SIZE_KEY = "maxFileSize";

void from_json(const Json &j, DirectoryConfiguration &p) {
	j.at(CONFIGURATION_VERSION_KEY).get_to(p.config_version);
	j.at(EXCLUSION_PATTERNS_KEY).get_to(p.exclusion_patterns);

	p.max_file_size.reset();
	if (j.contains(MAX_FILE_SIZE_KEY) && !j.at(MAX_FILE_SIZE_KEY).is_null())
		p.max_file_size = j.at(MAX_FILE_SIZE_KEY).get<std::uintmax_t>();
}

DirectoryConfigurationReadResult JsonDirConfigReader::read_from_directory(
	const fs::path &directory
) const {
	const fs::path file_path = directory / config_file_name();
	std::error_code error;
	const fs::file_status file_status = fs::status(file_path, error);
	if (file_status.type() == fs::file_type::not_found)
		return DirectoryConfigurationFileNonexistent{};
	if (error)
		return fs::filesystem_error("Failed to check the directory configuration details", file_path, error);
	if (!fs::is_regular_file(file_status))
		return DirectoryConfigurationParseError{};

	std::ifstream file_stream(file_path);
	if (!file_stream.good())
		return fs::filesystem_error(
			"Failed to open the directory configuration",
			file_path,
			std::make_error_code(std::errc::permission_denied)
		);

	try {
		const Json json = Json::parse(file_stream);

		const Version config_version = json.at(CONFIGURATION_VERSION_KEY).get<Version>();
		if (!config_version.is_readable_by(PROGRAM_VERSION))
			return DirectoryConfigurationIncompatible{};

		return json.get<DirectoryConfiguration>();
	} catch (const Json::exception &) {
		return DirectoryConfigurationParseError{};
	}
}
