#ifndef GAPSYNC_CONFIGURATION_JSON_HPP
#define GAPSYNC_CONFIGURATION_JSON_HPP

#include <nlohmann/json.hpp>

#include "configuration.hpp"

#define AUTOGENERATE_JSON_CONVERSION NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE

class JsonDirConfigReader final : public DirectoryConfigurationReader {
	public:
	DirectoryConfigurationReadResult read_from_directory(
		const std::filesystem::path &directory
	) const override;

	const char *config_file_name() const override {
		return CONFIG_FILE_NAME;
	}
};

#endif // GAPSYNC_CONFIGURATION_JSON_HPP
