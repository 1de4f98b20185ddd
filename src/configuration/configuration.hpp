#ifndef GAPSYNC_DIRECTORY_CONFIG_HPP
#define GAPSYNC_DIRECTORY_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../arguments.hpp"
#include "../constants.hpp"

/** A local directory configuration, saved as a file inside the directory it configures.
 * Applies to the directory and everything below it. Contains the wildcard-supported
 * exclusion patterns and an optional file size limit. */
class DirectoryConfiguration {
	Version config_version;
	std::vector<std::string> exclusion_patterns;
	std::optional<std::uintmax_t> max_file_size;

	// expose private members to the JSON parser function
	using Json = nlohmann::json;
	friend void from_json(const Json &j, DirectoryConfiguration &p);

	public:
	const Version &get_version() const { return config_version; }

	/** Filenames that are neither copied from nor to the configured directory.
	 * Supports wildcards with asterisk '*' character, e.g. `example-*.txt` or `*.log`. */
	const std::vector<std::string> &get_exclusion_patterns() const {
		return exclusion_patterns;
	}

	const std::optional<std::uintmax_t> &get_max_file_size() const {
		return max_file_size;
	}

	/** Returns true if the filesystem entry may be copied
	 * out of the directory configured by this instance. */
	bool allows(const std::filesystem::directory_entry &entry) const {
		return accepts(entry);
	}

	/** Returns true if the filesystem entry may be copied
	 * into the directory configured by this instance. */
	bool accepts(const std::filesystem::directory_entry &entry) const;
};

struct DirectoryConfigurationFileNonexistent {};
struct DirectoryConfigurationParseError {};
struct DirectoryConfigurationIncompatible {};

using DirectoryConfigurationReadResult = std::variant<
	DirectoryConfiguration,
	DirectoryConfigurationParseError,
	DirectoryConfigurationIncompatible,
	DirectoryConfigurationFileNonexistent,
	std::filesystem::filesystem_error
>;

constexpr char CONFIG_FILE_NAME[] = ".gapsync.json";

bool is_config_file(const std::filesystem::path &path);

/** An abstract reader and parser of the local directory configurations.
 * Supporting another file format means deriving from this class
 * and using the new reader in `get_directory_configuration`. */
class DirectoryConfigurationReader {
	public:
	/** Tries to read the configuration. Returns a composite instance
	 * - config or file error or "not found". */
	virtual DirectoryConfigurationReadResult read_from_directory(
		const std::filesystem::path &directory
	) const = 0;

	/** Gets the config filename specific to this format. */
	virtual const char *config_file_name() const = 0;

	virtual ~DirectoryConfigurationReader() = default;
};

int get_directory_configuration(
	const std::filesystem::path &directory,
	const ProgramArguments &arguments,
	std::optional<DirectoryConfiguration> &configuration
);

#endif // GAPSYNC_DIRECTORY_CONFIG_HPP
