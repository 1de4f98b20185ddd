#ifndef GAPSYNC_CONSTANTS_HPP
#define GAPSYNC_CONSTANTS_HPP

#include <compare>
#include <ostream>

#include <nlohmann/json.hpp>

constexpr int EXIT_CODE_INCORRECT_USAGE = 1;
constexpr int EXIT_CODE_INVALID_DIRECTORY = 2;
constexpr int EXIT_CODE_FILESYSTEM_ERROR = 3;
constexpr int EXIT_CODE_CONFIG_FILE_PARSE_ERROR = 4;
constexpr int EXIT_CODE_CONFIG_VERSION_INCOMPATIBLE = 5;
constexpr int EXIT_CODE_INCOMPATIBLE_ENTRIES = 6;
constexpr int EXIT_CODE_FILES_FAILED = 7;

/** Semantic version of the program, which doubles as the version of the
 * `.gapsync.json` format. Every configuration file records the version it was
 * written for under "configVersion"; the program refuses files it cannot read. */
class Version {
	// JSON keys of "configVersion" are the member names
	unsigned major = 0;
	unsigned minor = 0;
	unsigned patch = 0;

	using Json = nlohmann::json;
	friend void to_json(Json &json, const Version &parsed);
	friend void from_json(const Json &json, Version &parsed);

	public:
	constexpr Version() = default;
	constexpr Version(const unsigned major, const unsigned minor, const unsigned patch)
		: major(major), minor(minor), patch(patch) {}

	std::strong_ordering operator<=>(const Version &) const = default;
	bool operator==(const Version &) const = default;

	/** A file format version is readable by `program` when nothing was removed
	 * or renamed in between: same major version, and a file no newer than the program.
	 * Before 1.0.0 the format has no stability promise, only an exact match is readable. */
	bool is_readable_by(const Version &program) const {
		if (major != program.major) return false;
		if (major == 0) return *this == program;
		return *this <= program;
	}

	friend std::ostream &operator<<(std::ostream &stream, const Version &version) {
		return stream << version.major << '.' << version.minor << '.' << version.patch;
	}
};

constexpr Version PROGRAM_VERSION(0, 1, 0);

#endif // GAPSYNC_CONSTANTS_HPP
