#include "tests.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "arguments.hpp"
#include "constants.hpp"
#include "synchronize.hpp"
#include "wildcards.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path test_root() {
	return fs::temp_directory_path() / "gapsync-tests";
}

void create_file(const fs::path &path, const std::string &content = "") {
	fs::create_directories(path.parent_path());
	std::ofstream file(path, std::ios::binary);
	file << content;
}

std::string read_file(const fs::path &path) {
	std::ifstream file(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool file_content_equals(const fs::path &file, const std::string &content) {
	return fs::is_regular_file(file) && read_file(file) == content;
}

void remove_recursively(const fs::path &path) {
	std::error_code ec;
	fs::remove_all(path, ec);
}

void write_configuration(const fs::path &directory, const json &configuration) {
	create_file(directory / ".gapsync.json", configuration.dump(4));
}

json compatible_configuration() {
	return {
		{
			"configVersion", {
				{"major", 0},
				{"minor", 1},
				{"patch", 0},
			}
		},
		{"exclusionPatterns", json::array()},
	};
}

/** Lists every entry below `root` as relative paths, to compare whole trees. */
std::vector<std::string> list_tree(const fs::path &root) {
	std::vector<std::string> entries;
	for (const auto &entry : fs::recursive_directory_iterator(root))
		entries.push_back(entry.path().lexically_relative(root).generic_string());
	std::sort(entries.begin(), entries.end());
	return entries;
}

const std::string old_version_content = "old";
const std::string new_version_content = "new";

class Test {
	public:
	const fs::path left = test_root() / "left";
	const fs::path right = test_root() / "right";
	SyncStatistics statistics;
	int result = 0;

	Test() = default;

	virtual void prepare() = 0;
	virtual void perform() = 0;
	virtual void assert_validity() = 0;

	virtual void cleanup() {
		remove_recursively(test_root());
	}

	virtual ~Test() noexcept = default;

	protected:
	/** Clears the scratch directory and creates both (empty) roots. */
	void prepare_roots() {
		remove_recursively(test_root());
		fs::create_directories(left);
		fs::create_directories(right);
	}

	ProgramArgumentsBuilder default_arguments() const {
		ProgramArgumentsBuilder builder;
		builder.set_left_directory(left.string());
		builder.set_right_directory(right.string());
		return builder;
	}

	int synchronize(const ProgramArguments &arguments) {
		statistics = SyncStatistics{};
		return synchronize_directories(arguments, statistics);
	}
};

class MoviesScenarioTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "movies" / "a.mp4", "a");
		create_file(left / "shared.txt", old_version_content);
		create_file(right / "movies" / "b.mp4", "b");
		create_file(right / "shared.txt", new_version_content);
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == 0);

		assert(file_content_equals(left / "movies" / "b.mp4", "b"));
		assert(file_content_equals(right / "movies" / "a.mp4", "a"));

		// same relative path on both sides: content differs, nothing is touched
		assert(file_content_equals(left / "shared.txt", old_version_content));
		assert(file_content_equals(right / "shared.txt", new_version_content));

		const std::vector<std::string> expected = {"movies", "movies/a.mp4", "movies/b.mp4", "shared.txt"};
		assert(list_tree(left) == expected);
		assert(list_tree(right) == expected);

		assert(statistics.files_copied == 2);
		assert(statistics.entries_failed == 0);
	}
};

class NestedDirectoryCreationTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "sub1" / "sub2" / "video.mp4", "video");
		fs::create_directories(right / "empty" / "deeper");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == 0);
		assert(fs::is_directory(right / "sub1" / "sub2"));
		assert(file_content_equals(right / "sub1" / "sub2" / "video.mp4", "video"));

		// directories are mirrored while walking, even without files in them
		assert(fs::is_directory(left / "empty" / "deeper"));

		assert(statistics.files_copied == 1);
		assert(statistics.directories_created == 4);
	}
};

class InvalidRootTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "unique.txt", "unique");
		remove_recursively(right);
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == EXIT_CODE_INVALID_DIRECTORY);
		assert(!fs::exists(right));
		assert(list_tree(left) == std::vector<std::string>{"unique.txt"});

		// a regular file in place of a directory is rejected the same way
		create_file(right, "not a directory");
		result = synchronize(default_arguments().build());
		assert(result == EXIT_CODE_INVALID_DIRECTORY);
		assert(fs::is_regular_file(right));
		assert(file_content_equals(right, "not a directory"));

		// the left side is validated too
		result = synchronize(
			default_arguments()
				.set_left_directory((test_root() / "missing").string())
				.set_right_directory(left.string())
				.build()
		);
		assert(result == EXIT_CODE_INVALID_DIRECTORY);
		assert(!fs::exists(test_root() / "missing"));
		assert(list_tree(left) == std::vector<std::string>{"unique.txt"});
		assert(statistics.files_copied == 0);
	}
};

class OverlappingRootsTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "inner" / "file.txt", "file");
	}

	void perform() override {
		result = synchronize(
			default_arguments()
				.set_right_directory((left / "inner").string())
				.build()
		);
	}

	void assert_validity() override {
		assert(result == EXIT_CODE_INVALID_DIRECTORY);
		assert(list_tree(left) == (std::vector<std::string>{"inner", "inner/file.txt"}));

		// one directory given twice has no gaps to fill
		result = synchronize(
			default_arguments()
				.set_right_directory((left / "inner" / "..").string())
				.build()
		);
		assert(result == 0);
		assert(statistics.files_copied == 0);
		assert(statistics.directories_created == 0);
		assert(list_tree(left) == (std::vector<std::string>{"inner", "inner/file.txt"}));
	}
};

class IdempotenceTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "a" / "one.txt", "1");
		create_file(left / "two.txt", "2");
		create_file(right / "b" / "c" / "three.txt", "3");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == 0);
		assert(statistics.files_copied == 3);

		const std::vector<std::string> left_after_first = list_tree(left);
		const std::vector<std::string> right_after_first = list_tree(right);
		assert(left_after_first == right_after_first);

		result = synchronize(default_arguments().build());
		assert(result == 0);
		assert(statistics.files_copied == 0);
		assert(statistics.directories_created == 0);
		assert(statistics.files_existing == 6);
		assert(list_tree(left) == left_after_first);
		assert(list_tree(right) == right_after_first);
	}
};

class MetadataPreservationTest final : public Test {
	const fs::file_time_type written_at =
		fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
	const fs::perms permissions =
		fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read;

	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "archive" / "clip.mkv", "clip");
		fs::permissions(left / "archive" / "clip.mkv", permissions, fs::perm_options::replace);
		fs::last_write_time(left / "archive" / "clip.mkv", written_at);
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		using std::chrono::seconds;
		using std::chrono::time_point_cast;

		assert(result == 0);
		const fs::path copy = right / "archive" / "clip.mkv";
		assert(file_content_equals(copy, "clip"));
		assert(fs::status(copy).permissions() == permissions);
		assert(time_point_cast<seconds>(fs::last_write_time(copy)) == time_point_cast<seconds>(written_at));
	}
};

class DryRunTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "new" / "episode.mp4", "episode");
		create_file(right / "poster.png", "poster");
	}

	void perform() override {
		result = synchronize(default_arguments().set_dry_run(true).set_verbosity(true).build());
	}

	void assert_validity() override {
		assert(result == 0);
		assert(statistics.files_copied == 2);
		assert(statistics.directories_created == 1);

		assert(list_tree(left) == (std::vector<std::string>{"new", "new/episode.mp4"}));
		assert(list_tree(right) == std::vector<std::string>{"poster.png"});
	}
};

class ExclusionConfigurationTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();

		json left_configuration = compatible_configuration();
		left_configuration["exclusionPatterns"] = {"*.tmp", "images"};
		write_configuration(left, left_configuration);

		json right_nested_configuration = compatible_configuration();
		right_nested_configuration["maxFileSize"] = 4;
		write_configuration(right / "small", right_nested_configuration);

		create_file(left / "keep.txt", "keep");
		create_file(left / "download.tmp", "partial");
		create_file(left / "images" / "cover.png", "cover");
		create_file(left / "small" / "tiny.txt", "abc");
		create_file(left / "small" / "large.txt", "too large");

		// excluded by the left configuration, which also refuses to accept it
		create_file(right / "scratch.tmp", "scratch");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == 0);

		assert(file_content_equals(right / "keep.txt", "keep"));
		assert(!fs::exists(right / "download.tmp"));
		assert(!fs::exists(right / "images"));
		assert(file_content_equals(right / "small" / "tiny.txt", "abc"));
		assert(!fs::exists(right / "small" / "large.txt"));
		assert(!fs::exists(left / "scratch.tmp"));

		// configuration files stay local to their tree
		assert(!fs::exists(right / ".gapsync.json"));
		assert(!fs::exists(left / "small" / ".gapsync.json"));

		// two patterns, one size limit, one destination pattern and two configuration files
		assert(statistics.entries_excluded == 6);
	}
};

class InvalidConfigurationTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "unique.txt", "unique");
		create_file(right / ".gapsync.json", "{ this is not json");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == EXIT_CODE_CONFIG_FILE_PARSE_ERROR);
		assert(!fs::exists(right / "unique.txt"));

		json incompatible = compatible_configuration();
		incompatible["configVersion"]["major"] = 1;
		write_configuration(right, incompatible);

		result = synchronize(default_arguments().build());
		assert(result == EXIT_CODE_CONFIG_VERSION_INCOMPATIBLE);
		assert(!fs::exists(right / "unique.txt"));
	}
};

class UnsupportedEntryTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "real.txt", "real");
		fs::create_directories(left / "real-directory");
		fs::create_symlink(left / "real.txt", left / "link.txt");
		fs::create_directory_symlink(left / "real-directory", left / "directory-link");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		assert(result == 0);
		assert(file_content_equals(right / "real.txt", "real"));
		assert(fs::is_directory(right / "real-directory"));
		assert(!fs::exists(fs::symlink_status(right / "link.txt")));
		assert(!fs::exists(fs::symlink_status(right / "directory-link")));
		assert(statistics.entries_unsupported == 2);
	}
};

class IncompatibleEntryTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "clash", "file on the left");
		fs::create_directories(right / "clash");
		create_file(left / "alpha.txt", "alpha");
		create_file(right / "omega.txt", "omega");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		// both sweeps run to the end and report the clash
		assert(result == EXIT_CODE_FILES_FAILED);
		assert(statistics.entries_failed == 2);
		assert(file_content_equals(right / "alpha.txt", "alpha"));
		assert(file_content_equals(left / "omega.txt", "omega"));
		assert(file_content_equals(left / "clash", "file on the left"));
		assert(fs::is_directory(right / "clash"));

		result = synchronize(default_arguments().set_error_policy(ErrorPolicy::fail_fast).build());
		assert(result == EXIT_CODE_INCOMPATIBLE_ENTRIES);
		assert(statistics.entries_failed == 1);
	}
};

class DestinationSymlinkTest final : public Test {
	const fs::path outside = test_root() / "outside";

	public:
	void prepare() override {
		prepare_roots();
		fs::create_directories(outside);
		create_file(left / "movies" / "a.mp4", "a");
		fs::create_directory_symlink(outside, right / "movies");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		// the destination symlink is a clash, never a way out of the tree
		assert(result == EXIT_CODE_FILES_FAILED);
		assert(!fs::exists(outside / "a.mp4"));
		assert(fs::is_empty(outside));
		assert(fs::is_symlink(right / "movies"));

		// the right-to-left sweep sees the same symlink as an unsupported source entry
		assert(statistics.entries_failed == 1);
		assert(statistics.entries_unsupported == 1);
		assert(statistics.files_copied == 0);
	}
};

class CopyConfigurationsTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		json configuration = compatible_configuration();
		configuration["exclusionPatterns"] = {"*.part"};
		write_configuration(left / "shows", configuration);
		create_file(left / "shows" / "pilot.mp4", "pilot");
	}

	void perform() override {
		result = synchronize(default_arguments().set_copy_configurations(true).build());
	}

	void assert_validity() override {
		assert(result == 0);
		assert(file_content_equals(
			right / "shows" / ".gapsync.json",
			read_file(left / "shows" / ".gapsync.json")
		));
		assert(file_content_equals(right / "shows" / "pilot.mp4", "pilot"));
		assert(statistics.files_copied == 2);
		assert(statistics.entries_excluded == 0);
	}
};

class NestedInvalidConfigurationTest final : public Test {
	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "nested" / ".gapsync.json", "[1, 2,");
		create_file(left / "nested" / "episode.mp4", "episode");
		create_file(right / "poster.png", "poster");
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		// discovered during the first sweep, the run stops there
		assert(result == EXIT_CODE_CONFIG_FILE_PARSE_ERROR);
		assert(!fs::exists(right / "nested" / "episode.mp4"));
		assert(!fs::exists(left / "poster.png"));
	}
};

class CopyFailureTest final : public Test {
	const fs::path locked = right / "locked";

	public:
	void prepare() override {
		prepare_roots();
		create_file(left / "locked" / "plain.txt", "plain");
		create_file(left / "locked" / "season" / "episode.mp4", "episode");
		create_file(left / "open.txt", "open");
		fs::create_directories(locked);
		fs::permissions(
			locked,
			fs::perms::owner_read | fs::perms::owner_exec,
			fs::perm_options::replace
		);
	}

	void perform() override {
		result = synchronize(default_arguments().build());
	}

	void assert_validity() override {
		if (geteuid() == 0) {
			std::cout << "Skipped: permissions are not enforced for root." << std::endl;
			return;
		}

		// a file that cannot be copied and a directory that cannot be created
		assert(result == EXIT_CODE_FILES_FAILED);
		assert(statistics.entries_failed == 2);
		assert(statistics.directories_created == 0);
		assert(file_content_equals(right / "open.txt", "open"));
		assert(fs::is_empty(locked));

		result = synchronize(default_arguments().set_error_policy(ErrorPolicy::fail_fast).build());
		assert(result == EXIT_CODE_FILESYSTEM_ERROR);
		assert(statistics.entries_failed == 1);
	}

	void cleanup() override {
		std::error_code ec;
		fs::permissions(locked, fs::perms::owner_all, fs::perm_options::replace, ec);
		Test::cleanup();
	}
};

class WildcardTest final : public Test {
	public:
	void prepare() override {}
	void perform() override {}

	void assert_validity() override {
		assert(wildcard_matches("*.tmp", "download.tmp"));
		assert(wildcard_matches("*.tmp", ".tmp"));
		assert(!wildcard_matches("*.tmp", "download.tmp.mp4"));
		assert(wildcard_matches("images", "images"));
		assert(!wildcard_matches("images", "Images"));
		assert(wildcard_matches("ep-*-*.mkv", "ep-01-final.mkv"));
		assert(!wildcard_matches("ep-*-*.mkv", "ep-01.mkv"));
		assert(wildcard_matches("*", ""));
		assert(wildcard_matches("a**b", "ab"));
		assert(!wildcard_matches("", "a"));
	}

	void cleanup() override {}
};

class ArgumentParsingTest final : public Test {
	public:
	void prepare() override {}
	void perform() override {}

	void assert_validity() override {
		const std::optional<ProgramArguments> parsed = ProgramArguments::try_parse(
			{"gapsync", "--verbose", "--fail-fast", "--dry-run", "/media/a", "/media/b"}
		);
		assert(parsed.has_value());
		assert(parsed->get_mode() == ProgramMode::synchronize);
		assert(parsed->is_verbose());
		assert(parsed->is_dry_run());
		assert(parsed->is_fail_fast());
		assert(!parsed->should_copy_configurations());
		assert(parsed->get_left_path() == "/media/a");
		assert(parsed->get_right_path() == "/media/b");

		const std::optional<ProgramArguments> defaults = ProgramArguments::try_parse({"gapsync", "a", "b"});
		assert(defaults.has_value());
		assert(defaults->get_error_policy() == ErrorPolicy::skip);

		const std::optional<ProgramArguments> help = ProgramArguments::try_parse({"gapsync", "--help"});
		assert(help.has_value() && help->get_mode() == ProgramMode::help);

		assert(!ProgramArguments::try_parse({"gapsync"}).has_value());
		assert(!ProgramArguments::try_parse({"gapsync", "only-left"}).has_value());
		assert(!ProgramArguments::try_parse({"gapsync", "--bogus", "a", "b"}).has_value());

		const std::optional<ProgramArguments> dashed = ProgramArguments::try_parse({"gapsync", "--", "-left", "b"});
		assert(dashed.has_value() && dashed->get_left_path() == "-left");
	}

	void cleanup() override {}
};

void run_test(Test &test, const char *description) {
	std::cout << description << std::endl;
	test.prepare();
	test.perform();
	test.assert_validity();
	test.cleanup();
}

int run_tests() {
	int number = 0;
	auto next = [&number](const char *description) {
		return "Test " + std::to_string(++number) + ": " + description;
	};

	{
		MoviesScenarioTest test;
		run_test(test, next("both trees gain the other's unique files, shared files untouched").c_str());
	}
	{
		NestedDirectoryCreationTest test;
		run_test(test, next("intermediate directories are created").c_str());
	}
	{
		InvalidRootTest test;
		run_test(test, next("missing or non-directory roots fail before any mutation").c_str());
	}
	{
		OverlappingRootsTest test;
		run_test(test, next("nested roots are rejected, identical roots are a no-op").c_str());
	}
	{
		IdempotenceTest test;
		run_test(test, next("a second run copies nothing").c_str());
	}
	{
		MetadataPreservationTest test;
		run_test(test, next("copies keep modification time and permissions").c_str());
	}
	{
		DryRunTest test;
		run_test(test, next("dry run reports copies without mutating").c_str());
	}
	{
		ExclusionConfigurationTest test;
		run_test(test, next("directory configurations exclude entries").c_str());
	}
	{
		InvalidConfigurationTest test;
		run_test(test, next("broken root configurations fail before any mutation").c_str());
	}
	{
		UnsupportedEntryTest test;
		run_test(test, next("symbolic links are skipped").c_str());
	}
	{
		IncompatibleEntryTest test;
		run_test(test, next("file and directory clash follows the error policy").c_str());
	}
	{
		DestinationSymlinkTest test;
		run_test(test, next("destination symlinks are not followed").c_str());
	}
	{
		CopyConfigurationsTest test;
		run_test(test, next("configuration files are copied on request").c_str());
	}
	{
		NestedInvalidConfigurationTest test;
		run_test(test, next("a broken nested configuration aborts the run").c_str());
	}
	{
		CopyFailureTest test;
		run_test(test, next("copy failures follow the error policy").c_str());
	}
	{
		WildcardTest test;
		run_test(test, next("wildcard matching").c_str());
	}
	{
		ArgumentParsingTest test;
		run_test(test, next("command line parsing").c_str());
	}

	std::cout << "All " << number << " tests passed." << std::endl;
	return 0;
}
