#ifndef GAPSYNC_ARGUMENTS_HPP
#define GAPSYNC_ARGUMENTS_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

/** The program sub-command. */
enum class ProgramMode {
	help,
	version,
	synchronize,
	test
};

/** What happens when copying a single entry fails (permission denied,
 * disk full, source vanished, a directory in place of a file...). */
enum class ErrorPolicy {
	/** Report the entry, count it as failed and keep sweeping. */
	skip,
	/** Stop the whole run at the first failed entry. */
	fail_fast,
};

class ProgramArguments {
	std::string executable;
	ProgramMode mode = ProgramMode::synchronize;
	bool verbose = false;
	bool dry_run = false;

	bool copy_configurations = false;

	ErrorPolicy error_policy = ErrorPolicy::skip;

	std::string left_directory;
	std::string right_directory;

	public:
	// PUBLIC GETTERS:

	const std::string &get_executable() const { return executable; }
	ProgramMode get_mode() const { return mode; }
	bool is_verbose() const { return verbose; }
	bool is_dry_run() const { return dry_run; }

	bool should_copy_configurations() const { return copy_configurations; }

	ErrorPolicy get_error_policy() const { return error_policy; }
	bool is_fail_fast() const { return error_policy == ErrorPolicy::fail_fast; }

	const std::string &get_left_path() const { return left_directory; }
	const std::string &get_right_path() const { return right_directory; }

	void print(std::ostream &stream) const;

	/** Tries to parse the command line arguments, including the executable name.
	 * Reports problems to the standard error stream. */
	static std::optional<ProgramArguments> try_parse(
		const std::vector<std::string> &arguments
	);

	private:
	bool try_parse_impl(const std::vector<std::string> &arguments);

	friend class ProgramArgumentsBuilder;

	// private constructor disallows creating default instances
	// outside this class
	ProgramArguments() = default;
};

class ProgramArgumentsBuilder {
	ProgramArguments arguments;
	using Self = ProgramArgumentsBuilder;

	public:
	ProgramArgumentsBuilder() = default;
	explicit ProgramArgumentsBuilder(const ProgramArguments &base) : arguments(base) {}

	ProgramArguments build() const { return arguments; }

	Self &set_left_directory(const std::string &path) {
		arguments.left_directory = path;
		return *this;
	}
	Self &set_right_directory(const std::string &path) {
		arguments.right_directory = path;
		return *this;
	}
	Self &set_verbosity(bool v) {
		arguments.verbose = v;
		return *this;
	}
	Self &set_dry_run(bool d) {
		arguments.dry_run = d;
		return *this;
	}
	Self &set_error_policy(ErrorPolicy policy) {
		arguments.error_policy = policy;
		return *this;
	}
	Self &set_copy_configurations(bool c) {
		arguments.copy_configurations = c;
		return *this;
	}
};

#endif // GAPSYNC_ARGUMENTS_HPP
