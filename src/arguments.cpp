#include "arguments.hpp"

#include <iostream>

constexpr const char *USAGE = "Usage: gapsync [OPTIONS] <left-directory> <right-directory>";

std::optional<ProgramArguments> ProgramArguments::try_parse(const std::vector<std::string> &arguments) {
	ProgramArguments parsed;
	if (!parsed.try_parse_impl(arguments))
		return std::nullopt;
	return parsed;
}

bool ProgramArguments::try_parse_impl(const std::vector<std::string> &arguments) {
	if (arguments.size() < 2) {
		std::cerr << "Error: Too few arguments." << std::endl;
		std::cerr << USAGE << std::endl;
		return false;
	}

	auto arg_iter = arguments.begin();
	executable = *(arg_iter++);
	for (; arg_iter != arguments.end(); ++arg_iter) {
		const std::string &argument = *arg_iter;

		const bool is_flag = argument.size() > 1 && argument.starts_with('-');
		if (!is_flag)
			break;

		if (argument == "--") {
			// everything after is positional, even when starting with a dash
			++arg_iter;
			break;
		}

		if (argument == "-h" || argument == "--help") {
			mode = ProgramMode::help;
		} else if (argument == "--version") {
			mode = ProgramMode::version;
		} else if (argument == "--test") {
			mode = ProgramMode::test;
		} else if (argument == "--verbose") {
			verbose = true;
		} else if (argument == "--dry-run") {
			dry_run = true;
		} else if (argument == "--fail-fast") {
			error_policy = ErrorPolicy::fail_fast;
		} else if (argument == "--copy-configs" || argument == "--copy-configurations") {
			copy_configurations = true;
		} else {
			std::cerr << "Error: Unknown option " << argument << std::endl;
			std::cerr << USAGE << std::endl;
			return false;
		}
	}

	if (mode != ProgramMode::synchronize) {
		if (arg_iter != arguments.end())
			std::cerr << "Warning: ignoring specified positional arguments." << std::endl;
		return true;
	}

	if (arg_iter == arguments.end()) {
		std::cerr << "Error: left directory unspecified." << std::endl;
		std::cerr << USAGE << std::endl;
		return false;
	}
	left_directory = *(arg_iter++);
	if (arg_iter == arguments.end()) {
		std::cerr << "Error: right directory unspecified." << std::endl;
		std::cerr << USAGE << std::endl;
		return false;
	}
	right_directory = *(arg_iter++);

	if (arg_iter != arguments.end()) {
		std::cerr << "Warning: Extra parameters ignored." << std::endl;
	}
	return true;
}

const char *flag_to_string(const bool enabled) {
	return enabled ? "enabled" : "disabled";
}

const char *string_or_empty(const std::string &str) {
	if (str.empty())
		return "(empty)";
	return str.c_str();
}

void ProgramArguments::print(std::ostream &stream) const {
	stream << "Executable: " << string_or_empty(executable) << std::endl;
	stream << "Flags: " << std::endl;
	stream << "    verbose: " << flag_to_string(verbose) << std::endl;
	stream << "    dry run: " << flag_to_string(dry_run) << std::endl;
	stream << "    fail fast: " << flag_to_string(is_fail_fast()) << std::endl;
	stream << "    copy configurations: " << flag_to_string(copy_configurations) << std::endl;
	stream << "Left dir: " << string_or_empty(left_directory) << std::endl;
	stream << "Right dir: " << string_or_empty(right_directory) << std::endl;
}
