#include "synchronize_one_way.hpp"

#include <filesystem>
#include <iostream>
#include <ranges>
#include <string>
#include <system_error>

#include "synchronize.hpp"
#include "configuration/configuration.hpp"

namespace fs = std::filesystem;

bool MonodirectionalContext::source_allows_to_copy(const fs::directory_entry &entry) const {
	for (const auto &[source, _] : std::ranges::reverse_view(configuration_stack)) {
		if (!source.has_value()) continue;
		if (!source->allows(entry)) return false;
	}
	return true;
}

bool MonodirectionalContext::target_accepts(const fs::directory_entry &entry) const {
	for (const auto &[_, target] : std::ranges::reverse_view(configuration_stack)) {
		if (!target.has_value()) continue;
		if (!target->accepts(entry)) return false;
	}
	return true;
}

int MonodirectionalSynchronizer::report_failure(const std::string &message, const int code) {
	std::cerr << "Error: " << message << std::endl;
	++context.statistics.entries_failed;
	return context.arguments.is_fail_fast() ? code : 0;
}

int MonodirectionalSynchronizer::report_failure(
	const std::string &message,
	const fs::path &path,
	const std::error_code &error
) {
	return report_failure(message + " " + path.string() + ": " + error.message());
}

int MonodirectionalSynchronizer::copy_missing_file(
	const fs::path &source_path,
	const fs::path &target_path
) {
	std::error_code err;

	// skip_existing makes the copy itself refuse to clobber a file
	// that appeared after the existence check
	const bool copied = fs::copy_file(source_path, target_path, fs::copy_options::skip_existing, err);
	if (err) return report_failure("Failed to copy", source_path, err);
	if (!copied) {
		++context.statistics.files_existing;
		return 0;
	}

	const fs::file_status source_status = fs::status(source_path, err);
	if (!err) fs::permissions(target_path, source_status.permissions(), fs::perm_options::replace, err);
	if (err) return report_failure("Failed to preserve the permissions of", target_path, err);

	const fs::file_time_type written_at = fs::last_write_time(source_path, err);
	if (!err) fs::last_write_time(target_path, written_at, err);
	if (err) return report_failure("Failed to preserve the modification time of", target_path, err);

	++context.statistics.files_copied;
	std::cout << "Copied: " << source_path.string() << " -> " << target_path.string() << "\n";
	return 0;
}

int MonodirectionalSynchronizer::synchronize_regular_file(
	const fs::directory_entry &source_file,
	const fs::path &target_path
) {
	std::error_code err;
	const fs::file_status target_status = fs::symlink_status(target_path, err);

	if (fs::exists(target_status)) {
		if (fs::is_directory(target_status))
			return report_failure(
				"Incompatible entry types: " + source_file.path().string()
					+ " is a file, " + target_path.string() + " is a directory",
				EXIT_CODE_INCOMPATIBLE_ENTRIES
			);

		// present on both sides: never diffed, never overwritten
		++context.statistics.files_existing;
		if (context.arguments.is_verbose())
			std::cout << "Skipped existing " << target_path.string() << "\n";
		return 0;
	}
	if (target_status.type() != fs::file_type::not_found)
		return report_failure("Failed to check file status of", target_path, err);

	if (context.arguments.is_dry_run()) {
		++context.statistics.files_copied;
		std::cout << "Would copy: " << source_file.path().string() << " -> " << target_path.string() << "\n";
		return 0;
	}

	return copy_missing_file(source_file.path(), target_path);
}

int MonodirectionalSynchronizer::synchronize_subdirectory(
	const fs::directory_entry &source_directory,
	const fs::path &target_path
) {
	std::error_code err;
	// a symlink in the destination is not descended into, it may lead out of the tree
	const fs::file_status target_status = fs::symlink_status(target_path, err);

	if (fs::exists(target_status)) {
		if (fs::is_symlink(target_status))
			return report_failure(
				"Incompatible entry types: " + source_directory.path().string()
					+ " is a directory, " + target_path.string() + " is a symbolic link",
				EXIT_CODE_INCOMPATIBLE_ENTRIES
			);
		if (!fs::is_directory(target_status))
			return report_failure(
				"Incompatible entry types: " + source_directory.path().string()
					+ " is a directory, " + target_path.string() + " is not",
				EXIT_CODE_INCOMPATIBLE_ENTRIES
			);
	} else if (target_status.type() != fs::file_type::not_found) {
		return report_failure("Failed to check file status of", target_path, err);
	} else {
		if (!context.arguments.is_dry_run()) {
			fs::create_directories(target_path, err);
			if (err) return report_failure("Failed to create directory", target_path, err);
		}

		++context.statistics.directories_created;
		if (context.arguments.is_verbose())
			std::cout << (context.arguments.is_dry_run() ? "Would create " : "Created ")
				<< target_path.string() << "\n";
	}

	return synchronize_directories_recursively(source_directory.path(), target_path);
}

int MonodirectionalSynchronizer::synchronize_directory_entry(
	const fs::directory_entry &source_entry,
	const fs::path &target_directory
) {
	std::error_code err;
	const fs::file_status status = source_entry.symlink_status(err);
	if (err) return report_failure("Failed to check file status of", source_entry.path(), err);

	// symbolic links are never followed, special files cannot be copied meaningfully
	if (!fs::is_directory(status) && !fs::is_regular_file(status)) {
		++context.statistics.entries_unsupported;
		std::cerr << "Warning: unsupported file type of " << source_entry.path() << ", skipped" << std::endl;
		return 0;
	}

	if (is_config_file(source_entry.path()) && !context.arguments.should_copy_configurations()) {
		++context.statistics.entries_excluded;
		if (context.arguments.is_verbose())
			std::cout << "Kept local configuration " << source_entry.path().string() << "\n";
		return 0;
	}

	if (!context.should_synchronize(source_entry)) {
		++context.statistics.entries_excluded;
		if (context.arguments.is_verbose())
			std::cout << "Excluded " << source_entry.path().string() << "\n";
		return 0;
	}

	const fs::path matching_target_path = target_directory / source_entry.path().filename();

	if (fs::is_directory(status))
		return synchronize_subdirectory(source_entry, matching_target_path);
	return synchronize_regular_file(source_entry, matching_target_path);
}

int MonodirectionalSynchronizer::synchronize_directories_recursively(
	const fs::path &source_directory,
	const fs::path &target_directory
) {
	int error = context.load_configuration_pair(source_directory, target_directory);
	if (error) return error;

	std::error_code err;
	fs::directory_iterator iterator(source_directory, err);
	if (err) {
		error = report_failure("Failed to list directory", source_directory, err);
		context.pop_configuration_pair();
		return error;
	}

	while (iterator != fs::directory_iterator()) {
		error = synchronize_directory_entry(*iterator, target_directory);
		if (error) break;

		iterator.increment(err);
		if (err) {
			error = report_failure("Failed to list directory", source_directory, err);
			break;
		}
	}

	context.pop_configuration_pair();
	return error;
}
