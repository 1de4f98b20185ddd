#ifndef GAPSYNC_SYNCHRONIZE_ONE_WAY_HPP
#define GAPSYNC_SYNCHRONIZE_ONE_WAY_HPP

#include <filesystem>
#include <string>
#include <system_error>

#include "synchronize.hpp"
#include "configuration/configuration.hpp"

namespace fs = std::filesystem;

/** The context of one sweep, holding the local directory configurations in a stack.
 * Contains both source and target configurations, see public getters. */
class MonodirectionalContext final : public BinaryContext {
	public:
	MonodirectionalContext(
		const ProgramArguments &args,
		SyncStatistics &stats,
		const fs::path &source_root,
		const fs::path &target_root
	) : BinaryContext(args, stats, source_root, target_root) {}

	const fs::path &get_source_root() const { return root_paths.first; }
	const fs::path &get_target_root() const { return root_paths.second; }

	bool should_synchronize(const fs::directory_entry &entry) const {
		return source_allows_to_copy(entry) && target_accepts(entry);
	}

	private:
	bool source_allows_to_copy(const fs::directory_entry &entry) const;
	bool target_accepts(const fs::directory_entry &entry) const;
};

/** One sweep: copies every file of the source tree that is missing at the same
 * relative path in the target tree. Existing target entries are never touched. */
class MonodirectionalSynchronizer final : public Synchronizer {
	MonodirectionalContext &context;

	public:
	explicit MonodirectionalSynchronizer(MonodirectionalContext &context)
		: context(context) {}

	int synchronize() override {
		return synchronize_directories_recursively(
			context.get_source_root(),
			context.get_target_root()
		);
	}

	private:
	int synchronize_directories_recursively(
		const fs::path &source_directory,
		const fs::path &target_directory
	);
	int synchronize_directory_entry(
		const fs::directory_entry &source_entry,
		const fs::path &target_directory
	);
	int synchronize_subdirectory(
		const fs::directory_entry &source_directory,
		const fs::path &target_path
	);
	int synchronize_regular_file(
		const fs::directory_entry &source_file,
		const fs::path &target_path
	);

	/** Copies content, permission bits and modification time. Refuses to overwrite. */
	int copy_missing_file(const fs::path &source_path, const fs::path &target_path);

	/** Counts the failed entry and, unless failing fast, lets the sweep continue.
	 * @return zero when the sweep may continue, `code` otherwise */
	int report_failure(const std::string &message, int code = EXIT_CODE_FILESYSTEM_ERROR);
	int report_failure(
		const std::string &message,
		const fs::path &path,
		const std::error_code &error
	);
};

#endif // GAPSYNC_SYNCHRONIZE_ONE_WAY_HPP
