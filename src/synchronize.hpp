#ifndef GAPSYNC_SYNCHRONIZE_HPP
#define GAPSYNC_SYNCHRONIZE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "arguments.hpp"
#include "configuration/configuration.hpp"

namespace fs = std::filesystem;
using OptionalConfiguration = std::optional<DirectoryConfiguration>;

/** Counters of one synchronization run, shared by both sweeps. */
struct SyncStatistics {
	std::size_t files_copied = 0;
	std::size_t directories_created = 0;
	/** Destination already had an entry at the same relative path. */
	std::size_t files_existing = 0;
	std::size_t entries_excluded = 0;
	/** Symbolic links, sockets, devices, FIFOs. */
	std::size_t entries_unsupported = 0;
	std::size_t entries_failed = 0;

	std::size_t skipped() const {
		return files_existing + entries_excluded + entries_unsupported;
	}
};

std::ostream &operator<<(std::ostream &stream, const SyncStatistics &statistics);

int verify_directory(const fs::path &path);
bool is_nested_within(const fs::path &parent, const fs::path &child);

int synchronize_directories(const ProgramArguments &arguments, SyncStatistics &statistics);
int synchronize_directories(const ProgramArguments &arguments);

/** An abstract base class for synchronization contexts.
 * Descendants may include synchronizer-specific information. */
class Context {
	public:
	const ProgramArguments &arguments;
	SyncStatistics &statistics;

	protected:
	Context(const ProgramArguments &args, SyncStatistics &stats)
		: arguments(args), statistics(stats) {}

	public:
	virtual ~Context() = 0;
};

inline Context::~Context() {}

/** An abstract base class for synchronization contexts using two directories.
 * Stores the recursive directory configurations in pairs of corresponding objects. */
class BinaryContext : public Context {
	public:
	using ConfigurationPair = std::pair<OptionalConfiguration, OptionalConfiguration>;

	protected:
	std::vector<ConfigurationPair> configuration_stack;
	std::pair<fs::path, fs::path> root_paths;

	BinaryContext(
		const ProgramArguments &args,
		SyncStatistics &stats,
		const fs::path &first,
		const fs::path &second
	) : Context(args, stats), root_paths(first, second) {}

	public:
	/** For both directory paths, tries to read the local configurations. */
	int load_configuration_pair(const fs::path &path_first, const fs::path &path_second) {
		ConfigurationPair pair;

		int error = get_directory_configuration(path_first, arguments, pair.first);
		if (error) return error;
		error = get_directory_configuration(path_second, arguments, pair.second);
		if (error) return error;

		configuration_stack.push_back(std::move(pair));
		return 0;
	}

	/** Discards the leaf configuration in the current configuration stack. */
	void pop_configuration_pair() {
		configuration_stack.pop_back();
	}
};

/** An abstract base class for a synchronizer. Descendants encapsulate
 * usage-specific helper functions. */
class Synchronizer {
	public:
	/** Starts the synchronization process, where the implementation is given
	 * by Synchronizer class descendants.
	 * @return A program-wide error code. If none occurs, defaults to zero. */
	virtual int synchronize() = 0;

	virtual ~Synchronizer() = default;
};

#endif // GAPSYNC_SYNCHRONIZE_HPP
