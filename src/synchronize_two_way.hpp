#ifndef GAPSYNC_SYNCHRONIZE_TWO_WAY_HPP
#define GAPSYNC_SYNCHRONIZE_TWO_WAY_HPP

#include <filesystem>
#include <utility>

#include "synchronize.hpp"

namespace fs = std::filesystem;

class BidirectionalContext final : public Context {
	std::pair<fs::path, fs::path> root_paths;

	public:
	BidirectionalContext(
		const ProgramArguments &args,
		SyncStatistics &stats,
		const fs::path &left_root,
		const fs::path &right_root
	) : Context(args, stats), root_paths(left_root, right_root) {}

	const fs::path &get_root_left() const { return root_paths.first; }
	const fs::path &get_root_right() const { return root_paths.second; }
};

/** Fills the gaps of both trees: a left-to-right sweep followed by
 * a right-to-left sweep. Files present on both sides are left alone,
 * whatever their content. */
class BidirectionalSynchronizer final : public Synchronizer {
	BidirectionalContext &context;

	public:
	explicit BidirectionalSynchronizer(BidirectionalContext &context)
		: context(context) {}

	int synchronize() override;

	private:
	/** Runs one `MonodirectionalSynchronizer` sweep sharing this run's statistics. */
	int propagate(const fs::path &source_root, const fs::path &target_root) const;
};

#endif // GAPSYNC_SYNCHRONIZE_TWO_WAY_HPP
