#include "synchronize_two_way.hpp"

#include <filesystem>

#include "synchronize.hpp"
#include "synchronize_one_way.hpp"

int BidirectionalSynchronizer::propagate(
	const fs::path &source_root,
	const fs::path &target_root
) const {
	MonodirectionalContext one_way_context(
		context.arguments,
		context.statistics,
		source_root,
		target_root
	);
	MonodirectionalSynchronizer one_way_synchronizer(one_way_context);
	return one_way_synchronizer.synchronize();
}

int BidirectionalSynchronizer::synchronize() {
	// the second sweep sees the first sweep's copies as existing files and skips them
	const int error = propagate(context.get_root_left(), context.get_root_right());
	if (error) return error;

	return propagate(context.get_root_right(), context.get_root_left());
}
