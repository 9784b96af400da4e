#pragma once

#include <cstddef>
#include <rangedl/types.hpp>
#include <vector>

namespace rangedl::transfer {

// Splits [0, total_size - 1] into `workers` contiguous inclusive ranges of
// total_size / workers bytes each; the last range absorbs the remainder.
std::vector<SegmentDescriptor> partition(long long total_size,
										 std::size_t workers);

// Whether a session with this capability should be split at all.
bool use_multiple_segments(const CapabilityResult &capability,
						   std::size_t workers, long long min_split_size);

// The descriptors a session will run with: either partition() or a single
// segment covering the whole (possibly unknown-size) resource.
std::vector<SegmentDescriptor> plan_segments(
	const CapabilityResult &capability, std::size_t workers,
	long long min_split_size);

}  // namespace rangedl::transfer
