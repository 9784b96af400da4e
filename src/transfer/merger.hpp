#pragma once

#include <filesystem>
#include <rangedl/result.hpp>
#include <rangedl/types.hpp>
#include <vector>

namespace rangedl::transfer {

// Builds the final artifact at `destination` from the segment storages of
// `segments` and deletes them. A multi-segment session is concatenated in
// index order; a single segment is renamed into place. Returns the size of
// the artifact.
Result<long long> merge_segments(const std::filesystem::path &destination,
								 const std::vector<SegmentDescriptor> &segments,
								 bool multi_segment);

// Removes whatever segment storage an aborted session left behind.
void discard_segments(const std::filesystem::path &destination,
					  const std::vector<SegmentDescriptor> &segments);

}  // namespace rangedl::transfer
