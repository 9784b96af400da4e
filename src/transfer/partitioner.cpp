#include "transfer/partitioner.hpp"

#include <algorithm>

namespace rangedl::transfer {

std::vector<SegmentDescriptor> partition(long long total_size,
										 std::size_t workers) {
	workers = std::max<std::size_t>(workers, 1);
	total_size = std::max<long long>(total_size, 0);

	const long long count = static_cast<long long>(workers);
	const long long block = total_size / count;

	std::vector<SegmentDescriptor> segments;
	segments.reserve(workers);
	for (std::size_t i = 0; i < workers; ++i) {
		const long long first = block * static_cast<long long>(i);
		const long long last =
			(i + 1 == workers) ? total_size - 1 : first + block - 1;
		segments.push_back(SegmentDescriptor{i, first, last});
	}
	return segments;
}

bool use_multiple_segments(const CapabilityResult &capability,
						   std::size_t workers, long long min_split_size) {
	if (!capability.range_supported || workers <= 1) return false;
	if (!capability.total_size) return false;
	return *capability.total_size >= min_split_size;
}

std::vector<SegmentDescriptor> plan_segments(
	const CapabilityResult &capability, std::size_t workers,
	long long min_split_size) {
	if (use_multiple_segments(capability, workers, min_split_size)) {
		return partition(*capability.total_size, workers);
	}

	SegmentDescriptor whole{0, 0, std::nullopt};
	if (capability.total_size) whole.last = *capability.total_size - 1;
	return {whole};
}

}  // namespace rangedl::transfer
