#include "transfer/merger.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

#include "transfer/segment_storage.hpp"

namespace rangedl::transfer {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMergeBufferSize = 256 * 1024;

// A missing storage file is only fine for a segment that had no bytes.
bool storage_may_be_absent(const SegmentDescriptor &segment) {
	auto length = segment.length();
	return !length || *length == 0;
}

Result<void> append_file(std::ofstream &out, const fs::path &path,
						 std::vector<char> &buffer) {
	std::ifstream in(path, std::ios::binary);
	if (!in.is_open()) {
		spdlog::error("Cannot open segment file {}", path.string());
		return outcome::failure(errc::file_open_failed);
	}

	while (in) {
		in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		auto got = in.gcount();
		if (got > 0) {
			out.write(buffer.data(), got);
			if (!out) return outcome::failure(errc::file_write_failed);
		}
	}
	if (in.bad()) {
		spdlog::error("Read of segment file {} failed", path.string());
		return outcome::failure(errc::file_read_failed);
	}
	return outcome::success();
}

Result<long long> concatenate(const fs::path &destination,
							  const std::vector<SegmentDescriptor> &segments) {
	std::ofstream out(destination, std::ios::binary | std::ios::trunc);
	if (!out.is_open()) {
		spdlog::error("Cannot create {}", destination.string());
		return outcome::failure(errc::file_open_failed);
	}

	std::vector<char> buffer(kMergeBufferSize);
	for (const auto &segment : segments) {
		const auto path = SegmentStorage::path_for(destination, segment.index);

		std::error_code ec;
		if (!fs::exists(path, ec)) {
			if (storage_may_be_absent(segment)) continue;
			spdlog::error("Segment file {} is missing", path.string());
			return outcome::failure(errc::file_read_failed);
		}

		auto appended = append_file(out, path, buffer);
		if (appended.has_error()) return outcome::failure(appended.error());

		fs::remove(path, ec);
		if (ec) {
			spdlog::error(
				"Cannot remove {}: {}", path.string(), ec.message());
			return outcome::failure(errc::file_remove_failed);
		}
	}

	out.close();
	if (!out) return outcome::failure(errc::file_write_failed);

	std::error_code ec;
	auto size = fs::file_size(destination, ec);
	if (ec) return outcome::failure(errc::file_read_failed);
	return static_cast<long long>(size);
}

Result<long long> move_into_place(const fs::path &destination,
								  const SegmentDescriptor &segment) {
	const auto path = SegmentStorage::path_for(destination, segment.index);

	std::error_code ec;
	if (!fs::exists(path, ec)) {
		if (!storage_may_be_absent(segment)) {
			spdlog::error("Segment file {} is missing", path.string());
			return outcome::failure(errc::file_read_failed);
		}
		// Empty resource: nothing was ever written
		std::ofstream out(destination, std::ios::binary | std::ios::trunc);
		if (!out.is_open()) return outcome::failure(errc::file_open_failed);
		return 0LL;
	}

	fs::rename(path, destination, ec);
	if (ec) {
		spdlog::error("Cannot move {} to {}: {}", path.string(),
					  destination.string(), ec.message());
		return outcome::failure(errc::file_rename_failed);
	}

	auto size = fs::file_size(destination, ec);
	if (ec) return outcome::failure(errc::file_read_failed);
	return static_cast<long long>(size);
}

}  // namespace

Result<long long> merge_segments(const fs::path &destination,
								 const std::vector<SegmentDescriptor> &segments,
								 bool multi_segment) {
	if (segments.empty()) return outcome::failure(errc::segment_failed);

	if (multi_segment) {
		auto merged = concatenate(destination, segments);
		if (merged) spdlog::info("* Temp file merged.");
		return merged;
	}
	return move_into_place(destination, segments.front());
}

void discard_segments(const fs::path &destination,
					  const std::vector<SegmentDescriptor> &segments) {
	for (const auto &segment : segments) {
		const auto path = SegmentStorage::path_for(destination, segment.index);
		std::error_code ec;
		if (fs::remove(path, ec)) {
			spdlog::debug("Removed {}", path.string());
		} else if (ec) {
			spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
		}
	}
}

}  // namespace rangedl::transfer
