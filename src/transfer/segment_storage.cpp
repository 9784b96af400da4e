#include "transfer/segment_storage.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace rangedl::transfer {

SegmentStorage::SegmentStorage(fs::path path) : path_(std::move(path)) {}

Result<void> SegmentStorage::append(const char *data, std::size_t size) {
	if (!out_.is_open()) {
		out_.open(path_, std::ios::binary | std::ios::out | std::ios::app);
		if (!out_.is_open()) {
			spdlog::error("Cannot open segment file {}", path_.string());
			return outcome::failure(errc::file_open_failed);
		}
	}

	out_.write(data, static_cast<std::streamsize>(size));
	out_.flush();
	if (!out_) {
		spdlog::error("Write to segment file {} failed", path_.string());
		out_.close();
		return outcome::failure(errc::file_write_failed);
	}
	return outcome::success();
}

Result<void> SegmentStorage::truncate() {
	out_.close();
	out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
	if (!out_.is_open()) {
		return outcome::failure(errc::file_open_failed);
	}
	return outcome::success();
}

void SegmentStorage::close() {
	if (out_.is_open()) out_.close();
}

fs::path SegmentStorage::path_for(const fs::path &destination,
								  std::size_t index) {
	fs::path p = destination;
	p += "." + std::to_string(index) + ".tmp";
	return p;
}

}  // namespace rangedl::transfer
