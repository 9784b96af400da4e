#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <rangedl/result.hpp>

namespace rangedl::transfer {

namespace fs = std::filesystem;

// Append-only temporary file holding the bytes of one segment. The file is
// created on the first append, so an untouched segment leaves nothing on
// disk.
class SegmentStorage {
   public:
	explicit SegmentStorage(fs::path path);

	SegmentStorage(const SegmentStorage &) = delete;
	SegmentStorage &operator=(const SegmentStorage &) = delete;

	// Writes and flushes `size` bytes at the end of the file.
	Result<void> append(const char *data, std::size_t size);

	// Drops everything written so far.
	Result<void> truncate();

	void close();

	[[nodiscard]] const fs::path &path() const { return path_; }

	// "<destination>.<index>.tmp"
	static fs::path path_for(const fs::path &destination, std::size_t index);

   private:
	fs::path path_;
	std::ofstream out_;
};

}  // namespace rangedl::transfer
