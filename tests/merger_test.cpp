#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"
#include "transfer/merger.hpp"
#include "transfer/partitioner.hpp"
#include "transfer/segment_storage.hpp"

using namespace rangedl;
using namespace rangedl::transfer;
using rangedl::test::read_file;
using rangedl::test::TempDir;
using rangedl::test::write_file;

namespace {

// Writes the storage files a finished session would have left behind.
void write_segments(const fs::path &destination, const std::string &content,
					const std::vector<SegmentDescriptor> &segments) {
	for (const auto &s : segments) {
		if (s.empty()) continue;
		write_file(SegmentStorage::path_for(destination, s.index),
				   content.substr(s.first, *s.length()));
	}
}

}  // namespace

TEST_CASE("Multi-segment merge", "[merger]") {
	TempDir dir;
	const auto destination = dir / "out.bin";

	SECTION("Size divisible by the worker count") {
		const auto content = test::make_content(4000);
		auto segments = partition(4000, 4);
		write_segments(destination, content, segments);

		auto merged = merge_segments(destination, segments, true);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 4000);
		CHECK(read_file(destination) == content);
	}

	SECTION("Size smaller than one block") {
		const auto content = test::make_content(3);
		auto segments = partition(3, 5);
		write_segments(destination, content, segments);

		auto merged = merge_segments(destination, segments, true);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 3);
		CHECK(read_file(destination) == content);
	}

	SECTION("Empty resource") {
		auto segments = partition(0, 3);

		auto merged = merge_segments(destination, segments, true);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 0);
		CHECK(fs::exists(destination));
		CHECK(fs::file_size(destination) == 0);
	}

	SECTION("Existing file at the destination is replaced") {
		write_file(destination, std::string(10000, 'x'));
		const auto content = test::make_content(1001);
		auto segments = partition(1001, 3);
		write_segments(destination, content, segments);

		auto merged = merge_segments(destination, segments, true);
		REQUIRE(merged.has_value());
		CHECK(read_file(destination) == content);
	}

	// Only the artifact is left behind
	CHECK(dir.file_count() == 1);
}

TEST_CASE("Missing storage of a non-empty segment is an error", "[merger]") {
	TempDir dir;
	const auto destination = dir / "out.bin";
	const auto content = test::make_content(300);
	auto segments = partition(300, 3);
	write_segments(destination, content, segments);
	fs::remove(SegmentStorage::path_for(destination, 1));

	auto merged = merge_segments(destination, segments, true);
	REQUIRE(merged.has_error());
	CHECK(merged.error() == errc::file_read_failed);
}

TEST_CASE("Single-segment merge renames into place", "[merger]") {
	TempDir dir;
	const auto destination = dir / "out.bin";

	SECTION("Overwrites an existing file") {
		write_file(destination, "stale contents");
		const auto content = test::make_content(2048);
		SegmentDescriptor whole{0, 0, 2047};
		write_segments(destination, content, {whole});

		auto merged = merge_segments(destination, {whole}, false);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 2048);
		CHECK(read_file(destination) == content);
		CHECK_FALSE(fs::exists(SegmentStorage::path_for(destination, 0)));
	}

	SECTION("Unknown size") {
		write_file(SegmentStorage::path_for(destination, 0), "abc");
		SegmentDescriptor open_ended{0, 0, std::nullopt};

		auto merged = merge_segments(destination, {open_ended}, false);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 3);
	}

	SECTION("Empty resource creates an empty file") {
		SegmentDescriptor empty{0, 0, -1};

		auto merged = merge_segments(destination, {empty}, false);
		REQUIRE(merged.has_value());
		CHECK(merged.value() == 0);
		CHECK(fs::exists(destination));
	}

	CHECK(dir.file_count() == 1);
}

TEST_CASE("Discard removes every segment storage", "[merger]") {
	TempDir dir;
	const auto destination = dir / "out.bin";
	const auto content = test::make_content(900);
	auto segments = partition(900, 3);
	write_segments(destination, content, segments);
	REQUIRE(dir.file_count() == 3);

	discard_segments(destination, segments);
	CHECK(dir.file_count() == 0);

	// Nothing left to remove is fine
	discard_segments(destination, segments);
}
