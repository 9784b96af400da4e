#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <rangedl/transfer_state.hpp>
#include <rangedl/transport.hpp>
#include <rangedl/types.hpp>
#include <string>
#include <vector>

namespace rangedl::transfer {

struct SegmentOptions {
	std::string url;
	std::filesystem::path storage_path;
	std::chrono::milliseconds timeout{5000};
	RetryPolicy retry;
	std::size_t buffer_size = 64 * 1024;
	SegmentCallback on_event;  // invoked from the worker's thread
};

// Downloads one segment into its storage, retrying the undelivered suffix
// after every failed attempt until the whole range is on disk, the retry
// policy gives up, or the session is cancelled. Adds every written byte to
// state's aggregate counter; does not touch the active-worker count.
SegmentOutcome run_segment(const SegmentDescriptor &segment,
						   const SegmentOptions &options, Transport &transport,
						   TransferState &state, asio::yield_context yield);

// Registers one active worker on `state` and runs run_segment as a coroutine
// on its own strand of `ex`. The outcome is stored at
// (*outcomes)[segment.index] before the worker is reported finished.
void spawn_segment_worker(const asio::any_io_executor &ex,
						  SegmentDescriptor segment, SegmentOptions options,
						  std::shared_ptr<Transport> transport,
						  std::shared_ptr<TransferState> state,
						  std::shared_ptr<std::vector<SegmentOutcome>> outcomes);

}  // namespace rangedl::transfer
