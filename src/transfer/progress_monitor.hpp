#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <rangedl/transfer_state.hpp>
#include <rangedl/types.hpp>

namespace rangedl::transfer {

namespace asio = boost::asio;

struct MonitorOptions {
	std::chrono::milliseconds interval{1000};
	std::optional<long long> total_size;
	ProgressCallback on_progress;
};

// Builds one sample from two consecutive readings of the byte counter.
ProgressEvent make_progress_event(long long previous, long long current,
								  std::chrono::milliseconds elapsed,
								  std::optional<long long> total_size,
								  std::size_t active_workers);

// Samples `state` every interval and reports a ProgressEvent. Once no worker
// is active it fires the completion signal and returns.
void run_progress_monitor(const std::shared_ptr<TransferState> &state,
						  const MonitorOptions &options,
						  asio::yield_context yield);

void spawn_progress_monitor(const asio::any_io_executor &ex,
							std::shared_ptr<TransferState> state,
							MonitorOptions options);

}  // namespace rangedl::transfer
