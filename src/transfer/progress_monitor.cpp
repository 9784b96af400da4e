#include "transfer/progress_monitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <utility>

#include "transfer/spawn.hpp"

namespace rangedl::transfer {

ProgressEvent make_progress_event(long long previous, long long current,
								  std::chrono::milliseconds elapsed,
								  std::optional<long long> total_size,
								  std::size_t active_workers) {
	ProgressEvent event;
	event.downloaded_bytes = current;
	event.active_workers = active_workers;
	event.total_bytes = total_size;

	const long long ms = std::max<long long>(elapsed.count(), 1);
	event.bytes_per_sec = (current - previous) * 1000 / ms;

	if (total_size && *total_size > 0) {
		event.percentage =
			static_cast<double>(current) / static_cast<double>(*total_size) *
			100.0;
	}
	return event;
}

void run_progress_monitor(const std::shared_ptr<TransferState> &state,
						  const MonitorOptions &options,
						  asio::yield_context yield) {
	asio::steady_timer timer(yield.get_executor());
	long long previous = state->downloaded();
	auto last_sample = std::chrono::steady_clock::now();

	for (;;) {
		timer.expires_after(options.interval);
		boost::system::error_code ec;
		timer.async_wait(yield[ec]);

		// Active count first: once it reads zero every worker's bytes are
		// visible in the counter.
		const std::size_t active = state->active_workers();
		const auto now = std::chrono::steady_clock::now();
		const long long current = state->downloaded();
		auto event = make_progress_event(
			previous, current,
			std::chrono::duration_cast<std::chrono::milliseconds>(
				now - last_sample),
			options.total_size, active);
		if (options.on_progress) options.on_progress(event);

		previous = current;
		last_sample = now;

		if (active == 0) {
			if (state->completion().fire()) {
				spdlog::debug("All segments finished, {} bytes", current);
			}
			return;
		}
	}
}

void spawn_progress_monitor(const asio::any_io_executor &ex,
							std::shared_ptr<TransferState> state,
							MonitorOptions options) {
	asio::spawn(
		asio::make_strand(ex),
		[state, options = std::move(options)](asio::yield_context yield) {
			run_progress_monitor(state, options, yield);
		},
		[state, report = log_exceptions("progress monitor")](
			std::exception_ptr e) {
			report(e);
			// Never leave the orchestrator waiting on a dead monitor
			if (e) {
				state->cancel();
				state->completion().fire();
			}
		});
}

}  // namespace rangedl::transfer
