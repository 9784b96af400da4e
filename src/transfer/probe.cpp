#include "transfer/probe.hpp"

#include <spdlog/spdlog.h>

#include "transfer/retry.hpp"

namespace rangedl::transfer {

namespace {

bool is_connection_error(const std::error_code &ec) {
	return ec == errc::connection_failed || ec == errc::timed_out ||
		   ec == errc::request_failed;
}

}  // namespace

Result<CapabilityResult> probe_capability(Transport &transport,
										  const TransferJob &job,
										  const TransferState &state,
										  asio::yield_context yield) {
	RangeRequest request;
	request.url = job.url;
	request.first = 0;
	request.timeout = job.timeout;

	for (unsigned attempt = 1;; ++attempt) {
		if (state.cancelled()) return outcome::failure(errc::cancelled);

		auto response = transport.async_open(request, yield);
		if (response.has_error()) {
			const auto &ec = response.error();
			if (!is_connection_error(ec)) {
				spdlog::error("Probe of {} failed: {}", job.url, ec.message());
				return outcome::failure(ec);
			}
			if (!job.retry.allows(attempt)) {
				spdlog::error("Probe of {} gave up after {} attempts: {}",
							  job.url, attempt, ec.message());
				return outcome::failure(errc::retries_exhausted);
			}
			spdlog::warn("Retry to connect due to connection problem: {}",
						 ec.message());
			async_sleep(job.retry.delay_before(attempt + 1), state, yield);
			continue;
		}

		// Only the head is needed; dropping the body closes the connection.
		const ResponseHead head = std::move(response.value().head);

		// "bytes=0-" is unsatisfiable for an empty resource; the server
		// answers 416 with "Content-Range: bytes */0"
		if (head.status_code == 416) {
			if (auto total = head.content_range_total()) {
				spdlog::debug("Probe: range not satisfiable, size={}", *total);
				return CapabilityResult{*total, false};
			}
		}

		if (!head.is_success()) {
			spdlog::error("Probe of {} returned HTTP {}", job.url,
						  head.status_code);
			return outcome::failure(errc::http_error);
		}

		CapabilityResult capability;
		capability.range_supported = head.is_partial();
		capability.total_size = head.content_length;
		if (!capability.total_size && head.is_partial()) {
			capability.total_size = head.content_range_total();
		}

		spdlog::debug("Probe: status={} size={} ranges={}", head.status_code,
					  capability.total_size ? *capability.total_size : -1,
					  capability.range_supported);
		return capability;
	}
}

}  // namespace rangedl::transfer
