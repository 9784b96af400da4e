#include "transfer/segment_worker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/strand.hpp>
#include <boost/scope_exit.hpp>
#include <utility>

#include "transfer/retry.hpp"
#include "transfer/segment_storage.hpp"
#include "transfer/spawn.hpp"

namespace rangedl::transfer {

namespace {

// Position of a worker inside its segment. `next` is the first byte not yet
// on disk; `counted_until` is how far the aggregate counter has been
// credited, which only moves forward even when the segment restarts at 0.
struct SegmentCursor {
	long long next = 0;
	long long counted_until = 0;
};

// A local file that cannot be written may hold a partial chunk, so the
// segment is not resumed from it.
bool is_storage_error(const std::error_code &ec) {
	return ec == errc::file_open_failed || ec == errc::file_write_failed;
}

void emit(const SegmentOptions &options, const SegmentDescriptor &segment,
		  SegmentEventKind kind, unsigned attempt, std::error_code error,
		  long long delivered) {
	if (!options.on_event) return;
	options.on_event(
		SegmentEvent{segment.index, kind, attempt, error, delivered});
}

// Checks the response head against what is left of the segment. A plain
// 200 is only usable by a segment that starts at byte 0, which then starts
// over.
Result<void> accept_response(const SegmentDescriptor &segment,
							 const ResponseHead &head, SegmentStorage &storage,
							 SegmentCursor &cursor) {
	if (head.is_partial()) {
		if (!segment.last) return outcome::success();
		const long long expected = *segment.last - cursor.next + 1;
		if (!head.content_length || *head.content_length != expected) {
			spdlog::debug("Part {}: expected {} bytes, server declared {}",
						  segment.index + 1, expected,
						  head.content_length ? *head.content_length : -1);
			return outcome::failure(errc::range_mismatch);
		}
		return outcome::success();
	}

	if (!head.is_success()) {
		spdlog::debug(
			"Part {}: unexpected HTTP {}", segment.index + 1, head.status_code);
		return outcome::failure(errc::http_error);
	}

	// Server ignored the Range header and sends the whole resource
	if (segment.first != 0) return outcome::failure(errc::range_mismatch);
	if (segment.last &&
		(!head.content_length || *head.content_length != *segment.last + 1)) {
		return outcome::failure(errc::range_mismatch);
	}
	if (cursor.next != 0) {
		spdlog::debug("Part {}: range ignored, restarting from byte 0",
					  segment.index + 1);
		auto truncated = storage.truncate();
		if (truncated.has_error()) return truncated;
		cursor.next = 0;
	}
	return outcome::success();
}

Result<void> run_attempt(const SegmentDescriptor &segment,
						 const SegmentOptions &options, Transport &transport,
						 TransferState &state, SegmentStorage &storage,
						 SegmentCursor &cursor, std::vector<char> &buffer,
						 asio::yield_context yield) {
	RangeRequest request;
	request.url = options.url;
	request.first = cursor.next;
	request.last = segment.last;
	request.timeout = options.timeout;

	auto opened = transport.async_open(request, yield);
	if (opened.has_error()) return outcome::failure(opened.error());
	RangeResponse &response = opened.value();

	auto accepted = accept_response(segment, response.head, storage, cursor);
	if (accepted.has_error()) return accepted;

	for (;;) {
		if (segment.last && cursor.next > *segment.last) break;
		if (state.cancelled()) return outcome::failure(errc::cancelled);

		auto read = response.body->async_read_some(
			asio::buffer(buffer.data(), buffer.size()), yield);
		if (read.has_error()) return outcome::failure(read.error());

		auto size = static_cast<long long>(read.value());
		if (size == 0) {
			// Open-ended segments finish at the end of the body
			if (!segment.last) break;
			spdlog::debug("Part {}: body ended at byte {}", segment.index + 1,
						  cursor.next);
			return outcome::failure(errc::request_failed);
		}
		if (segment.last) size = std::min(size, *segment.last - cursor.next + 1);

		auto written =
			storage.append(buffer.data(), static_cast<std::size_t>(size));
		if (written.has_error()) return written;

		cursor.next += size;
		if (cursor.next > cursor.counted_until) {
			state.add_downloaded(cursor.next - cursor.counted_until);
			cursor.counted_until = cursor.next;
		}
	}
	return outcome::success();
}

}  // namespace

SegmentOutcome run_segment(const SegmentDescriptor &segment,
						   const SegmentOptions &options, Transport &transport,
						   TransferState &state, asio::yield_context yield) {
	SegmentOutcome result;
	result.index = segment.index;

	// Leftover from an earlier session would be appended to, or merged in
	// place of an empty segment
	std::error_code stale;
	std::filesystem::remove(options.storage_path, stale);

	if (segment.empty()) {
		emit(options, segment, SegmentEventKind::completed, 0, {}, 0);
		return result;
	}

	SegmentStorage storage(options.storage_path);
	SegmentCursor cursor{segment.first, segment.first};
	std::vector<char> buffer(std::max<std::size_t>(options.buffer_size, 1));

	for (unsigned attempt = 1;; ++attempt) {
		if (state.cancelled()) {
			result.error = make_error_code(errc::cancelled);
			break;
		}
		result.attempts = attempt;

		auto res = run_attempt(segment, options, transport, state, storage,
							   cursor, buffer, yield);
		const long long delivered = cursor.next - segment.first;
		if (res) {
			spdlog::debug("Part {} complete after {} attempt(s)",
						  segment.index + 1, attempt);
			emit(options, segment, SegmentEventKind::completed, attempt, {},
				 delivered);
			break;
		}
		if (res.error() == errc::cancelled) {
			result.error = res.error();
			break;
		}
		if (is_storage_error(res.error())) {
			spdlog::error("Part {} cannot be stored: {}", segment.index + 1,
						  res.error().message());
			result.error = res.error();
			emit(options, segment, SegmentEventKind::gave_up, attempt,
				 res.error(), delivered);
			state.cancel();
			break;
		}

		spdlog::debug("Part {} attempt {} failed: {}", segment.index + 1,
					  attempt, res.error().message());
		emit(options, segment, SegmentEventKind::attempt_failed, attempt,
			 res.error(), delivered);

		if (!options.retry.allows(attempt)) {
			spdlog::error("Part {} failed after {} attempts: {}",
						  segment.index + 1, attempt, res.error().message());
			result.error = make_error_code(errc::retries_exhausted);
			emit(options, segment, SegmentEventKind::gave_up, attempt,
				 res.error(), delivered);
			// The session cannot succeed without this part
			state.cancel();
			break;
		}
		async_sleep(options.retry.delay_before(attempt + 1), state, yield);
	}

	storage.close();
	result.delivered_bytes = cursor.next - segment.first;
	return result;
}

void spawn_segment_worker(
	const asio::any_io_executor &ex, SegmentDescriptor segment,
	SegmentOptions options, std::shared_ptr<Transport> transport,
	std::shared_ptr<TransferState> state,
	std::shared_ptr<std::vector<SegmentOutcome>> outcomes) {
	state->worker_started();
	asio::spawn(
		asio::make_strand(ex),
		[segment, options = std::move(options), transport = std::move(transport),
		 state, outcomes = std::move(outcomes)](asio::yield_context yield) {
			// Runs after the outcome is stored and the storage is closed
			BOOST_SCOPE_EXIT_ALL(&state) { state->worker_finished(); };

			SegmentOutcome &slot = (*outcomes)[segment.index];
			try {
				slot = run_segment(segment, options, *transport, *state, yield);
			} catch (const std::exception &e) {
				spdlog::error("Part {} aborted: {}", segment.index + 1, e.what());
				slot.index = segment.index;
				slot.error = make_error_code(errc::unknown);
				state->cancel();
			}
		},
		log_exceptions("segment worker"));
}

}  // namespace rangedl::transfer
