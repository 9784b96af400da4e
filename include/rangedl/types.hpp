#pragma once

#include <rangedl/rangedl_export.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rangedl {

// Retry behaviour of a segment worker or the capability probe.
// The defaults retry forever without waiting, which means an unreachable
// server makes the session hang until it is cancelled.
struct RANGEDL_EXPORT RetryPolicy {
	std::optional<unsigned> max_attempts;  // nullopt = unlimited
	std::chrono::milliseconds delay{0};
	double backoff_multiplier = 1.0;
	std::chrono::milliseconds max_delay{30000};

	[[nodiscard]] bool allows(unsigned attempts_made) const {
		return !max_attempts || attempts_made < *max_attempts;
	}

	// Delay to wait before attempt number `attempt` (1-based, > 1)
	[[nodiscard]] std::chrono::milliseconds delay_before(unsigned attempt) const;
};

// Everything a session needs to know about what to fetch and how.
struct RANGEDL_EXPORT TransferJob {
	std::string url;
	std::string output_path;

	std::size_t workers = 5;							 // -n, --workers
	std::chrono::milliseconds timeout{5000};			 // -t, --timeout
	long long min_split_size = 2LL << 20;				 // --min-split-size
	std::chrono::milliseconds monitor_interval{1000};	 // --interval
	int max_redirects = 5;								 // --max-redirects
	RetryPolicy retry;
};

struct RANGEDL_EXPORT CapabilityResult {
	std::optional<long long> total_size;  // nullopt when not declared
	bool range_supported = false;
};

// Inclusive byte range owned by a single worker. `last` is nullopt for the
// open-ended segment used when the resource size is unknown.
struct RANGEDL_EXPORT SegmentDescriptor {
	std::size_t index = 0;
	long long first = 0;
	std::optional<long long> last;

	[[nodiscard]] bool empty() const { return last && *last < first; }
	[[nodiscard]] std::optional<long long> length() const {
		if (!last) return std::nullopt;
		return empty() ? 0 : *last - first + 1;
	}
};

struct RANGEDL_EXPORT ProgressEvent {
	long long bytes_per_sec = 0;
	long long downloaded_bytes = 0;
	std::optional<double> percentage;  // nullopt when total is unknown/zero
	std::size_t active_workers = 0;
	std::optional<long long> total_bytes;
};

enum class SegmentEventKind { attempt_failed, completed, gave_up };

struct RANGEDL_EXPORT SegmentEvent {
	std::size_t index = 0;
	SegmentEventKind kind = SegmentEventKind::completed;
	unsigned attempt = 0;
	std::error_code error;
	long long delivered_bytes = 0;
};

struct RANGEDL_EXPORT SegmentOutcome {
	std::size_t index = 0;
	long long delivered_bytes = 0;
	unsigned attempts = 0;
	std::error_code error;

	[[nodiscard]] bool ok() const { return !error; }
};

struct RANGEDL_EXPORT SessionReport {
	std::string url;
	std::string output_path;
	std::optional<long long> total_size;
	bool range_supported = false;
	bool multi_segment = false;
	std::size_t segment_count = 0;
	long long downloaded_bytes = 0;
	std::chrono::milliseconds elapsed{0};
	long long average_bytes_per_sec = 0;
	std::vector<SegmentOutcome> segments;
};

using ProgressCallback = std::function<void(const ProgressEvent &)>;
using SegmentCallback = std::function<void(const SegmentEvent &)>;

}  // namespace rangedl
