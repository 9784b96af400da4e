#pragma once

#include <rangedl/rangedl_export.h>

#include <atomic>
#include <cstddef>
#include <future>

namespace rangedl {

// One-shot notification. The first fire() resolves the future; later calls
// are no-ops and return false.
class RANGEDL_EXPORT CompletionSignal {
   public:
	CompletionSignal();

	CompletionSignal(const CompletionSignal &) = delete;
	CompletionSignal &operator=(const CompletionSignal &) = delete;

	bool fire();
	[[nodiscard]] bool fired() const {
		return fired_.load(std::memory_order_acquire);
	}
	[[nodiscard]] std::shared_future<void> get_future() const {
		return future_;
	}

   private:
	std::atomic<bool> fired_{false};
	std::promise<void> promise_;
	std::shared_future<void> future_;
};

// State shared between the workers, the monitor and the orchestrator of a
// single session. Passed around as std::shared_ptr<TransferState>.
class RANGEDL_EXPORT TransferState {
   public:
	TransferState() = default;

	TransferState(const TransferState &) = delete;
	TransferState &operator=(const TransferState &) = delete;

	void add_downloaded(long long bytes) {
		downloaded_.fetch_add(bytes, std::memory_order_relaxed);
	}
	[[nodiscard]] long long downloaded() const {
		return downloaded_.load(std::memory_order_relaxed);
	}

	void worker_started() {
		active_workers_.fetch_add(1, std::memory_order_acq_rel);
	}
	// Returns the number of workers still active after this one.
	std::size_t worker_finished();
	[[nodiscard]] std::size_t active_workers() const {
		return active_workers_.load(std::memory_order_acquire);
	}

	void cancel() { cancelled_.store(true, std::memory_order_release); }
	[[nodiscard]] bool cancelled() const {
		return cancelled_.load(std::memory_order_acquire);
	}

	CompletionSignal &completion() { return completion_; }

   private:
	std::atomic<long long> downloaded_{0};
	std::atomic<std::size_t> active_workers_{0};
	std::atomic<bool> cancelled_{false};
	CompletionSignal completion_;
};

}  // namespace rangedl
