#include <rangedl/transfer_state.hpp>
#include <spdlog/spdlog.h>

namespace rangedl {

CompletionSignal::CompletionSignal() : future_(promise_.get_future().share()) {}

bool CompletionSignal::fire() {
	bool expected = false;
	if (!fired_.compare_exchange_strong(
			expected, true, std::memory_order_acq_rel)) {
		return false;
	}
	promise_.set_value();
	return true;
}

std::size_t TransferState::worker_finished() {
	auto previous = active_workers_.fetch_sub(1, std::memory_order_acq_rel);
	if (previous == 0) {
		// Unbalanced call; restore and keep the counter at zero
		active_workers_.fetch_add(1, std::memory_order_acq_rel);
		spdlog::error("worker_finished() called with no active workers");
		return 0;
	}
	return previous - 1;
}

}  // namespace rangedl
