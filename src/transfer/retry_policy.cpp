#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <cmath>
#include <rangedl/types.hpp>

#include "transfer/retry.hpp"

namespace rangedl {

std::chrono::milliseconds RetryPolicy::delay_before(unsigned attempt) const {
	if (attempt <= 1 || delay.count() <= 0) return std::chrono::milliseconds{0};

	double ms = static_cast<double>(delay.count()) *
				std::pow(std::max(backoff_multiplier, 1.0), attempt - 2);
	ms = std::min(ms, static_cast<double>(max_delay.count()));
	return std::chrono::milliseconds{static_cast<long long>(ms)};
}

}  // namespace rangedl

namespace rangedl::transfer {

void async_sleep(std::chrono::milliseconds delay, const TransferState &state,
				 asio::yield_context yield) {
	constexpr auto kSlice = std::chrono::milliseconds(100);

	asio::steady_timer timer(yield.get_executor());
	const auto deadline = std::chrono::steady_clock::now() + delay;
	while (!state.cancelled()) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) break;
		timer.expires_at(std::min(deadline, now + kSlice));
		boost::system::error_code ec;
		timer.async_wait(yield[ec]);
	}
}

}  // namespace rangedl::transfer
