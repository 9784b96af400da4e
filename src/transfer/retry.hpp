#pragma once

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <rangedl/transfer_state.hpp>

namespace rangedl::transfer {

namespace asio = boost::asio;

// Suspends the coroutine for `delay`, waking early if the session is
// cancelled.
void async_sleep(std::chrono::milliseconds delay, const TransferState &state,
				 asio::yield_context yield);

}  // namespace rangedl::transfer
