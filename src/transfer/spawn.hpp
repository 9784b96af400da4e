#pragma once

#include <spdlog/spdlog.h>

#include <exception>

namespace rangedl::transfer {

// Completion handler for asio::spawn that logs an escaped exception instead
// of letting it tear down a pool thread.
inline auto log_exceptions(const char *what) {
	return [what](std::exception_ptr e) {
		if (!e) return;
		try {
			std::rethrow_exception(e);
		} catch (const std::exception &ex) {
			spdlog::error("{} terminated: {}", what, ex.what());
		}
	};
}

}  // namespace rangedl::transfer
