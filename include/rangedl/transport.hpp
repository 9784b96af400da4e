#pragma once

#include <rangedl/rangedl_export.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <rangedl/result.hpp>
#include <string>
#include <string_view>

namespace rangedl {

namespace asio = boost::asio;

struct RANGEDL_EXPORT RangeRequest {
	std::string url;
	long long first = 0;
	std::optional<long long> last;	// nullopt = to end of resource
	std::chrono::milliseconds timeout{5000};

	// Value of the Range header, e.g. "bytes=0-" or "bytes=10-19"
	[[nodiscard]] std::string header_value() const;
};

struct RANGEDL_EXPORT ResponseHead {
	int status_code = 0;
	std::optional<long long> content_length;
	std::map<std::string, std::string> headers;

	[[nodiscard]] bool is_partial() const { return status_code == 206; }
	[[nodiscard]] bool is_success() const {
		return status_code >= 200 && status_code < 300;
	}
	// Case-insensitive header lookup
	[[nodiscard]] std::optional<std::string> header(std::string_view name) const;
	// Total size from "Content-Range: bytes a-b/total", if present
	[[nodiscard]] std::optional<long long> content_range_total() const;
};

// Body of an open response. Reads suspend the calling coroutine.
class RANGEDL_EXPORT BodyStream {
   public:
	virtual ~BodyStream() = default;

	// Reads up to buffer.size() bytes. Returns 0 once the body is complete.
	virtual Result<std::size_t> async_read_some(asio::mutable_buffer buffer,
												asio::yield_context yield) = 0;
};

struct RANGEDL_EXPORT RangeResponse {
	ResponseHead head;
	std::unique_ptr<BodyStream> body;
};

// The request/response surface the transfer core depends on. async_open is
// called concurrently from every segment worker.
class RANGEDL_EXPORT Transport {
   public:
	virtual ~Transport() = default;

	virtual Result<RangeResponse> async_open(const RangeRequest &request,
											 asio::yield_context yield) = 0;
};

}  // namespace rangedl
