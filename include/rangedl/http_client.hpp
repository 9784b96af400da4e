#pragma once

#include <rangedl/rangedl_export.h>

#include <boost/asio/spawn.hpp>
#include <memory>
#include <rangedl/result.hpp>
#include <rangedl/transport.hpp>
#include <string>

namespace rangedl::net {

namespace asio = boost::asio;

// HTTP/1.1 client over Boost.Beast for http:// and https:// URLs. Every
// call opens its own connection on the calling coroutine's executor, so one
// instance can serve all segment workers at once.
class RANGEDL_EXPORT HttpClient : public Transport {
   public:
	struct Options {
		int max_redirects = 5;
		std::string user_agent = "rangedl/1.0";
	};

	HttpClient();
	explicit HttpClient(Options options);

	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	HttpClient(HttpClient &&) noexcept;
	HttpClient &operator=(HttpClient &&) noexcept;
	~HttpClient() override;

	// GET with a Range header. Redirects are followed; the returned head
	// belongs to the final response and its body is left unread.
	Result<RangeResponse> async_open(const RangeRequest &request,
									 asio::yield_context yield) override;

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace rangedl::net
