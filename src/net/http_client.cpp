#include <spdlog/spdlog.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <rangedl/http_client.hpp>
#include <unordered_map>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace rangedl::net {

// =============================================================================
// DNS CACHE
// =============================================================================
// Every segment worker connects to the same host, so resolving once per
// session instead of once per attempt saves a lookup per retry.
// =============================================================================

struct DnsCacheEntry {
	tcp::resolver::results_type results;
	std::chrono::steady_clock::time_point expires_at;
};

class DnsCache {
   public:
	static constexpr auto kDefaultTTL = std::chrono::minutes(5);
	static constexpr size_t kMaxCacheSize = 64;

	// Get cached results or nullopt if not found/expired
	std::optional<tcp::resolver::results_type> get(const std::string &host,
												   const std::string &port) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;
		auto it = cache_.find(key);
		if (it == cache_.end()) { return std::nullopt; }
		if (std::chrono::steady_clock::now() > it->second.expires_at) {
			cache_.erase(it);
			return std::nullopt;
		}
		return it->second.results;
	}

	void put(const std::string &host, const std::string &port,
			 const tcp::resolver::results_type &results,
			 std::chrono::steady_clock::duration ttl = kDefaultTTL) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;

		if (cache_.size() >= kMaxCacheSize) { evict_expired(); }

		// If still full, evict oldest entry
		if (cache_.size() >= kMaxCacheSize) {
			auto oldest = cache_.begin();
			for (auto it = cache_.begin(); it != cache_.end(); ++it) {
				if (it->second.expires_at < oldest->second.expires_at) {
					oldest = it;
				}
			}
			cache_.erase(oldest);
		}

		cache_[key] =
			DnsCacheEntry{results, std::chrono::steady_clock::now() + ttl};
		spdlog::debug("DNS cached {} ({} results)", key, results.size());
	}

	// Forget a host after a failed connect so the next attempt re-resolves
	void invalidate(const std::string &host, const std::string &port) {
		std::lock_guard lock(mutex_);
		cache_.erase(host + ":" + port);
	}

   private:
	void evict_expired() {
		auto now = std::chrono::steady_clock::now();
		for (auto it = cache_.begin(); it != cache_.end();) {
			if (now > it->second.expires_at) {
				it = cache_.erase(it);
			} else {
				++it;
			}
		}
	}

	std::mutex mutex_;
	std::unordered_map<std::string, DnsCacheEntry> cache_;
};

// Global DNS cache (shared across all HttpClient instances)
static DnsCache &get_dns_cache() {
	static DnsCache instance;
	return instance;
}

namespace {

struct Target {
	bool tls = false;
	std::string host;		  // for resolving, without IPv6 brackets
	std::string host_header;  // as written in the URL, with port
	std::string port;
	std::string path;
};

Result<Target> parse_target(std::string_view url_str) {
	auto u_res = boost::urls::parse_uri(url_str);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	Target t;
	if (u.scheme() == "https") {
		t.tls = true;
	} else if (u.scheme() != "http") {
		return outcome::failure(errc::invalid_url);
	}

	t.host = u.host_address();
	if (t.host.empty()) return outcome::failure(errc::invalid_url);
	auto host_and_port = u.encoded_host_and_port();
	t.host_header.assign(host_and_port.data(), host_and_port.size());
	t.port = u.port();
	if (t.port.empty()) t.port = t.tls ? "443" : "80";

	auto path = u.encoded_path();
	t.path.assign(path.data(), path.size());
	if (u.has_query()) {
		auto query = u.encoded_query();
		t.path += "?";
		t.path.append(query.data(), query.size());
	}
	if (t.path.empty()) t.path = "/";
	return t;
}

Result<std::string> resolve_location(std::string_view base,
									  std::string_view location) {
	auto base_res = boost::urls::parse_uri(base);
	auto ref_res = boost::urls::parse_uri_reference(location);
	if (base_res.has_error() || ref_res.has_error())
		return outcome::failure(errc::invalid_url);

	boost::urls::url dest;
	auto r = boost::urls::resolve(base_res.value(), ref_res.value(), dest);
	if (r.has_error()) return outcome::failure(errc::invalid_url);
	return std::string(dest.buffer().data(), dest.buffer().size());
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

std::error_code map_error(const beast::error_code &ec) {
	if (ec == beast::error::timeout) return make_error_code(errc::timed_out);
	if (ec == asio::error::connection_refused ||
		ec == asio::error::host_unreachable ||
		ec == asio::error::network_unreachable ||
		ec == asio::error::host_not_found ||
		ec == asio::error::host_not_found_try_again) {
		return make_error_code(errc::connection_failed);
	}
	return make_error_code(errc::request_failed);
}

// Response body read straight from the connection into the caller's buffer.
template <class Stream>
class BeastBodyStream final : public BodyStream {
   public:
	BeastBodyStream(
		std::unique_ptr<Stream> stream, beast::flat_buffer buffer,
		std::unique_ptr<http::response_parser<http::buffer_body>> parser,
		std::chrono::milliseconds timeout)
		: stream_(std::move(stream)),
		  buffer_(std::move(buffer)),
		  parser_(std::move(parser)),
		  timeout_(timeout) {}

	Result<std::size_t> async_read_some(asio::mutable_buffer out,
										asio::yield_context yield) override {
		while (!parser_->is_done()) {
			parser_->get().body().data = out.data();
			parser_->get().body().size = out.size();

			beast::get_lowest_layer(*stream_).expires_after(timeout_);
			beast::error_code ec;
			http::async_read_some(*stream_, buffer_, *parser_, yield[ec]);
			if (ec == http::error::need_buffer) ec = {};
			if (ec) return outcome::failure(map_error(ec));

			std::size_t n = out.size() - parser_->get().body().size;
			if (n > 0) return n;
		}
		return std::size_t{0};
	}

   private:
	std::unique_ptr<Stream> stream_;
	beast::flat_buffer buffer_;
	std::unique_ptr<http::response_parser<http::buffer_body>> parser_;
	std::chrono::milliseconds timeout_;
};

// Sends the request and reads the response head on an established stream.
template <class Stream>
Result<RangeResponse> exchange(std::unique_ptr<Stream> stream,
							   const Target &target,
							   const RangeRequest &request,
							   const std::string &user_agent,
							   asio::yield_context yield) {
	beast::error_code ec;

	http::request<http::empty_body> req{http::verb::get, target.path, 11};
	req.set(http::field::host, target.host_header);
	req.set(http::field::user_agent, user_agent);
	req.set(http::field::accept, "*/*");
	// Declared lengths must match the bytes that end up on disk
	req.set(http::field::accept_encoding, "identity");
	req.set(http::field::range, request.header_value());

	beast::get_lowest_layer(*stream).expires_after(request.timeout);
	http::async_write(*stream, req, yield[ec]);
	if (ec) return outcome::failure(map_error(ec));

	beast::flat_buffer buffer;
	auto parser = std::make_unique<http::response_parser<http::buffer_body>>();
	parser->body_limit(boost::none);

	beast::get_lowest_layer(*stream).expires_after(request.timeout);
	http::async_read_header(*stream, buffer, *parser, yield[ec]);
	if (ec) return outcome::failure(map_error(ec));

	ResponseHead head;
	head.status_code = static_cast<int>(parser->get().result_int());
	if (auto length = parser->content_length()) {
		head.content_length = static_cast<long long>(*length);
	}
	for (auto const &field : parser->get()) {
		head.headers[std::string(field.name_string())] =
			std::string(field.value());
	}

	RangeResponse response;
	response.head = std::move(head);
	response.body = std::make_unique<BeastBodyStream<Stream>>(
		std::move(stream), std::move(buffer), std::move(parser),
		request.timeout);
	return response;
}

}  // namespace

struct HttpClient::Impl {
	Options options;
	ssl::context ssl_ctx;

	explicit Impl(Options o)
		: options(std::move(o)), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	Result<tcp::resolver::results_type> resolve(const Target &target,
												asio::yield_context yield) {
		if (auto cached = get_dns_cache().get(target.host, target.port)) {
			return *cached;
		}

		beast::error_code ec;
		tcp::resolver resolver(yield.get_executor());
		auto results = resolver.async_resolve(target.host, target.port, yield[ec]);
		if (ec) {
			spdlog::debug("Resolve {} failed: {}", target.host, ec.message());
			return outcome::failure(errc::connection_failed);
		}
		get_dns_cache().put(target.host, target.port, results);
		return results;
	}

	Result<RangeResponse> open_once(const Target &target,
									const RangeRequest &request,
									asio::yield_context yield) {
		auto resolved = resolve(target, yield);
		if (resolved.has_error()) return outcome::failure(resolved.error());

		beast::error_code ec;
		if (!target.tls) {
			auto stream = std::make_unique<beast::tcp_stream>(yield.get_executor());
			stream->expires_after(request.timeout);
			stream->async_connect(resolved.value(), yield[ec]);
			if (ec) {
				get_dns_cache().invalidate(target.host, target.port);
				return outcome::failure(map_error(ec));
			}
			return exchange(std::move(stream), target, request,
							options.user_agent, yield);
		}

		auto stream = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
			yield.get_executor(), ssl_ctx);
		if (!SSL_set_tlsext_host_name(
				stream->native_handle(), target.host.c_str())) {
			return outcome::failure(errc::request_failed);
		}
		boost::certify::set_server_hostname(*stream, target.host);

		beast::get_lowest_layer(*stream).expires_after(request.timeout);
		beast::get_lowest_layer(*stream).async_connect(
			resolved.value(), yield[ec]);
		if (ec) {
			get_dns_cache().invalidate(target.host, target.port);
			return outcome::failure(map_error(ec));
		}

		beast::get_lowest_layer(*stream).expires_after(request.timeout);
		stream->async_handshake(ssl::stream_base::client, yield[ec]);
		if (ec) {
			spdlog::debug("TLS handshake with {} failed: {}", target.host,
						  ec.message());
			return outcome::failure(map_error(ec));
		}
		return exchange(std::move(stream), target, request, options.user_agent,
						yield);
	}
};

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options)
	: m_impl(std::make_unique<Impl>(std::move(options))) {}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient &&) noexcept = default;
HttpClient &HttpClient::operator=(HttpClient &&) noexcept = default;

Result<RangeResponse> HttpClient::async_open(const RangeRequest &request,
											 asio::yield_context yield) {
	std::string url = request.url;
	for (int hop = 0;; ++hop) {
		auto target = parse_target(url);
		if (target.has_error()) {
			spdlog::error("Invalid URL: {}", url);
			return outcome::failure(target.error());
		}

		auto opened = m_impl->open_once(target.value(), request, yield);
		if (opened.has_error()) return opened;

		const auto &head = opened.value().head;
		if (!is_redirect(head.status_code) ||
			hop >= m_impl->options.max_redirects) {
			return opened;
		}

		auto location = head.header("Location");
		if (!location) return opened;
		auto next = resolve_location(url, *location);
		if (next.has_error()) return outcome::failure(next.error());

		spdlog::debug("HTTP {} redirect to {}", head.status_code, next.value());
		url = std::move(next.value());
	}
}

}  // namespace rangedl::net
