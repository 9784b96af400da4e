#pragma once

#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <rangedl/result.hpp>
#include <rangedl/transport.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rangedl::test {

// Deterministic, non-repeating-looking content of `size` bytes.
inline std::string make_content(std::size_t size) {
	std::string data(size, '\0');
	std::uint32_t x = 2463534242u;
	for (auto &c : data) {
		x ^= x << 13;
		x ^= x >> 17;
		x ^= x << 5;
		c = static_cast<char>(x & 0xff);
	}
	return data;
}

enum class FaultKind {
	open_error,	   // async_open fails with `error`
	wrong_length,  // head declares one byte more than the range
	cut_body,	   // body ends cleanly after `after` bytes
	body_error,	   // body read fails with `error` after `after` bytes
};

struct Fault {
	FaultKind kind = FaultKind::open_error;
	std::error_code error = make_error_code(errc::connection_failed);
	long long after = 0;
};

// In-memory Transport serving one resource. Faults are queued per request
// start offset and consumed in order, so a retry of the same range sees the
// next one. With ranges honoured, a start at or past the end gets 416.
class FakeTransport : public Transport {
   public:
	explicit FakeTransport(std::string content, bool honor_ranges = true)
		: content_(std::move(content)), honor_ranges_(honor_ranges) {}

	void inject(long long first, Fault fault) {
		std::lock_guard lock(mutex_);
		faults_[first].push_back(fault);
	}

	void set_status(int status) { status_ = status; }
	void set_declare_length(bool declare) { declare_length_ = declare; }
	void set_chunk_size(std::size_t size) { chunk_size_ = size; }
	void set_chunk_delay(std::chrono::milliseconds delay) {
		chunk_delay_ = delay;
	}

	std::vector<RangeRequest> requests() const {
		std::lock_guard lock(mutex_);
		return requests_;
	}

	std::size_t open_count() const {
		std::lock_guard lock(mutex_);
		return requests_.size();
	}

	Result<RangeResponse> async_open(const RangeRequest &request,
									 asio::yield_context yield) override {
		std::optional<Fault> fault;
		{
			std::lock_guard lock(mutex_);
			requests_.push_back(request);
			auto it = faults_.find(request.first);
			if (it != faults_.end() && !it->second.empty()) {
				fault = it->second.front();
				it->second.pop_front();
			}
		}

		if (fault && fault->kind == FaultKind::open_error) {
			return outcome::failure(fault->error);
		}

		const auto size = static_cast<long long>(content_.size());
		RangeResponse response;
		response.head.status_code = status_;
		if (status_ >= 300) {
			response.body = std::make_unique<Body>("", chunk_size_,
												   chunk_delay_, std::nullopt);
			return response;
		}

		if (honor_ranges_ && request.first >= size) {
			response.head.status_code = 416;
			response.head.headers["Content-Range"] =
				"bytes */" + std::to_string(size);
			response.head.content_length = 0;
			response.body = std::make_unique<Body>("", chunk_size_,
												   chunk_delay_, std::nullopt);
			return response;
		}

		long long first = 0;
		long long last = size - 1;
		if (honor_ranges_) {
			first = request.first;
			if (request.last) last = std::min(*request.last, size - 1);
			response.head.status_code = 206;
			response.head.headers["Content-Range"] =
				"bytes " + std::to_string(first) + "-" + std::to_string(last) +
				"/" + std::to_string(size);
		}

		const long long length = std::max<long long>(last - first + 1, 0);
		if (declare_length_) {
			response.head.content_length = length;
			if (fault && fault->kind == FaultKind::wrong_length) {
				*response.head.content_length += 1;
			}
		}

		std::string slice = length > 0 ? content_.substr(first, length) : "";
		std::optional<Fault> body_fault;
		if (fault && (fault->kind == FaultKind::cut_body ||
					  fault->kind == FaultKind::body_error)) {
			body_fault = fault;
		}
		response.body = std::make_unique<Body>(
			std::move(slice), chunk_size_, chunk_delay_, body_fault);
		return response;
	}

   private:
	class Body : public BodyStream {
	   public:
		Body(std::string data, std::size_t chunk,
			 std::chrono::milliseconds delay, std::optional<Fault> fault)
			: data_(std::move(data)),
			  chunk_(chunk),
			  delay_(delay),
			  fault_(fault) {}

		Result<std::size_t> async_read_some(asio::mutable_buffer buffer,
											asio::yield_context yield) override {
			if (delay_.count() > 0) {
				asio::steady_timer timer(yield.get_executor(), delay_);
				boost::system::error_code ec;
				timer.async_wait(yield[ec]);
			}

			std::size_t limit = data_.size();
			if (fault_) {
				limit = std::min<std::size_t>(
					limit, static_cast<std::size_t>(fault_->after));
				if (pos_ >= limit) {
					if (fault_->kind == FaultKind::body_error)
						return outcome::failure(fault_->error);
					return std::size_t{0};
				}
			}

			std::size_t n =
				std::min({buffer.size(), chunk_, limit - pos_});
			if (n == 0) return std::size_t{0};
			std::memcpy(buffer.data(), data_.data() + pos_, n);
			pos_ += n;
			return n;
		}

	   private:
		std::string data_;
		std::size_t chunk_;
		std::chrono::milliseconds delay_;
		std::optional<Fault> fault_;
		std::size_t pos_ = 0;
	};

	std::string content_;
	bool honor_ranges_;
	int status_ = 200;
	bool declare_length_ = true;
	std::size_t chunk_size_ = 4096;
	std::chrono::milliseconds chunk_delay_{0};

	mutable std::mutex mutex_;
	std::map<long long, std::deque<Fault>> faults_;
	std::vector<RangeRequest> requests_;
};

}  // namespace rangedl::test
