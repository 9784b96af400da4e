#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <mutex>
#include <rangedl/transfer_state.hpp>
#include <thread>
#include <vector>

#include "support/coroutine.hpp"
#include "transfer/progress_monitor.hpp"

using namespace rangedl;
using namespace rangedl::transfer;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("Progress sample arithmetic", "[progress_monitor]") {
	auto event = make_progress_event(1000, 3048, 1000ms, 8192, 3);

	CHECK(event.bytes_per_sec == 2048);
	CHECK(event.downloaded_bytes == 3048);
	CHECK(event.active_workers == 3);
	CHECK(event.total_bytes == 8192);
	REQUIRE(event.percentage.has_value());
	CHECK_THAT(*event.percentage, WithinAbs(37.207, 0.001));

	SECTION("Half-second window doubles the rate") {
		auto e = make_progress_event(0, 500, 500ms, std::nullopt, 1);
		CHECK(e.bytes_per_sec == 1000);
		CHECK_FALSE(e.percentage.has_value());
	}

	SECTION("Zero elapsed time does not divide by zero") {
		auto e = make_progress_event(0, 10, 0ms, 10, 0);
		CHECK(e.bytes_per_sec == 10000);
		CHECK_THAT(*e.percentage, WithinAbs(100.0, 1e-9));
	}

	SECTION("Zero total has no percentage") {
		auto e = make_progress_event(0, 0, 1000ms, 0, 0);
		CHECK_FALSE(e.percentage.has_value());
	}
}

TEST_CASE("Monitor fires completion once no worker is active",
		  "[progress_monitor]") {
	auto state = std::make_shared<TransferState>();
	std::vector<ProgressEvent> events;

	MonitorOptions options;
	options.interval = 10ms;
	options.total_size = 100;
	options.on_progress = [&](const ProgressEvent &e) { events.push_back(e); };

	state->add_downloaded(100);
	test::run_coroutine([&](boost::asio::yield_context yield) {
		run_progress_monitor(state, options, yield);
	});

	CHECK(state->completion().fired());
	REQUIRE(events.size() == 1);
	CHECK(events[0].downloaded_bytes == 100);
	CHECK(events[0].active_workers == 0);
	CHECK_THAT(*events[0].percentage, WithinAbs(100.0, 1e-9));
}

TEST_CASE("Monitor keeps reporting while workers run", "[progress_monitor]") {
	auto state = std::make_shared<TransferState>();
	state->worker_started();
	state->worker_started();

	std::mutex mutex;
	std::vector<ProgressEvent> events;

	MonitorOptions options;
	options.interval = 10ms;
	options.on_progress = [&](const ProgressEvent &e) {
		std::lock_guard lock(mutex);
		events.push_back(e);
	};

	boost::asio::thread_pool pool(1);
	spawn_progress_monitor(pool.get_executor(), state, options);

	std::thread workers([state] {
		for (int i = 0; i < 10; ++i) {
			state->add_downloaded(10);
			std::this_thread::sleep_for(5ms);
		}
		state->worker_finished();
		std::this_thread::sleep_for(30ms);
		state->worker_finished();
	});

	auto future = state->completion().get_future();
	REQUIRE(future.wait_for(10s) == std::future_status::ready);
	workers.join();
	pool.join();

	std::lock_guard lock(mutex);
	REQUIRE(events.size() >= 2);
	CHECK(events.back().active_workers == 0);
	CHECK(events.back().downloaded_bytes == 100);
	CHECK_FALSE(events.back().percentage.has_value());
	for (std::size_t i = 1; i < events.size(); ++i) {
		CHECK(events[i].downloaded_bytes >= events[i - 1].downloaded_bytes);
	}
}
