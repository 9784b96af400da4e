#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <boost/scope_exit.hpp>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include <rangedl/downloader.hpp>
#include <rangedl/types.hpp>

namespace po = boost::program_options;
namespace asio = boost::asio;

// =============================================================================
// Console Output
// =============================================================================

constexpr long long KIB = 1024;

void log_download(std::string_view msg) {
	fmt::println(stderr, "[download] {}", msg);
}

void print_progress(const rangedl::ProgressEvent &event) {
	std::string share;
	if (event.percentage) share = fmt::format(" ({:.2f}%)", *event.percentage);
	log_download(fmt::format("Speed: {} KB/s, Downloaded: {} KB{}, Threads: {}",
							 event.bytes_per_sec / KIB,
							 event.downloaded_bytes / KIB, share,
							 event.active_workers));
}

void print_segment_event(const rangedl::SegmentEvent &event) {
	switch (event.kind) {
		case rangedl::SegmentEventKind::completed:
			log_download(fmt::format("* Downloaded part {}", event.index + 1));
			break;
		case rangedl::SegmentEventKind::attempt_failed:
			if (event.error == rangedl::errc::timed_out) {
				log_download(
					fmt::format("Part {} Reading timeout.", event.index + 1));
			} else {
				log_download(fmt::format(
					"Part {} encountered error.", event.index + 1));
			}
			log_download(
				fmt::format("Retry to download part {}", event.index + 1));
			break;
		case rangedl::SegmentEventKind::gave_up:
			log_download(fmt::format(
				"Part {} failed: {}", event.index + 1, event.error.message()));
			break;
	}
}

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[download] %v");

		rangedl::TransferJob defaults;

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("url", po::value<std::string>(), "URL to download")
			// Output
			("output,o", po::value<std::string>(),
			 "Output file (default: last segment of the URL path)")
			// Transfer tuning
			("workers,n", po::value<std::size_t>()->default_value(defaults.workers),
			 "Number of concurrent segment workers")
			("timeout,t", po::value<long long>()->default_value(defaults.timeout.count()),
			 "Per-request timeout in milliseconds")
			("min-split-size", po::value<long long>()->default_value(defaults.min_split_size),
			 "Smallest resource size in bytes that is split across workers")
			("max-attempts", po::value<unsigned>()->default_value(0),
			 "Attempts per segment before giving up (0 = unlimited)")
			("retry-delay", po::value<long long>()->default_value(0),
			 "Delay between attempts in milliseconds")
			("interval", po::value<long long>()->default_value(defaults.monitor_interval.count()),
			 "Progress report interval in milliseconds")
			("max-redirects", po::value<int>()->default_value(defaults.max_redirects),
			 "Maximum number of redirects to follow")
			// Display
			("dump-json,j", "Print the session report as JSON")
			("quiet,q", "Suppress progress output")
			("verbose,v", "Enable verbose logging");
		// clang-format on

		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: rangedl [options] <url>\n" << desc << "\n";
			return 0;
		}

		const bool quiet = vm.count("quiet") > 0;
		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else if (quiet) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		if (!vm.count("url")) {
			std::cout << "Usage: rangedl [options] <url>\n" << desc << "\n";
			return 1;
		}

		// Build transfer job
		rangedl::TransferJob job;
		job.url = vm["url"].as<std::string>();
		if (vm.count("output")) job.output_path = vm["output"].as<std::string>();
		job.workers = vm["workers"].as<std::size_t>();
		job.timeout = std::chrono::milliseconds(vm["timeout"].as<long long>());
		job.min_split_size = vm["min-split-size"].as<long long>();
		job.monitor_interval =
			std::chrono::milliseconds(vm["interval"].as<long long>());
		job.max_redirects = vm["max-redirects"].as<int>();
		if (auto attempts = vm["max-attempts"].as<unsigned>(); attempts > 0) {
			job.retry.max_attempts = attempts;
		}
		job.retry.delay =
			std::chrono::milliseconds(vm["retry-delay"].as<long long>());

		rangedl::Downloader downloader(std::move(job));
		log_download(fmt::format("Destination: {}", downloader.job().output_path));

		// Setup signal handling using asio::signal_set on its own thread
		asio::io_context ioc;
		auto guard = asio::make_work_guard(ioc);
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				fmt::println(stderr, "\nInterrupted by signal {}, stopping.", sig);
				downloader.cancel();
			}
		});
		std::thread signal_thread([&ioc] { ioc.run(); });
		BOOST_SCOPE_EXIT_ALL(&) {
			boost::system::error_code ec;
			signals.cancel(ec);
			guard.reset();
			signal_thread.join();
		};

		rangedl::ProgressCallback on_progress;
		rangedl::SegmentCallback on_segment;
		if (!quiet) {
			on_progress = print_progress;
			on_segment = print_segment_event;
		}

		auto result = downloader.run(on_progress, on_segment);
		if (result.has_error()) {
			fmt::println(
				stderr, "ERROR: Download failed: {}", result.error().message());
			return 1;
		}

		if (vm.count("dump-json")) {
			nlohmann::json j;
			rangedl::to_json(j, result.value());
			std::cout << j.dump(2) << "\n";
		}
		return 0;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
