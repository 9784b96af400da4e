#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/scope_exit.hpp>
#include <filesystem>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <rangedl/downloader.hpp>
#include <rangedl/http_client.hpp>
#include <rangedl/transfer_state.hpp>
#include <utility>

#include "transfer/merger.hpp"
#include "transfer/partitioner.hpp"
#include "transfer/probe.hpp"
#include "transfer/progress_monitor.hpp"
#include "transfer/segment_storage.hpp"
#include "transfer/segment_worker.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace rangedl {

namespace asio = boost::asio;

namespace {

constexpr long long KIB = 1024;

TransferJob normalize(TransferJob job) {
	if (job.workers == 0) {
		spdlog::warn("Worker count 0 is not usable, running with 1");
		job.workers = 1;
	}
	if (job.output_path.empty()) {
		job.output_path = utils::default_output_name(job.url);
	}
	if (job.monitor_interval.count() <= 0) {
		job.monitor_interval = std::chrono::milliseconds(1000);
	}
	return job;
}

}  // namespace

struct Downloader::Impl {
	TransferJob job;
	std::shared_ptr<Transport> transport;

	std::mutex mutex;
	bool cancel_requested = false;
	std::shared_ptr<TransferState> state;  // set while run() is active

	Impl(TransferJob j, std::shared_ptr<Transport> t)
		: job(normalize(std::move(j))), transport(std::move(t)) {
		if (!transport) {
			net::HttpClient::Options options;
			options.max_redirects = job.max_redirects;
			transport = std::make_shared<net::HttpClient>(std::move(options));
		}
	}

	void cancel() {
		std::lock_guard lock(mutex);
		cancel_requested = true;
		if (state) state->cancel();
	}

	Result<CapabilityResult> probe(asio::thread_pool &pool,
								   const std::shared_ptr<TransferState> &st) {
		std::promise<Result<CapabilityResult>> probed;
		auto probed_future = probed.get_future();

		asio::spawn(
			asio::make_strand(pool.get_executor()),
			[this, st, &probed](asio::yield_context yield) {
				probed.set_value(
					transfer::probe_capability(*transport, job, *st, yield));
			},
			[&probed](std::exception_ptr e) {
				if (e) probed.set_exception(e);
			});

		try {
			return probed_future.get();
		} catch (const std::exception &e) {
			spdlog::error("Probe failed: {}", e.what());
			return outcome::failure(errc::unknown);
		}
	}

	Result<SessionReport> run(ProgressCallback on_progress,
							  SegmentCallback on_segment) {
		auto st = std::make_shared<TransferState>();
		{
			std::lock_guard lock(mutex);
			if (cancel_requested) st->cancel();
			state = st;
		}

		const auto started = std::chrono::steady_clock::now();
		const fs::path destination = job.output_path;

		asio::thread_pool pool(job.workers + 1);
		BOOST_SCOPE_EXIT_ALL(&) {
			st->cancel();
			pool.join();
			std::lock_guard lock(mutex);
			state.reset();
		};

		spdlog::debug("Probing {}", job.url);
		auto probed = probe(pool, st);
		if (probed.has_error()) {
			if (probed.error() != errc::cancelled) {
				spdlog::error("Cannot reach {}: {}", job.url,
							  probed.error().message());
			}
			return outcome::failure(probed.error());
		}
		const CapabilityResult capability = probed.value();

		if (capability.range_supported) {
			spdlog::info("* Support resume download");
		} else {
			spdlog::info("* Doesn't support resume download");
		}
		if (capability.total_size) {
			spdlog::debug("Resource size {} bytes", *capability.total_size);
		}

		const bool multi_segment = transfer::use_multiple_segments(
			capability, job.workers, job.min_split_size);
		const auto segments = transfer::plan_segments(
			capability, job.workers, job.min_split_size);

		SessionReport report;
		report.url = job.url;
		report.output_path = destination.string();
		report.total_size = capability.total_size;
		report.range_supported = capability.range_supported;
		report.multi_segment = multi_segment;
		report.segment_count = segments.size();

		if (st->cancelled()) return outcome::failure(errc::cancelled);

		auto outcomes =
			std::make_shared<std::vector<SegmentOutcome>>(segments.size());
		for (const auto &segment : segments) {
			spdlog::debug("Part {}: bytes {}-{}", segment.index + 1, segment.first,
						  segment.last ? std::to_string(*segment.last) : "");

			transfer::SegmentOptions options;
			options.url = job.url;
			options.storage_path =
				transfer::SegmentStorage::path_for(destination, segment.index);
			options.timeout = job.timeout;
			options.retry = job.retry;
			options.on_event = on_segment;
			transfer::spawn_segment_worker(pool.get_executor(), segment,
										   std::move(options), transport, st,
										   outcomes);
		}

		transfer::MonitorOptions monitor;
		monitor.interval = job.monitor_interval;
		monitor.total_size = capability.total_size;
		monitor.on_progress = std::move(on_progress);
		transfer::spawn_progress_monitor(
			pool.get_executor(), st, std::move(monitor));

		st->completion().get_future().wait();
		pool.join();

		report.downloaded_bytes = st->downloaded();
		report.segments = *outcomes;

		// A part that gave up also cancels the others; report it first
		for (const auto &result : report.segments) {
			if (!result.ok() && result.error != errc::cancelled) {
				spdlog::error(
					"Download of {} failed at part {}, removing temporary files",
					job.url, result.index + 1);
				transfer::discard_segments(destination, segments);
				return outcome::failure(errc::segment_failed);
			}
		}

		if (st->cancelled()) {
			spdlog::warn("Download cancelled, removing temporary files");
			transfer::discard_segments(destination, segments);
			return outcome::failure(errc::cancelled);
		}

		auto merged =
			transfer::merge_segments(destination, segments, multi_segment);
		if (merged.has_error()) return outcome::failure(merged.error());

		if (capability.total_size && merged.value() != *capability.total_size) {
			spdlog::error("{} has {} bytes, expected {}", destination.string(),
						  merged.value(), *capability.total_size);
			return outcome::failure(errc::file_write_failed);
		}

		report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - started);
		const long long ms = std::max<long long>(report.elapsed.count(), 1);
		report.average_bytes_per_sec = report.downloaded_bytes * 1000 / ms;

		spdlog::info("* File successfully downloaded.");
		spdlog::info("* Time used: {:.3f} s, Average speed: {} KB/s",
					 static_cast<double>(report.elapsed.count()) / 1000.0,
					 report.average_bytes_per_sec / KIB);
		return report;
	}
};

Downloader::Downloader(TransferJob job, std::shared_ptr<Transport> transport)
	: m_impl(std::make_unique<Impl>(std::move(job), std::move(transport))) {}

Downloader::~Downloader() = default;
Downloader::Downloader(Downloader &&) noexcept = default;
Downloader &Downloader::operator=(Downloader &&) noexcept = default;

const TransferJob &Downloader::job() const { return m_impl->job; }

Result<SessionReport> Downloader::run(ProgressCallback on_progress,
									  SegmentCallback on_segment) {
	return m_impl->run(std::move(on_progress), std::move(on_segment));
}

void Downloader::cancel() { m_impl->cancel(); }

void to_json(nlohmann::json &j, const SessionReport &report) {
	nlohmann::json segments_json = nlohmann::json::array();
	for (const auto &s : report.segments) {
		nlohmann::json item{{"index", s.index},
							{"downloaded_bytes", s.delivered_bytes},
							{"attempts", s.attempts}};
		if (s.error)
			item["error"] = s.error.message();
		else
			item["error"] = nullptr;
		segments_json.push_back(item);
	}

	j = nlohmann::json{
		{"url", report.url},
		{"output", report.output_path},
		{"range_supported", report.range_supported},
		{"multi_segment", report.multi_segment},
		{"segment_count", report.segment_count},
		{"downloaded_bytes", report.downloaded_bytes},
		{"elapsed_ms", report.elapsed.count()},
		{"average_speed", report.average_bytes_per_sec},
		{"segments", segments_json}};

	// Explicit null handling
	if (report.total_size)
		j["filesize"] = *report.total_size;
	else
		j["filesize"] = nullptr;
}

}  // namespace rangedl
