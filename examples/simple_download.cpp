#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <rangedl/downloader.hpp>

using namespace rangedl;

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("rangedl", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	TransferJob job;
	job.url = argc > 1 ? argv[1]
					   : "https://proof.ovh.net/files/10Mb.dat";  // Example URL
	job.workers = 8;
	job.retry.max_attempts = 10;
	job.retry.delay = std::chrono::milliseconds(500);
	job.retry.backoff_multiplier = 2.0;

	Downloader downloader(job);
	std::cout << "Downloading " << job.url << " to "
			  << downloader.job().output_path << "...\n";

	auto res = downloader.run(
		[](const ProgressEvent &prog) {
			std::cout << "\r" << std::fixed << std::setprecision(1);
			if (prog.percentage) std::cout << *prog.percentage << "% ";
			std::cout << "(" << prog.downloaded_bytes / 1024 / 1024 << "MB) "
					  << "Speed: " << prog.bytes_per_sec / 1024 << " KB/s "
					  << "Workers: " << prog.active_workers << "   "
					  << std::flush;
		},
		[](const SegmentEvent &event) {
			if (event.kind == SegmentEventKind::attempt_failed) {
				spdlog::warn("Part {} attempt {} failed: {}", event.index + 1,
							 event.attempt, event.error.message());
			}
		});

	if (res.has_error()) {
		spdlog::error("Download failed: {}", res.error().message());
		return 1;
	}

	const auto &report = res.value();
	std::cout << "\nOperation complete.\n"
			  << "Downloaded to: " << report.output_path << " ("
			  << report.downloaded_bytes << " bytes in "
			  << report.segment_count << " segment(s))\n";
	return 0;
}
