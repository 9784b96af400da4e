#pragma once

#include <rangedl/rangedl_export.h>

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <rangedl/result.hpp>
#include <rangedl/transport.hpp>
#include <rangedl/types.hpp>

namespace rangedl {

// Runs one download session: probes the server, splits the resource across
// job.workers segment workers when ranges are supported, waits for all of
// them and merges their storage into job.output_path.
class RANGEDL_EXPORT Downloader {
   public:
	// A null transport selects net::HttpClient.
	explicit Downloader(TransferJob job,
						std::shared_ptr<Transport> transport = nullptr);

	Downloader(const Downloader &) = delete;
	Downloader &operator=(const Downloader &) = delete;
	Downloader(Downloader &&) noexcept;
	Downloader &operator=(Downloader &&) noexcept;
	~Downloader();

	[[nodiscard]] const TransferJob &job() const;

	// Blocks the calling thread until the session is over. Callbacks are
	// invoked from pool threads, possibly concurrently with each other.
	Result<SessionReport> run(ProgressCallback on_progress = nullptr,
							  SegmentCallback on_segment = nullptr);

	// Requests cooperative cancellation of the running (or next) session.
	// Safe to call from any thread, including a signal handler's executor.
	void cancel();

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

RANGEDL_EXPORT void to_json(nlohmann::json &j, const SessionReport &report);

}  // namespace rangedl
