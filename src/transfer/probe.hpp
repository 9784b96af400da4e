#pragma once

#include <boost/asio/spawn.hpp>
#include <rangedl/result.hpp>
#include <rangedl/transfer_state.hpp>
#include <rangedl/transport.hpp>
#include <rangedl/types.hpp>

namespace rangedl::transfer {

// Asks for "bytes=0-" and looks only at the response head: a 206 means the
// server honours ranges. Connection-level failures are retried according to
// job.retry; a final non-2xx status or a malformed URL is returned as an
// error.
Result<CapabilityResult> probe_capability(Transport &transport,
										  const TransferJob &job,
										  const TransferState &state,
										  asio::yield_context yield);

}  // namespace rangedl::transfer
