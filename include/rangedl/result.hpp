#pragma once

#include <rangedl/rangedl_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace rangedl {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Unexpected status code
	connection_failed,
	timed_out,
	range_mismatch,	 // Declared length differs from the requested span

	// Parsing errors
	invalid_url = 20,
	invalid_number_format,

	// I/O
	file_open_failed = 40,
	file_write_failed,
	file_read_failed,
	file_rename_failed,
	file_remove_failed,

	// Session
	segment_failed = 60,
	retries_exhausted,
	cancelled,

	unknown = 100
};

RANGEDL_EXPORT const std::error_category &rangedl_category();
RANGEDL_EXPORT std::error_code make_error_code(errc e);

}  // namespace rangedl

namespace std {
template <>
struct is_error_code_enum<rangedl::errc> : true_type {};
}  // namespace std

namespace rangedl {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace rangedl
