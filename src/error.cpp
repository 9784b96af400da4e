#include <rangedl/result.hpp>
#include <string>

namespace rangedl {

struct rangedl_error_category : std::error_category {
	const char *name() const noexcept override { return "rangedl"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "Unexpected HTTP status";
			case errc::connection_failed: return "Connection failed";
			case errc::timed_out: return "Operation timed out";
			case errc::range_mismatch:
				return "Content length does not match requested range";
			case errc::invalid_url: return "Invalid URL";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::file_read_failed: return "File read failed";
			case errc::file_rename_failed: return "File rename failed";
			case errc::file_remove_failed: return "File remove failed";
			case errc::segment_failed: return "Segment download failed";
			case errc::retries_exhausted: return "Retry limit reached";
			case errc::cancelled: return "Download cancelled";
			default: return "Unknown error";
		}
	}
};

const std::error_category &rangedl_category() {
	static rangedl_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), rangedl_category()};
}

}  // namespace rangedl
