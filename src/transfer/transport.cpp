#include <cctype>
#include <rangedl/transport.hpp>
#include <string>

#include "utils.hpp"

namespace rangedl {

namespace {

bool iequals(std::string_view a, std::string_view b) {
	if (a.size() != b.size()) return false;
	for (std::size_t i = 0; i < a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) !=
			std::tolower(static_cast<unsigned char>(b[i])))
			return false;
	}
	return true;
}

}  // namespace

std::string RangeRequest::header_value() const {
	std::string value = "bytes=" + std::to_string(first) + "-";
	if (last) value += std::to_string(*last);
	return value;
}

std::optional<std::string> ResponseHead::header(std::string_view name) const {
	for (const auto &[key, value] : headers) {
		if (iequals(key, name)) return value;
	}
	return std::nullopt;
}

std::optional<long long> ResponseHead::content_range_total() const {
	auto value = header("Content-Range");
	if (!value) return std::nullopt;
	return utils::parse_content_range_total(*value);
}

}  // namespace rangedl
