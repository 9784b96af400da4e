#pragma once

#include <boost/charconv.hpp>
#include <boost/url/parse.hpp>
#include <optional>
#include <rangedl/result.hpp>
#include <string>
#include <string_view>

namespace rangedl::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

template <typename T>
T to_number_default(std::string_view sv, T def_val = 0) {
	auto res = to_number<T>(sv);
	return res ? res.value() : def_val;
}

inline std::string_view trim(std::string_view sv) {
	while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
		sv.remove_prefix(1);
	while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t'))
		sv.remove_suffix(1);
	return sv;
}

// Parses the total of "bytes 0-99/1234". "*" or garbage yields nullopt.
inline std::optional<long long> parse_content_range_total(
	std::string_view value) {
	auto slash_pos = value.rfind('/');
	if (slash_pos == std::string_view::npos) return std::nullopt;
	auto total = to_long(trim(value.substr(slash_pos + 1)));
	if (!total || total.value() < 0) return std::nullopt;
	return total.value();
}

// =============================================================================
// Output naming
// =============================================================================

/// File name to save a URL under when no output path was given: the last
/// path segment, or "index.html" for directory-like URLs.
inline std::string default_output_name(std::string_view url) {
	constexpr const char *kFallback = "index.html";
	auto u_res = boost::urls::parse_uri_reference(url);
	if (u_res.has_error()) return kFallback;

	std::string path = u_res.value().path();
	auto slash_pos = path.rfind('/');
	std::string name =
		slash_pos == std::string::npos ? path : path.substr(slash_pos + 1);
	if (name.empty() || name == "." || name == "..") return kFallback;
	return name;
}

}  // namespace rangedl::utils
