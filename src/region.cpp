#include "region.hpp"
#include "dns.hpp"
#include "utils.hpp"
#include <cctype>

namespace {
	constexpr size_t		   ptr_max_len = 50;
	constexpr std::string_view no_ptr	   = "No PTR";

	/* letters right after the marker, restricted to availability zone ids */
	std::string zone_of(std::string_view ptr, size_t after) {
		std::string zone;
		for (size_t i = after; i < ptr.size() && std::isalpha(static_cast<unsigned char>(ptr[i])); ++i)
			if (ptr[i] >= 'a' && ptr[i] <= 'f') zone += ptr[i];
		return zone.empty() ? "?" : zone;
	}
}

const std::vector<region_rule>& default_region_rules() {
	static const std::vector<region_rule> rules = {
		{"ap-northeast-1", "AWS TOKYO ap-northeast-1"},
	};
	return rules;
}

std::string region_label(std::string_view ptr, const std::vector<region_rule>& rules) {
	const std::string lower = to_lower(ptr);
	for (const auto& [marker, label] : rules) {
		if (const auto pos = lower.find(marker); pos != std::string::npos)
			return label + zone_of(lower, pos + marker.size());
	}
	return std::string(ptr.substr(0, ptr_max_len));
}

std::string classify_ptr(const BOOST_OUTCOME_V2_NAMESPACE::result<std::string, std::error_code>& ptr,
						 const std::vector<region_rule>& rules) {
	if (!ptr) return std::string(no_ptr);
	return region_label(std::string_view(ptr.value()), rules);
}

std::string ptr_region(const std::string& ip) { return classify_ptr(lookup_ptr(ip)); }
