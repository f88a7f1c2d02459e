#pragma once

#include <boost/outcome.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

struct region_rule {
	std::string marker; // matched against the lower-cased PTR
	std::string label;	// zone letters are appended to it
};

/* ordered, first match wins */
const std::vector<region_rule>& default_region_rules();

std::string region_label(std::string_view ptr, const std::vector<region_rule>& rules = default_region_rules());
std::string classify_ptr(const BOOST_OUTCOME_V2_NAMESPACE::result<std::string, std::error_code>& ptr,
						 const std::vector<region_rule>& rules = default_region_rules());

/* reverse lookup of ip followed by region_label; "No PTR" when the lookup fails */
std::string ptr_region(const std::string& ip);
