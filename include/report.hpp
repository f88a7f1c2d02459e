#pragma once

#include "scan.hpp"
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <vector>

boost::json::array results_to_json(const std::vector<enriched_result>& results);
std::string		   pretty_json(const boost::json::value& v);
std::string		   html_escape(std::string_view s);
/* rows are sorted by latency for display; results itself is left untouched */
std::string render_html(const std::vector<enriched_result>& results, double threshold, std::string_view timestamp);

/* both create missing parent directories and throw std::ios_base::failure on write errors */
void write_json(const std::vector<enriched_result>& results, const std::string& path);
void write_html(const std::vector<enriched_result>& results, double threshold, const std::string& path);
