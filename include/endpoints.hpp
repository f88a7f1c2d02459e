#pragma once

#include <string>
#include <string_view>
#include <vector>

struct endpoint {
	std::string name;
	std::string category;
	std::string domain;
};

/*
 * "# Category" lines set the category of the declarations below them,
 * NAME = "scheme://host[:port][/path]" lines (http, https, wss) declare an endpoint.
 * Anything else is ignored.
 */
std::vector<endpoint> parse_endpoints(std::string_view text);
/* throws std::ios_base::failure when path cannot be read */
std::vector<endpoint> load_endpoints(std::string_view path);
