#include "endpoints.hpp"
#include "utils.hpp"
#include <boost/url.hpp>
#include <regex>
#include <sstream>

using namespace boost;

namespace {
	const std::regex assignment(R"re((\w+)\s*=\s*"((?:https?|wss)://[^"\s]*))re");
	constexpr std::string_view unknown_category = "Unknown";
}

std::vector<endpoint> parse_endpoints(std::string_view text) {
	std::vector<endpoint> out;
	std::string			  category;
	std::istringstream	  in{std::string(text)};
	std::string			  raw;

	while (std::getline(in, raw)) {
		const std::string line(trim(raw));
		if (line.starts_with('#')) {
			category = trim(std::string_view(line).substr(1));
			continue;
		}
		std::smatch m;
		if (!std::regex_search(line, m, assignment)) continue;

		/* only scheme and authority matter; paths may carry template placeholders */
		const std::string full = m[2].str();
		const std::string origin = full.substr(0, full.find_first_of("/?#", full.find("://") + 3));
		const auto url = urls::parse_uri(origin);
		if (!url || url->encoded_host().empty()) continue;
		out.push_back({m[1].str(), category.empty() ? std::string(unknown_category) : category, url->host()});
	}
	return out;
}

std::vector<endpoint> load_endpoints(std::string_view path) { return parse_endpoints(read_file(path)); }
