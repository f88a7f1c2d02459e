#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <string>
#include <string_view>

std::string read_file(std::string_view path) {
	std::ifstream file;
	file.exceptions(std::ios::failbit | std::ios::badbit);
	file.open(std::string(path));
	return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string_view trim(std::string_view s) {
	const auto not_space = [](unsigned char c) { return !std::isspace(c); };
	const auto first	 = std::find_if(s.begin(), s.end(), not_space);
	const auto last		 = std::find_if(s.rbegin(), s.rend(), not_space).base();
	return first < last ? std::string_view(first, last) : std::string_view{};
}

std::string to_lower(std::string_view s) {
	std::string out(s);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }
