#pragma once

#include <string>
#include <string_view>

std::string		 read_file(std::string_view path);
std::string_view trim(std::string_view s);
std::string		 to_lower(std::string_view s);
double			 round2(double v);
