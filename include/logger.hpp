#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

/* serializes every write to stdout, stderr and the run log */
extern std::mutex stdout_mtx;

std::string local_time(const char* fmt);
std::string log_stamp();
void		log_line(std::ostream& out, std::string_view msg);
void		log_flush(std::ostream& out, const std::ostringstream& buf);
