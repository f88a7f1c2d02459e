#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <format>

std::mutex stdout_mtx;

std::string local_time(const char* fmt) {
	const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::tm			  tm{};
	localtime_r(&t, &tm);
	char buf[64];
	return std::string(buf, std::strftime(buf, sizeof(buf), fmt, &tm));
}

std::string log_stamp() {
	const auto now = std::chrono::system_clock::now().time_since_epoch();
	const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(now).count() % 1000;
	return std::format("{},{:03}", local_time("%F %T"), ms);
}

void log_line(std::ostream& out, std::string_view msg) {
	const std::string line = log_stamp() + ' ' + std::string(msg) + '\n';
	std::lock_guard<std::mutex> lk(stdout_mtx);
	out << line;
	out.flush();
}

void log_flush(std::ostream& out, const std::ostringstream& buf) {
	const std::string text = buf.str();
	if (text.empty()) return;
	std::lock_guard<std::mutex> lk(stdout_mtx);
	out << text;
	out.flush();
}
