#pragma once

#include <string_view>

enum class colo_status { colo, slow, fail };

/* strict comparison: latency equal to the threshold is slow */
constexpr colo_status classify_status(bool success, double latency_ms, double threshold) noexcept {
	if (!success) return colo_status::fail;
	return latency_ms < threshold ? colo_status::colo : colo_status::slow;
}

constexpr std::string_view to_string(colo_status s) noexcept {
	switch (s) {
		case colo_status::colo: return "COLO";
		case colo_status::slow: return "SLOW";
		case colo_status::fail: return "FAIL";
	}
	return "FAIL";
}
