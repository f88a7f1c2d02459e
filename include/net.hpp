#pragma once

#include <boost/outcome.hpp>
#include <curl/curl.h>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

class _curl_category : public std::error_category {
  public:
	const char* name() const noexcept override { return "curl"; }
	std::string message(int ev) const override { return curl_easy_strerror(static_cast<CURLcode>(ev)); }
};
inline const _curl_category& curl_category() noexcept {
	static _curl_category cat;
	return cat;
}
inline std::error_code make_error_code(CURLcode code) noexcept { return {static_cast<int>(code), curl_category()}; }

namespace _net_impl {
	using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
	using slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
}

struct probe_outcome {
	std::string ip;
	double		latency_ms;
	bool		success;
};

/*
 * Times TCP connect + TLS handshake to ip:port, sending sni as server name.
 * Certificate and hostname verification are switched off: only the timing matters.
 * latency_ms is rounded to 0.01 ms and measured up to the failure when success is false.
 */
probe_outcome tls_probe(const std::string& ip, const std::string& sni, uint16_t port = 443, uint32_t timeout_ms = 4000);

struct http_response {
	long		status;
	std::string body;
};
BOOST_OUTCOME_V2_NAMESPACE::result<http_response, std::error_code> http_get(const std::string& url, uint32_t timeout);
