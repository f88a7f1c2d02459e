#include "net.hpp"
#include "utils.hpp"
#include <chrono>
#include <curl/curl.h>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;
using namespace _net_impl;

namespace {
	size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
		std::string* response = static_cast<std::string*>(userdata);
		response->append(ptr, size * nmemb);
		return size * nmemb;
	}
	double elapsed_ms(std::chrono::steady_clock::time_point start) {
		const std::chrono::duration<double, std::milli> d = std::chrono::steady_clock::now() - start;
		return round2(d.count());
	}
}

probe_outcome tls_probe(const std::string& ip, const std::string& sni, uint16_t port, uint32_t timeout_ms) {
	const auto start = std::chrono::steady_clock::now();

	curl_ptr curl(curl_easy_init(), &curl_easy_cleanup);
	CURL*	 c_ptr = curl.get();
	if (!c_ptr) return {ip, elapsed_ms(start), false};

	const std::string p	  = std::to_string(port);
	const std::string url = "https://" + sni + ":" + p + "/";

	/* pin the connection to ip while the url host still drives SNI */
	const std::string connect_to = sni + ":" + p + ":" + ip + ":" + p;
	slist_ptr		  pin(curl_slist_append(nullptr, connect_to.c_str()), &curl_slist_free_all);
	if (!pin) return {ip, elapsed_ms(start), false};

	curl_easy_setopt(c_ptr, CURLOPT_URL, url.c_str());
	curl_easy_setopt(c_ptr, CURLOPT_CONNECT_TO, pin.get());
	curl_easy_setopt(c_ptr, CURLOPT_CONNECT_ONLY, 1L);
	/* direct connection only, whatever *_proxy says */
	curl_easy_setopt(c_ptr, CURLOPT_PROXY, "");

	curl_easy_setopt(c_ptr, CURLOPT_SSL_VERIFYPEER, 0L);
	curl_easy_setopt(c_ptr, CURLOPT_SSL_VERIFYHOST, 0L);

	/* curl output */
	curl_easy_setopt(c_ptr, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(c_ptr, CURLOPT_VERBOSE, 0L);
	curl_easy_setopt(c_ptr, CURLOPT_NOSIGNAL, 1L);

	curl_easy_setopt(c_ptr, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
	curl_easy_setopt(c_ptr, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
	curl_easy_setopt(c_ptr, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);

	const CURLcode res = curl_easy_perform(c_ptr);
	return {ip, elapsed_ms(start), res == CURLE_OK};
}

outcome::result<http_response, std::error_code> http_get(const std::string& url, uint32_t timeout) {
	curl_ptr curl(curl_easy_init(), &curl_easy_cleanup);
	CURL*	 c_ptr = curl.get();

	if (!c_ptr) return outcome::failure(std::make_error_code(std::errc::not_enough_memory));

	curl_easy_setopt(c_ptr, CURLOPT_URL, url.c_str());

	http_response response{};

	/* curl output */
	curl_easy_setopt(c_ptr, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(c_ptr, CURLOPT_VERBOSE, 0L);
	curl_easy_setopt(c_ptr, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(c_ptr, CURLOPT_WRITEFUNCTION, write_callback);
	curl_easy_setopt(c_ptr, CURLOPT_WRITEDATA, &response.body);

	curl_easy_setopt(c_ptr, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(c_ptr, CURLOPT_MAXREDIRS, 10L);
	curl_easy_setopt(c_ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout));
	curl_easy_setopt(c_ptr, CURLOPT_TIMEOUT, static_cast<long>(timeout));
	curl_easy_setopt(c_ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);

	const CURLcode res = curl_easy_perform(c_ptr);
	if (res != CURLE_OK) return outcome::failure(make_error_code(res));

	curl_easy_getinfo(c_ptr, CURLINFO_RESPONSE_CODE, &response.status);
	return outcome::success(std::move(response));
}
