#pragma once

#include <boost/outcome.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

struct geodata {
	std::string ip;
	std::string country = "Unknown";
	std::string city	= "Unknown";
	std::string region	= "Unknown";
};
#ifndef _WIN32
#define MMDB_SUPPORTED
#include <maxminddb.h>
class _maxminddb_category : public std::error_category {
  public:
	const char* name() const noexcept override { return "maxminddb"; }
	std::string message(int ev) const override { return MMDB_strerror(ev); }
};
inline const _maxminddb_category& maxminddb_category() noexcept {
	static _maxminddb_category cat;
	return cat;
}
BOOST_OUTCOME_V2_NAMESPACE::result<geodata, std::error_code> mmdb_geodata(MMDB_s& mmdb, std::string_view ip);

/* owns an opened database; lookups on it are safe from many threads */
class mmdb_handle {
  public:
	explicit mmdb_handle(const std::string& path);
	~mmdb_handle() { MMDB_close(&mmdb_); }

	mmdb_handle(const mmdb_handle&)			   = delete;
	mmdb_handle& operator=(const mmdb_handle&) = delete;

	MMDB_s& get() { return mmdb_; }

  private:
	MMDB_s mmdb_{};
};
#endif

constexpr std::string_view ipwhois_url = "https://ipwhois.app/json/";

/* fields absent from the body or not strings stay "Unknown" */
BOOST_OUTCOME_V2_NAMESPACE::result<geodata, std::error_code> parse_ipwhois(std::string_view ip, std::string_view body);
BOOST_OUTCOME_V2_NAMESPACE::result<geodata, std::error_code> ipwhois_geodata(std::string_view ip, uint32_t timeout,
																			 std::string_view base_url = ipwhois_url);

/* best effort: every failure collapses to an all-"Unknown" record */
geodata locate(std::string_view ip, uint32_t timeout = 5, std::string_view base_url = ipwhois_url);
