#include "geodata.hpp"
#include "dns.hpp"
#include "net.hpp"
#include <boost/json.hpp>
#include <boost/outcome.hpp>
#include <stdexcept>
#include <system_error>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;
using namespace boost;

#ifdef MMDB_SUPPORTED
mmdb_handle::mmdb_handle(const std::string& path) {
	if (int status = MMDB_open(path.c_str(), MMDB_MODE_MMAP, &mmdb_); status != MMDB_SUCCESS)
		throw std::system_error(std::error_code(status, maxminddb_category()), path);
}

outcome::result<geodata, std::error_code> mmdb_geodata(MMDB_s& mmdb, std::string_view ip) {
	const std::string	 addr(ip);
	int					 gai_err, mmdb_err;
	MMDB_lookup_result_s result = MMDB_lookup_string(&mmdb, addr.c_str(), &gai_err, &mmdb_err);
	if (gai_err) return outcome::failure(std::error_code(gai_err, gai_category()));
	if (mmdb_err) return outcome::failure(std::error_code(mmdb_err, maxminddb_category()));
	if (!result.found_entry) return outcome::failure(std::make_error_code(std::errc::invalid_argument));

	auto get_entry = [&result]<typename... T>(T... entry_path) -> std::string {
		MMDB_entry_data_s entry_data;
		int				  status = MMDB_get_value(&result.entry, &entry_data, entry_path..., nullptr);
		if (status == MMDB_SUCCESS && entry_data.has_data && entry_data.type == MMDB_DATA_TYPE_UTF8_STRING)
			return std::string(entry_data.utf8_string, entry_data.data_size);
		return "Unknown";
	};
	geodata geo;
	geo.ip		= addr;
	geo.country = get_entry("country", "iso_code");
	geo.region	= get_entry("subdivisions", "0", "iso_code");
	geo.city	= get_entry("city", "names", "en");
	return outcome::success(geo);
}
#endif

outcome::result<geodata, std::error_code> parse_ipwhois(std::string_view ip, std::string_view body) {
	system::error_code ec;
	json::value		   v = json::parse(body, ec);
	if (ec) return outcome::failure(std::error_code(ec));
	if (!v.is_object()) return outcome::failure(std::make_error_code(std::errc::bad_message));

	const json::object& j = v.get_object();
	auto field = [&j](std::string_view key) -> std::string {
		if (const json::value* f = j.if_contains(key); f && f->is_string()) return json::value_to<std::string>(*f);
		return "Unknown";
	};
	geodata geo;
	geo.ip		= ip;
	geo.country = field("country");
	geo.region	= field("region");
	geo.city	= field("city");
	return outcome::success(geo);
}

outcome::result<geodata, std::error_code> ipwhois_geodata(std::string_view ip, uint32_t timeout, std::string_view base_url) {
	auto response = http_get(std::string(base_url) + std::string(ip), timeout);
	if (!response) return outcome::failure(response.error());
	if (response.value().status != 200) return outcome::failure(std::make_error_code(std::errc::protocol_error));
	return parse_ipwhois(ip, response.value().body);
}

geodata locate(std::string_view ip, uint32_t timeout, std::string_view base_url) {
	auto res = ipwhois_geodata(ip, timeout, base_url);
	if (!res) {
		geodata unknown;
		unknown.ip = ip;
		return unknown;
	}
	return std::move(res).value();
}
