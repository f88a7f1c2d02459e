#pragma once

#include <boost/outcome.hpp>
#include <netdb.h>
#include <functional>
#include <map>
#include <string>
#include <system_error>
#include <vector>

class _gai_category : public std::error_category {
  public:
	const char* name() const noexcept override { return "gai"; }
	std::string message(int ev) const override { return gai_strerror(ev); }
};
inline const _gai_category& gai_category() noexcept {
	static _gai_category cat;
	return cat;
}

using ip_list = std::vector<std::string>;

/* A-record lookup, deduplicated and sorted */
BOOST_OUTCOME_V2_NAMESPACE::result<ip_list, std::error_code> lookup_ipv4(const std::string& domain);
/* PTR lookup; fails with EAI_NONAME when the address has no name */
BOOST_OUTCOME_V2_NAMESPACE::result<std::string, std::error_code> lookup_ptr(const std::string& ip);

/* never fails: an unresolvable domain yields an empty list */
ip_list resolve_ipv4(const std::string& domain);

/*
 * Memoizes resolution per domain. Filled during the sequential resolution pass,
 * read-only afterwards, so workers may share it without locking.
 */
class domain_cache {
  public:
	using resolve_fn = std::function<ip_list(const std::string&)>;

	explicit domain_cache(resolve_fn resolve = resolve_ipv4) : resolve_(std::move(resolve)) {}

	const ip_list& resolve(const std::string& domain);
	const ip_list& get(const std::string& domain) const;
	size_t		   size() const { return cache_.size(); }

  private:
	resolve_fn						 resolve_;
	std::map<std::string, ip_list> cache_;
};
