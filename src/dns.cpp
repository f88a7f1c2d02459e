#include "dns.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <memory>
#include <set>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace {
	using addrinfo_ptr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;
	const ip_list no_ips;
}

outcome::result<ip_list, std::error_code> lookup_ipv4(const std::string& domain) {
	addrinfo hints{};
	hints.ai_family	  = AF_INET;
	hints.ai_socktype = SOCK_STREAM;

	addrinfo* raw = nullptr;
	if (int err = getaddrinfo(domain.c_str(), nullptr, &hints, &raw); err != 0) {
		if (err == EAI_SYSTEM) return outcome::failure(std::error_code(errno, std::system_category()));
		return outcome::failure(std::error_code(err, gai_category()));
	}
	addrinfo_ptr res(raw, &freeaddrinfo);

	std::set<std::string> ips;
	for (const addrinfo* ai = res.get(); ai; ai = ai->ai_next) {
		if (ai->ai_family != AF_INET) continue;
		char buf[INET_ADDRSTRLEN] = {};
		const auto* sin = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
		if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) ips.insert(buf);
	}
	if (ips.empty()) return outcome::failure(std::error_code(EAI_NONAME, gai_category()));
	return outcome::success(ip_list(ips.begin(), ips.end()));
}

outcome::result<std::string, std::error_code> lookup_ptr(const std::string& ip) {
	sockaddr_in sa{};
	sa.sin_family = AF_INET;
	if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1)
		return outcome::failure(std::make_error_code(std::errc::invalid_argument));

	char host[NI_MAXHOST] = {};
	if (int err = getnameinfo(reinterpret_cast<const sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
		err != 0) {
		if (err == EAI_SYSTEM) return outcome::failure(std::error_code(errno, std::system_category()));
		return outcome::failure(std::error_code(err, gai_category()));
	}
	return outcome::success(std::string(host));
}

ip_list resolve_ipv4(const std::string& domain) {
	auto res = lookup_ipv4(domain);
	if (!res) return {};
	return std::move(res).value();
}

const ip_list& domain_cache::resolve(const std::string& domain) {
	if (auto it = cache_.find(domain); it != cache_.end()) return it->second;
	return cache_.emplace(domain, resolve_(domain)).first->second;
}

const ip_list& domain_cache::get(const std::string& domain) const {
	auto it = cache_.find(domain);
	return it == cache_.end() ? no_ips : it->second;
}
