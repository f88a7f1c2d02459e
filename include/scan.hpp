#pragma once

#include "dns.hpp"
#include "endpoints.hpp"
#include "geodata.hpp"
#include "net.hpp"
#include "status.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

struct resolved_target {
	endpoint	ep;
	std::string ip;
};

struct enriched_result {
	std::string constant;
	std::string category;
	std::string domain;
	std::string ip;
	double		latency_ms;
	colo_status status;
	std::string aws_region;
	std::string country;
	std::string region;
	std::string city;
};

struct scan_summary {
	size_t colo_count;
	size_t total_count;
	double colo_percentage;
};

struct scan_options {
	size_t		workers			 = 80;
	double		threshold		 = 12.0;
	uint16_t	port			 = 443;
	uint32_t	probe_timeout_ms = 4000;
	uint32_t	geo_timeout		 = 5;
	std::string geo_url			 = std::string(ipwhois_url);
};

/*
 * Network operations the scan is made of. Defaults are filled in by
 * default_hooks(); tests swap them for local fakes.
 */
struct scan_hooks {
	std::function<probe_outcome(const std::string& ip, const std::string& sni)> probe;
	std::function<std::string(const std::string& ip)>							region;
	std::function<geodata(const std::string& ip)>								locate;
};
scan_hooks default_hooks(const scan_options& opts);
#ifdef MMDB_SUPPORTED
/* geolocation from a local database instead of the HTTP service */
scan_hooks mmdb_hooks(const scan_options& opts, mmdb_handle& db);
#endif

using progress_fn = std::function<void(size_t done, size_t total)>;

/* sequential pass, one lookup per distinct domain */
void resolve_domains(const std::vector<endpoint>& endpoints, domain_cache& cache, std::ostream& log_out);
/* endpoint order, then address order */
std::vector<resolved_target> expand_targets(const std::vector<endpoint>& endpoints, const domain_cache& cache);

/*
 * Probes and enriches every target on a pool of at most opts.workers threads.
 * Returns one result per target, in completion order.
 */
std::vector<enriched_result> run_scan(const std::vector<resolved_target>& targets, const scan_options& opts,
									  const scan_hooks& hooks, std::ostream& log_out, const progress_fn& progress = {});

scan_summary summarize(const std::vector<enriched_result>& results);
