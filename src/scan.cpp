#include "scan.hpp"
#include "logger.hpp"
#include "region.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace {
	/* a throwing component is logged and replaced by its fallback value */
	template <typename F, typename T>
	T guarded(std::ostringstream& log_buf, std::string_view what, const std::string& ip, F&& fn, T fallback) {
		try {
			return fn();
		} catch (const std::exception& e) {
			log_buf << log_stamp() << ' ' << what << ' ' << ip << " failed: " << e.what() << '\n';
			return fallback;
		} catch (...) {
			log_buf << log_stamp() << ' ' << what << ' ' << ip << " failed: unknown error\n";
			return fallback;
		}
	}

	enriched_result enrich(const resolved_target& t, const scan_options& opts, const scan_hooks& hooks,
						   std::ostringstream& log_buf) {
		const probe_outcome probed = guarded(log_buf, "probe", t.ip, [&] { return hooks.probe(t.ip, t.ep.domain); },
											  probe_outcome{t.ip, 0.0, false});
		const std::string	aws = guarded(log_buf, "ptr", t.ip, [&] { return hooks.region(probed.ip); }, std::string("No PTR"));
		geodata unknown;
		unknown.ip		  = probed.ip;
		const geodata geo = guarded(log_buf, "geo", t.ip, [&] { return hooks.locate(probed.ip); }, unknown);

		const colo_status status = classify_status(probed.success, probed.latency_ms, opts.threshold);
		log_buf << log_stamp() << ' '
				<< std::format("{} {} {} {:.2f} ms {} [{}] {}/{}", t.ep.name, t.ep.domain, probed.ip, probed.latency_ms,
							   to_string(status), aws, geo.country, geo.city)
				<< '\n';
		return {t.ep.name, t.ep.category, t.ep.domain, probed.ip, probed.latency_ms, status,
				aws,	   geo.country,	   geo.region,	  geo.city};
	}
}

scan_hooks default_hooks(const scan_options& opts) {
	scan_hooks hooks;
	hooks.probe	 = [port = opts.port, timeout = opts.probe_timeout_ms](const std::string& ip, const std::string& sni) {
		 return tls_probe(ip, sni, port, timeout);
	};
	hooks.region = ptr_region;
	hooks.locate = [timeout = opts.geo_timeout, url = opts.geo_url](const std::string& ip) { return locate(ip, timeout, url); };
	return hooks;
}

#ifdef MMDB_SUPPORTED
scan_hooks mmdb_hooks(const scan_options& opts, mmdb_handle& db) {
	scan_hooks hooks = default_hooks(opts);
	hooks.locate	 = [&db](const std::string& ip) {
		auto res = mmdb_geodata(db.get(), ip);
		if (!res) {
			geodata unknown;
			unknown.ip = ip;
			return unknown;
		}
		return std::move(res).value();
	};
	return hooks;
}
#endif

void resolve_domains(const std::vector<endpoint>& endpoints, domain_cache& cache, std::ostream& log_out) {
	for (const auto& ep : endpoints) {
		const size_t   before = cache.size();
		const ip_list& ips	  = cache.resolve(ep.domain);
		if (cache.size() == before) continue;
		if (ips.empty())
			log_line(log_out, std::format("{}: no IPv4 addresses", ep.domain));
		else
			log_line(log_out, std::format("{}: {} addresses", ep.domain, ips.size()));
	}
}

std::vector<resolved_target> expand_targets(const std::vector<endpoint>& endpoints, const domain_cache& cache) {
	std::vector<resolved_target> targets;
	for (const auto& ep : endpoints)
		for (const auto& ip : cache.get(ep.domain)) targets.push_back({ep, ip});
	return targets;
}

std::vector<enriched_result> run_scan(const std::vector<resolved_target>& targets, const scan_options& opts,
									  const scan_hooks& hooks, std::ostream& log_out, const progress_fn& progress) {
	std::vector<enriched_result> results;
	if (targets.empty()) return results;
	results.reserve(targets.size());

	std::mutex			results_mtx;
	std::atomic<size_t> next{0};

	auto worker = [&] {
		std::ostringstream log_buf;
		for (size_t idx; (idx = next.fetch_add(1)) < targets.size();) {
			enriched_result r = enrich(targets[idx], opts, hooks, log_buf);
			size_t			done;
			{
				std::lock_guard<std::mutex> lk(results_mtx);
				results.push_back(std::move(r));
				done = results.size();
			}
			if (progress) progress(done, targets.size());
		}
		log_flush(log_out, log_buf);
	};

	const size_t			 nthreads = std::clamp<size_t>(opts.workers, 1, targets.size());
	std::vector<std::thread> threads;
	threads.reserve(nthreads);
	for (size_t i = 0; i < nthreads; ++i) {
		try {
			threads.emplace_back(worker);
		} catch (const std::system_error& e) {
			log_line(log_out, std::format("started {} of {} workers: {}", threads.size(), nthreads, e.what()));
			break;
		}
	}
	/* no thread could be started: drain the queue here */
	if (threads.empty()) worker();

	for (auto& t : threads) t.join();
	return results;
}

scan_summary summarize(const std::vector<enriched_result>& results) {
	const auto colo = static_cast<size_t>(
		std::count_if(results.begin(), results.end(), [](const enriched_result& r) { return r.status == colo_status::colo; }));
	const size_t total = results.size();
	return {colo, total, total > 0 ? static_cast<double>(colo) / static_cast<double>(total) * 100.0 : 0.0};
}
