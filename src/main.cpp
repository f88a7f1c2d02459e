#include "dns.hpp"
#include "endpoints.hpp"
#include "geodata.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "scan.hpp"
#include <boost/program_options.hpp>
#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace {
	struct cli_config {
		std::string url_file;
		std::string output_json;
		std::string output_html;
		std::string log_file;
		std::string geo_db;
		scan_options scan;
	};

	std::optional<cli_config> parse_args(int argc, char* argv[]) {
		cli_config	cfg;
		int			workers;
		uint32_t	timeout_ms;
		po::options_description options("Options");
		options.add_options()
			("help,h", "Show this help")
			("url-file", po::value(&cfg.url_file)->default_value("data/binance_url.txt"), "Endpoint definition file")
			("output-json", po::value(&cfg.output_json)->default_value("results/latency_results.json"), "JSON output path")
			("output-html", po::value(&cfg.output_html)->default_value("results/latency_results.html"), "HTML output path")
			("workers", po::value(&workers)->default_value(80), "Number of concurrent workers")
			("threshold", po::value(&cfg.scan.threshold)->default_value(12.0), "Co-location latency threshold in ms")
			("log-file", po::value(&cfg.log_file)->default_value("results/latency.log"), "Log file path")
			("port", po::value(&cfg.scan.port)->default_value(443), "TLS port to probe")
			("timeout", po::value(&timeout_ms)->default_value(4000), "Connect + handshake timeout in ms")
			("geo-timeout", po::value(&cfg.scan.geo_timeout)->default_value(5), "Geolocation request timeout in seconds")
			("geo-url", po::value(&cfg.scan.geo_url)->default_value(std::string(ipwhois_url)), "Geolocation service base URL")
			("geo-db", po::value(&cfg.geo_db), "MaxMind database to geolocate from instead of the HTTP service");

		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, options), vm);
		if (vm.count("help")) {
			std::cout << "Usage: " << argv[0] << " [options]\n" << options << '\n';
			return std::nullopt;
		}
		po::notify(vm);

		if (workers < 1) throw std::invalid_argument("--workers must be at least 1");
		if (!(cfg.scan.threshold > 0)) throw std::invalid_argument("--threshold must be positive");
		cfg.scan.workers		  = static_cast<size_t>(workers);
		cfg.scan.probe_timeout_ms = timeout_ms;
		return cfg;
	}

	void print_progress(size_t done, size_t total) {
		std::lock_guard<std::mutex> lk(stdout_mtx);
		std::cerr << "\rTLS + Geo: " << done << '/' << total << std::flush;
		if (done == total) std::cerr << '\n';
	}

	std::ofstream open_log(const std::string& path) {
		const std::filesystem::path p(path);
		if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
		std::ofstream log(path, std::ios::app);
		if (!log) throw std::runtime_error("cannot open log file " + path);
		return log;
	}

	/* curl_global_init is not thread-safe: run it before any worker starts */
	class curl_global {
	  public:
		curl_global() {
			if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		}
		~curl_global() { curl_global_cleanup(); }

		curl_global(const curl_global&)			   = delete;
		curl_global& operator=(const curl_global&) = delete;
	};
}

int main(int argc, char* argv[]) {
	std::optional<cli_config> parsed;
	try {
		parsed = parse_args(argc, argv);
	} catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << '\n';
		return 1;
	}
	if (!parsed) return 0;
	const cli_config& cfg = *parsed;

	try {
		std::ofstream log = open_log(cfg.log_file);

		if (!std::filesystem::exists(cfg.url_file)) {
			std::cerr << "Error: URL file not found: " << cfg.url_file << '\n';
			return 1;
		}

		std::cout << "Loading endpoints..." << std::endl;
		const std::vector<endpoint> endpoints = load_endpoints(cfg.url_file);
		std::cout << "Found " << endpoints.size() << " endpoints" << std::endl;
		log_line(log, std::format("loaded {} endpoints from {}", endpoints.size(), cfg.url_file));

#ifdef MMDB_SUPPORTED
		std::unique_ptr<mmdb_handle> db;
		if (!cfg.geo_db.empty()) db = std::make_unique<mmdb_handle>(cfg.geo_db);
#else
		if (!cfg.geo_db.empty()) throw std::runtime_error("--geo-db is not supported on this platform");
#endif

		curl_global curl;

		std::cout << "Resolving DNS..." << std::endl;
		domain_cache cache;
		resolve_domains(endpoints, cache, log);
		const std::vector<resolved_target> targets = expand_targets(endpoints, cache);

		std::cout << "\nTesting TLS handshake + geo + AWS region on " << targets.size() << " IPs..." << std::endl;
#ifdef MMDB_SUPPORTED
		const scan_hooks hooks = db ? mmdb_hooks(cfg.scan, *db) : default_hooks(cfg.scan);
#else
		const scan_hooks hooks = default_hooks(cfg.scan);
#endif
		const std::vector<enriched_result> results = run_scan(targets, cfg.scan, hooks, log, print_progress);

		std::cout << "\nSaving results..." << std::endl;
		write_json(results, cfg.output_json);
		write_html(results, cfg.scan.threshold, cfg.output_html);

		const scan_summary summary = summarize(results);
		const std::string  done	   = std::format("DONE! {}/{} IPs are COLO ({:.1f}%)", summary.colo_count, summary.total_count,
												 summary.colo_percentage);
		log_line(log, done);
		std::cout << '\n' << done << '\n'
				  << "JSON: " << cfg.output_json << '\n'
				  << "HTML: " << cfg.output_html << std::endl;
	} catch (const std::exception& e) {
		std::lock_guard<std::mutex> lk(stdout_mtx);
		std::cerr << "Error: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
