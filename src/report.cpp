#include "report.hpp"
#include "logger.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

using namespace boost;

namespace {
	void pretty_print(std::ostream& os, const json::value& jv, std::string& indent) {
		switch (jv.kind()) {
			case json::kind::object: {
				const auto& obj = jv.get_object();
				if (obj.empty()) {
					os << "{}";
					break;
				}
				os << "{\n";
				indent.append(2, ' ');
				for (auto it = obj.begin(); it != obj.end(); ++it) {
					if (it != obj.begin()) os << ",\n";
					os << indent << json::serialize(it->key()) << ": ";
					pretty_print(os, it->value(), indent);
				}
				indent.resize(indent.size() - 2);
				os << '\n' << indent << '}';
				break;
			}
			case json::kind::array: {
				const auto& arr = jv.get_array();
				if (arr.empty()) {
					os << "[]";
					break;
				}
				os << "[\n";
				indent.append(2, ' ');
				for (auto it = arr.begin(); it != arr.end(); ++it) {
					if (it != arr.begin()) os << ",\n";
					os << indent;
					pretty_print(os, *it, indent);
				}
				indent.resize(indent.size() - 2);
				os << '\n' << indent << ']';
				break;
			}
			/* shortest round-trip form, serialize() would print 1.05E1 */
			case json::kind::double_: os << std::format("{}", jv.get_double()); break;
			default: os << json::serialize(jv); break;
		}
	}

	/* 12 -> "12.0", 12.5 -> "12.5" */
	std::string format_threshold(double threshold) {
		std::string s = std::format("{}", threshold);
		if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
		return s;
	}

	std::string_view row_class(colo_status s) {
		switch (s) {
			case colo_status::colo: return "colo";
			case colo_status::slow: return "slow";
			case colo_status::fail: return "fail";
		}
		return "fail";
	}

	std::ofstream open_report(const std::string& path) {
		const std::filesystem::path p(path);
		if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
		std::ofstream out;
		out.exceptions(std::ios::failbit | std::ios::badbit);
		out.open(path, std::ios::trunc);
		return out;
	}

	constexpr std::string_view html_head = R"(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>Co-location Report</title>
    <link rel="stylesheet" href="https://cdn.datatables.net/1.13.6/css/jquery.dataTables.min.css">
    <style>
        body { font-family: Arial, sans-serif; margin: 2em; background: #1a1a1a; color: #eee; }
        table { background: #2d2d2d; width: 100%; }
        th { background: #007acc; color: white; }
        td { padding: 8px; border-bottom: 1px solid #444; }
        .colo { background: #0f5132 !important; color: #d4edda; font-weight: bold; }
        .slow { background: #664d03 !important; color: #fff3cd; }
        .fail { background: #842029 !important; color: #f8d7da; }
        .summary { margin: 1em 0 2em 0; padding: 1em; background: #2d2d2d; border-radius: 5px; }
    </style>
</head>
<body>
)";

	constexpr std::string_view html_tail = R"(        </tbody>
    </table>
    <script src="https://code.jquery.com/jquery-3.7.1.min.js"></script>
    <script src="https://cdn.datatables.net/1.13.6/js/jquery.dataTables.min.js"></script>
    <script>
        $(() => $('#t').DataTable({
            "pageLength": 100,
            "order": [[4, "asc"]]
        }));
    </script>
</body>
</html>
)";
}

json::array results_to_json(const std::vector<enriched_result>& results) {
	json::array out;
	out.reserve(results.size());
	for (const auto& r : results) {
		out.push_back(json::object{
			{"Constant", r.constant},
			{"Category", r.category},
			{"Domain", r.domain},
			{"IP", r.ip},
			{"Latency_ms", r.latency_ms},
			{"Status", std::string(to_string(r.status))},
			{"AWS_Region", r.aws_region},
			{"Country", r.country},
			{"Region", r.region},
			{"City", r.city}
		});
	}
	return out;
}

std::string pretty_json(const json::value& v) {
	std::ostringstream os;
	std::string		   indent;
	pretty_print(os, v, indent);
	os << '\n';
	return os.str();
}

std::string html_escape(std::string_view s) {
	std::string out;
	out.reserve(s.size());
	for (char c : s) {
		switch (c) {
			case '&': out += "&amp;"; break;
			case '<': out += "&lt;"; break;
			case '>': out += "&gt;"; break;
			case '"': out += "&quot;"; break;
			case '\'': out += "&#39;"; break;
			default: out += c; break;
		}
	}
	return out;
}

std::string render_html(const std::vector<enriched_result>& results, double threshold, std::string_view timestamp) {
	const scan_summary summary = summarize(results);

	std::vector<const enriched_result*> rows;
	rows.reserve(results.size());
	for (const auto& r : results) rows.push_back(&r);
	std::stable_sort(rows.begin(), rows.end(),
					 [](const enriched_result* a, const enriched_result* b) { return a->latency_ms < b->latency_ms; });

	std::string html(html_head);
	html += std::format("    <h1>Latency Report &ndash; {}</h1>\n", html_escape(timestamp));
	html += std::format("    <div class=\"summary\">\n        <p><strong>{}</strong> / <strong>{}</strong> IPs under {} ms &rarr; "
						"<strong>{:.1f}% CO-LOCATED</strong></p>\n    </div>\n",
						summary.colo_count, summary.total_count, format_threshold(threshold), summary.colo_percentage);
	html += R"(    <table id="t">
        <thead>
            <tr>
                <th>Constant</th>
                <th>Category</th>
                <th>Domain</th>
                <th>IP</th>
                <th>Latency (ms)</th>
                <th>Status</th>
                <th>AWS Region</th>
                <th>Country</th>
                <th>City</th>
            </tr>
        </thead>
        <tbody>
)";
	for (const enriched_result* r : rows) {
		html += std::format("            <tr class=\"{}\">", row_class(r->status));
		for (const std::string_view cell : {std::string_view(r->constant), std::string_view(r->category),
											std::string_view(r->domain), std::string_view(r->ip)})
			html += "<td>" + html_escape(cell) + "</td>";
		html += std::format("<td>{:.2f}</td><td>{}</td>", r->latency_ms, to_string(r->status));
		for (const std::string_view cell : {std::string_view(r->aws_region), std::string_view(r->country), std::string_view(r->city)})
			html += "<td>" + html_escape(cell) + "</td>";
		html += "</tr>\n";
	}
	html += html_tail;
	return html;
}

void write_json(const std::vector<enriched_result>& results, const std::string& path) {
	std::ofstream out = open_report(path);
	out << pretty_json(results_to_json(results));
}

void write_html(const std::vector<enriched_result>& results, double threshold, const std::string& path) {
	std::ofstream out = open_report(path);
	out << render_html(results, threshold, local_time("%Y-%m-%d %H:%M"));
}
