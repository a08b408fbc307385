#include "testbed/coverage.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace testbed {

namespace {

double get_number(const nlohmann::json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return 0.0;
}

double istanbul_metric(const nlohmann::json& entry, const char* metric) {
    if (!entry.is_object() || !entry.contains(metric)) return 0.0;
    const auto& m = entry[metric];
    return coverage_percent(get_number(m, "covered"), get_number(m, "total"));
}

std::string relative_to(const std::string& path, const std::string& prefix) {
    if (prefix.empty() || path.rfind(prefix, 0) != 0) return path;
    std::string rel = path.substr(prefix.size());
    while (!rel.empty() && rel[0] == '/') rel.erase(0, 1);
    return rel.empty() ? path : rel;
}

} // namespace

double coverage_percent(double covered, double total) {
    if (!(total > 0.0)) return 0.0;
    double pct = covered / total * 100.0;
    return std::clamp(pct, 0.0, 100.0);
}

CoverageParseResult parse_istanbul_summary(const std::string& json,
                                           const std::string& strip_prefix) {
    CoverageParseResult result;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object() || !j.contains("total") || !j["total"].is_object()) {
            result.error = "coverage summary has no \"total\" entry";
            return result;
        }

        const auto& total = j["total"];
        result.coverage.lines = istanbul_metric(total, "lines");
        result.coverage.statements = istanbul_metric(total, "statements");
        result.coverage.branches = istanbul_metric(total, "branches");
        result.coverage.functions = istanbul_metric(total, "functions");

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key() == "total" || !it.value().is_object()) continue;
            result.coverage.files[relative_to(it.key(), strip_prefix)] =
                istanbul_metric(it.value(), "lines");
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("invalid coverage summary: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

CoverageParseResult parse_coverage_py(const std::string& json) {
    CoverageParseResult result;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object() || !j.contains("totals") || !j["totals"].is_object()) {
            result.error = "coverage report has no \"totals\" entry";
            return result;
        }

        const auto& totals = j["totals"];
        double lines = coverage_percent(get_number(totals, "covered_lines"),
                                        get_number(totals, "num_statements"));
        result.coverage.lines = lines;
        result.coverage.statements = lines;
        result.coverage.branches = coverage_percent(get_number(totals, "covered_branches"),
                                                    get_number(totals, "num_branches"));

        if (j.contains("files") && j["files"].is_object()) {
            for (auto it = j["files"].begin(); it != j["files"].end(); ++it) {
                if (!it.value().is_object() || !it.value().contains("summary")) continue;
                const auto& summary = it.value()["summary"];
                result.coverage.files[it.key()] = coverage_percent(
                    get_number(summary, "covered_lines"), get_number(summary, "num_statements"));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("invalid coverage report: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace testbed
