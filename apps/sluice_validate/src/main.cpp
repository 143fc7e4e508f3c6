// apps/sluice_validate/src/main.cpp
// sluice_validate: dry-run a filter against a provider catalog without fetching anything.
//
// Usage:
//   ./sluice_validate <config.json> <data_type> [KEY,KEY,...] [--sector S] [--from YYYY-MM-DD]
//                     [--to YYYY-MM-DD] [--granularity g] [--analysis a] [--realtime]
//
// Prints the classification, eligible providers in routing order, warnings and suggestions.

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sluice/config/config_loader.hpp"
#include "sluice/routing/collector_router.hpp"

namespace {

using namespace sluice;

std::vector<std::string> split_keys(std::string_view csv) {
    std::vector<std::string> out;
    while (!csv.empty()) {
        const auto comma = csv.find(',');
        const auto part = csv.substr(0, comma);
        if (!part.empty()) out.emplace_back(part);
        if (comma == std::string_view::npos) break;
        csv.remove_prefix(comma + 1);
    }
    return out;
}

std::optional<core::TimePoint> parse_date(std::string_view s) {
    int y = 0;
    unsigned m = 0, d = 0;
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (std::from_chars(s.data(), s.data() + 4, y).ec != std::errc{}) return std::nullopt;
    if (std::from_chars(s.data() + 5, s.data() + 7, m).ec != std::errc{}) return std::nullopt;
    if (std::from_chars(s.data() + 8, s.data() + 10, d).ec != std::errc{}) return std::nullopt;
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days{ymd};
}

int usage() {
    std::cerr << "usage: sluice_validate <config.json> <data_type> [KEY,KEY,...] [--sector S]\n"
                 "                       [--from YYYY-MM-DD] [--to YYYY-MM-DD] [--granularity g]\n"
                 "                       [--analysis a] [--realtime]\n";
    return EXIT_FAILURE;
}

std::string describe(const core::FilterCriteria& f) {
    std::string s{core::to_string(f.data_type)};
    s += " entities=" + std::to_string(f.entity_keys.size());
    if (f.sector) s += " sector=" + *f.sector;
    if (f.from || f.to) s += " dated";
    if (f.analysis != core::AnalysisType::Any) s += " analysis=" + std::string(core::to_string(f.analysis));
    return s;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) return usage();

    auto loaded = config::Loader::load_from_file(argv[1]);
    if (!loaded) {
        std::cerr << "config error [" << config::to_string(loaded.error().code) << "] "
                  << loaded.error().where << ": " << loaded.error().message << '\n';
        return EXIT_FAILURE;
    }

    core::DataRequest req;
    req.request_id = "validate";
    auto type = core::parse_data_type(argv[2]);
    if (!type) {
        std::cerr << "unknown data type: " << argv[2] << '\n';
        return usage();
    }
    req.criteria.data_type = *type;

    for (int i = 3; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = (i + 1 < argc);
        if (arg == "--realtime") {
            req.criteria.real_time = true;
        } else if (arg == "--sector" && has_value) {
            req.criteria.sector = argv[++i];
        } else if ((arg == "--from" || arg == "--to") && has_value) {
            auto when = parse_date(argv[++i]);
            if (!when) { std::cerr << "bad date: " << argv[i] << '\n'; return usage(); }
            (arg == "--from" ? req.criteria.from : req.criteria.to) = when;
        } else if (arg == "--granularity" && has_value) {
            auto g = core::parse_granularity(argv[++i]);
            if (!g) { std::cerr << "unknown granularity: " << argv[i] << '\n'; return usage(); }
            req.criteria.granularity = *g;
        } else if (arg == "--analysis" && has_value) {
            auto a = core::parse_analysis_type(argv[++i]);
            if (!a) { std::cerr << "unknown analysis type: " << argv[i] << '\n'; return usage(); }
            req.criteria.analysis = *a;
        } else if (!arg.starts_with("--")) {
            req.criteria.entity_keys = split_keys(arg);
        } else {
            return usage();
        }
    }

    auto catalog = std::make_shared<routing::ProviderCatalog>();
    if (auto rc = catalog->reload(config::make_descriptors(*loaded)); rc != routing::CatalogErr::Ok) {
        std::cerr << "catalog rejected: " << routing::to_string(rc) << '\n';
        return EXIT_FAILURE;
    }
    routing::CollectorRouter router(catalog);
    const auto report = router.validate(req);

    std::cout << "request:   " << describe(req.criteria) << '\n'
              << "type:      " << routing::to_string(report.request_type) << '\n'
              << "valid:     " << (report.valid ? "yes" : "no") << '\n'
              << "providers:";
    for (const auto& id : report.eligible) std::cout << ' ' << id;
    std::cout << '\n';
    for (const auto& w : report.warnings) std::cout << "warning:   " << w << '\n';
    for (const auto& s : report.suggestions) {
        std::cout << "suggest:   [" << routing::to_string(s.kind) << "] " << s.message
                  << "\n           -> " << describe(s.proposed) << '\n';
    }
    return report.valid ? EXIT_SUCCESS : 2;
}
