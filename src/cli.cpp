//
//  cli.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cli.hpp"

#include <ostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "qovcheck.hpp"
#include "qovcheck_version.hpp"
#include "report_format.hpp"
#include "report_json.hpp"
#include <nlohmann/json.hpp>

namespace qovcheck {

namespace {

void print_usage(std::ostream &err) {
    err << "QovCheck " << QOVCHECK_VERSION_DISPLAY << "\n"
        << "Copyright (c) 2025 Till Toenshoff\n\n"
        << "usage for validating:\n"
        << "  qovcheck <file.qov> [--verbose] [--hex] [--json] "
        << "[--log-level warn|info|debug]\n"
        << "usage for comparing:\n"
        << "  qovcheck <a.qov> <b.qov> [--json] [--log-level warn|info|debug]\n"
        << "Options:\n"
        << "  --verbose, -v       List every scanned chunk.\n"
        << "  --hex               Dump the 24 header bytes.\n"
        << "  --json              Write the result as JSON to stdout.\n"
        << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

int run_validate(const std::string &path, const TextOptions &text, bool json, std::ostream &out,
                 std::ostream &err) {
    auto fa = analyze_file(path);
    if (!fa.status.ok) {
        QC_LOG("error", "qovcheck: " << fa.status.message);
        err << "File not found or unreadable: " << path << "\n";
        return kExitFailed;
    }
    if (json) {
        out << dump_json(analysis_to_json(path, fa.file_size, fa.result)) << "\n";
    } else {
        out << format_analysis(path, fa.file_size, fa.header_bytes, fa.result, text);
    }
    return fa.result.valid() ? kExitOk : kExitFailed;
}

int run_compare(const std::string &path_a, const std::string &path_b, bool json,
                std::ostream &out, std::ostream &err) {
    ComparisonReport report;
    FileAnalysis a;
    FileAnalysis b;
    auto status = compare_files(path_a, path_b, report, a, b);
    if (!status.ok) {
        QC_LOG("error", "qovcheck: comparison failed: " << status.message);
        err << "Comparison failed: " << status.message << "\n";
        return kExitFailed;
    }
    if (json) {
        nlohmann::json j;
        j["a"] = analysis_to_json(path_a, a.file_size, a.result);
        j["b"] = analysis_to_json(path_b, b.file_size, b.result);
        j["comparison"] = report;
        out << dump_json(j) << "\n";
    } else {
        out << format_comparison(path_a, path_b, a.result, b.result, report);
    }
    return report.matches() ? kExitOk : kExitFailed;
}

}  // namespace

int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.size() == 1 && args[0] == "--version") {
        out << "QovCheck " << QOVCHECK_VERSION_DISPLAY << "\n";
        return kExitOk;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    TextOptions text;
    bool json = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "--verbose" || arg == "-v") {
            text.verbose = true;
        } else if (arg == "--hex") {
            text.hex_dump = true;
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--log-level" && i + 1 < args.size()) {
            set_log_verbosity(parse_log_verbosity(args[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            err << "Unknown option: " << arg << "\n";
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() == 1) {
        return run_validate(positional[0], text, json, out, err);
    }
    if (positional.size() == 2) {
        return run_compare(positional[0], positional[1], json, out, err);
    }
    print_usage(err);
    return kExitUsage;
}

}  // namespace qovcheck
