#include "RunDiscovery.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>

namespace envdiag {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> sortedSubdirectories(const fs::path& dir) {
    std::vector<fs::path> out;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::error_code ec;
        if (!entry.is_directory(ec)) {
            continue;
        }
        out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<int> parseSeed(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(name.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(v);
}

} // namespace

std::vector<RunLocation> discoverRuns(const std::string& root, bool verbose) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw ConfigError("run root not found: " + root);
    }

    std::vector<RunLocation> runs;
    try {
        for (const auto& cond_path : sortedSubdirectories(root)) {
            for (const auto& trace_path : sortedSubdirectories(cond_path)) {
                for (const auto& seed_path : sortedSubdirectories(trace_path)) {
                    const std::string seed_name = seed_path.filename().string();
                    const auto seed = parseSeed(seed_name);
                    if (!seed) {
                        if (verbose) {
                            std::cerr << "[skip] " << seed_path.string() << ": seed is not an integer\n";
                        }
                        continue;
                    }

                    RunLocation loc;
                    loc.id.condition = cond_path.filename().string();
                    loc.id.trace_id = trace_path.filename().string();
                    loc.id.seed = *seed;
                    loc.path = seed_path.string();
                    runs.push_back(std::move(loc));
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw ConfigError(std::string("cannot scan run root: ") + e.what());
    }

    // Directory order sorts "10" before "9"; order by numeric seed instead.
    std::stable_sort(runs.begin(), runs.end(), [](const RunLocation& a, const RunLocation& b) {
        if (a.id.condition != b.id.condition) return a.id.condition < b.id.condition;
        if (a.id.trace_id != b.id.trace_id) return a.id.trace_id < b.id.trace_id;
        return a.id.seed < b.id.seed;
    });
    return runs;
}

} // namespace envdiag
