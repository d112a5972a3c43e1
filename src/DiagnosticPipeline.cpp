#include "DiagnosticPipeline.h"

#include "AggregateReporter.h"
#include "PairedDeltaComputer.h"
#include "RunDiscovery.h"
#include "RunRecordBuilder.h"
#include "TableIO.h"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>

namespace envdiag {

namespace fs = std::filesystem;

namespace {
void ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw OutputError("cannot create directory " + dir.string() + ": " + ec.message());
    }
}

// A table left over from an earlier run would be read as current.
void removeStale(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw OutputError("cannot remove stale " + path + ": " + ec.message());
    }
}

// Two conditions may not share an output file.
void requireDistinctFiles(const std::vector<std::string>& conditions,
                          const std::function<std::string(const std::string&)>& fileFor) {
    std::map<std::string, std::string> owner;
    for (const auto& condition : conditions) {
        const std::string file = fileFor(condition);
        const auto it = owner.emplace(file, condition).first;
        if (it->second != condition) {
            throw ConfigError("conditions '" + it->second + "' and '" + condition +
                              "' both write " + file);
        }
    }
}

std::string enforcementFileName(const std::string& condition) {
    return "l2_enforcement_summary_" + conditionSuffix(condition) + ".csv";
}
} // namespace

DiagnosticPipeline::DiagnosticPipeline(const PipelineConfig& config)
    : config_(config) {}

std::string DiagnosticPipeline::summaryPath(const std::string& file) const {
    return (fs::path(config_.output_dir) / "summary" / file).string();
}

std::string DiagnosticPipeline::reportPath(const std::string& file) const {
    return (fs::path(config_.output_dir) / "reports" / file).string();
}

PipelineResult DiagnosticPipeline::run() const {
    PipelineResult result;
    result.catalog = EnvelopeCatalog::load(config_.conditions_path);
    requireDistinctFiles(config_.conditions, pairedTableName);
    requireDistinctFiles(result.catalog.constrainedConditions(), enforcementFileName);

    const auto locations = discoverRuns(config_.runs_dir, config_.verbose);

    RunRecordBuilder::Options build_opts;
    build_opts.verbose = config_.verbose;
    const RunRecordBuilder builder(result.catalog, build_opts);
    result.records = builder.buildAll(locations);

    ensureDirectory(fs::path(config_.output_dir) / "summary");
    ensureDirectory(fs::path(config_.output_dir) / "reports");

    const std::string runs_csv = summaryPath("summary_runs.csv");
    writeRunRecords(runs_csv, result.records);
    result.written.push_back(runs_csv);

    // Pairing
    const PairedDeltaComputer pairer;
    for (const auto& condition : config_.conditions) {
        if (result.paired.count(condition)) {
            continue;
        }
        const std::string path = summaryPath(pairedTableName(condition));
        PairedDeltaTable table;
        try {
            table = pairer.compute(result.records, condition);
        } catch (const EmptyPairingError& e) {
            std::cerr << "[WARN] skipping paired table for " << condition << ": " << e.what() << "\n";
            removeStale(path);
            continue;
        }
        writePairedDeltas(path, table);
        result.written.push_back(path);
        result.paired.emplace(condition, std::move(table));
    }

    // Aggregates
    const AggregateReporter reporter(result.catalog);
    result.enforcement = reporter.enforcementSummaries(result.records);
    for (const auto& condition : result.catalog.constrainedConditions()) {
        const std::string path = reportPath(enforcementFileName(condition));
        const auto it = std::find_if(result.enforcement.begin(), result.enforcement.end(),
                                     [&](const EnforcementSummary& s) { return s.condition == condition; });
        if (it == result.enforcement.end()) {
            removeStale(path);
            continue;
        }
        writeEnforcementSummary(path, *it);
        result.written.push_back(path);
    }

    result.tuning = reporter.tuningSensitivity(result.paired, result.records);
    const std::string tuning_path = reportPath("tuning_sensitivity_table.csv");
    if (result.tuning.empty()) {
        removeStale(tuning_path);
    } else {
        writeTuningSensitivity(tuning_path, result.tuning);
        result.written.push_back(tuning_path);
    }

    return result;
}

} // namespace envdiag
