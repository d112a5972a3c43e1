#pragma once

#include <map>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"
#include "EnvelopeCatalog.h"

namespace envdiag {

struct PipelineConfig {
    std::string runs_dir = "runs";
    std::string conditions_path = "conditions.yaml";
    std::string output_dir = ".";
    std::vector<std::string> conditions{
        "constrained_default",
        "constrained_tight",
        "constrained_relaxed",
    };
    bool verbose = false;
};

struct PipelineResult {
    EnvelopeCatalog catalog;
    RunRecordTable records;
    std::map<std::string, PairedDeltaTable> paired;
    std::vector<EnforcementSummary> enforcement;
    std::vector<TuningSensitivityRow> tuning;
    std::vector<std::string> written;  // every file produced, in write order
};

class DiagnosticPipeline {
public:
    explicit DiagnosticPipeline(const PipelineConfig& config);

    // One full pass: catalog, discovery, records, pairing, aggregates.
    // Outputs under <output_dir>/summary and <output_dir>/reports are
    // overwritten. Throws DiagnosticError on fatal input or output errors.
    PipelineResult run() const;

private:
    PipelineConfig config_{};

    std::string summaryPath(const std::string& file) const;
    std::string reportPath(const std::string& file) const;
};

} // namespace envdiag
