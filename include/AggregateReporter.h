#pragma once

#include <map>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"
#include "EnvelopeCatalog.h"

namespace envdiag {

class AggregateReporter {
public:
    explicit AggregateReporter(const EnvelopeCatalog& catalog);

    // One summary per constrained condition (envelope registered, not the
    // baseline) that has at least one record, in condition-name order.
    std::vector<EnforcementSummary> enforcementSummaries(const RunRecordTable& records) const;

    // Rates and shift statistics for one condition. Rows of other conditions
    // are ignored; an empty subset yields all-zero rates and statistics.
    EnforcementSummary summarizeCondition(const RunRecordTable& records, const std::string& condition) const;

    // One row per entry whose paired table is non-empty, in key order.
    // clamp_rate_any uses every record of the condition, paired or not.
    std::vector<TuningSensitivityRow> tuningSensitivity(
        const std::map<std::string, PairedDeltaTable>& paired,
        const RunRecordTable& records) const;

private:
    const EnvelopeCatalog& catalog_;
};

} // namespace envdiag
