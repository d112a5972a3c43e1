#include "AggregateReporter.h"

#include "Statistics.h"

#include <cmath>
#include <functional>

namespace envdiag {

namespace {

using RecordSubset = std::vector<const RunRecord*>;

RecordSubset subsetFor(const RunRecordTable& records, const std::string& condition) {
    RecordSubset out;
    for (const auto& rec : records) {
        if (rec.id.condition == condition) {
            out.push_back(&rec);
        }
    }
    return out;
}

// Unknown flags count as false but stay in the denominator.
double rate(const RecordSubset& rows, const std::function<std::optional<bool>(const RunRecord&)>& flag) {
    if (rows.empty()) {
        return 0.0;
    }
    std::size_t hits = 0;
    for (const RunRecord* r : rows) {
        const auto v = flag(*r);
        if (v && *v) {
            ++hits;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(rows.size());
}

ShiftStats shiftStats(const RecordSubset& rows, const std::function<double(const RunRecord&)>& delta) {
    std::vector<double> values;
    values.reserve(rows.size());
    for (const RunRecord* r : rows) {
        const double d = delta(*r);
        if (std::isfinite(d)) {
            values.push_back(std::fabs(d));
        }
    }
    ShiftStats s{};
    if (values.empty()) {
        return s;
    }
    s.mean = stats::mean(values);
    s.p95 = stats::percentile(values, 0.95);
    s.max = stats::maxValue(values);
    return s;
}

ParamEnforcement enforcementFor(const RecordSubset& rows, ParamAudit RunRecord::*member) {
    ParamEnforcement e{};
    e.requested_oob_rate = rate(rows, [member](const RunRecord& r) { return (r.*member).requested_oob; });
    e.clamp_rate = rate(rows, [member](const RunRecord& r) { return std::optional<bool>((r.*member).clamped); });
    e.shift = shiftStats(rows, [member](const RunRecord& r) { return (r.*member).delta; });
    e.effective_oob_rate = rate(rows, [member](const RunRecord& r) { return (r.*member).effective_oob; });
    return e;
}

std::vector<double> presentValues(const PairedDeltaTable& table,
                                  std::optional<double> PairedDelta::*member) {
    std::vector<double> out;
    out.reserve(table.size());
    for (const auto& row : table) {
        const auto& v = row.*member;
        if (v) {
            out.push_back(*v);
        }
    }
    return out;
}

} // namespace

AggregateReporter::AggregateReporter(const EnvelopeCatalog& catalog)
    : catalog_(catalog) {}

EnforcementSummary AggregateReporter::summarizeCondition(const RunRecordTable& records,
                                                         const std::string& condition) const {
    const RecordSubset rows = subsetFor(records, condition);

    EnforcementSummary s;
    s.condition = condition;
    if (const Envelope* env = catalog_.envelopeFor(condition)) {
        s.config_hash = env->config_hash;
    }
    s.tempo = enforcementFor(rows, &RunRecord::tempo);
    s.gain = enforcementFor(rows, &RunRecord::gain);
    s.accent = enforcementFor(rows, &RunRecord::accent);
    return s;
}

std::vector<EnforcementSummary> AggregateReporter::enforcementSummaries(const RunRecordTable& records) const {
    std::vector<EnforcementSummary> out;
    for (const auto& condition : catalog_.constrainedConditions()) {
        if (subsetFor(records, condition).empty()) {
            continue;
        }
        out.push_back(summarizeCondition(records, condition));
    }
    return out;
}

std::vector<TuningSensitivityRow> AggregateReporter::tuningSensitivity(
    const std::map<std::string, PairedDeltaTable>& paired,
    const RunRecordTable& records) const {
    std::vector<TuningSensitivityRow> out;
    for (const auto& kv : paired) {
        const PairedDeltaTable& table = kv.second;
        if (table.empty()) {
            continue;
        }

        const RecordSubset rows = subsetFor(records, kv.first);
        TuningSensitivityRow row;
        row.condition = kv.first;
        row.clamp_rate_any = rate(rows, [](const RunRecord& r) { return std::optional<bool>(r.anyClamped()); });

        const auto lra = presentValues(table, &PairedDelta::delta_lra_lu);
        const auto lufs = presentValues(table, &PairedDelta::delta_integrated_lufs);
        if (!lra.empty()) {
            row.delta_lra_lu_p95 = stats::percentile(lra, 0.95);
            row.delta_lra_lu_max = stats::maxValue(lra);
        }
        if (!lufs.empty()) {
            row.delta_integrated_lufs_p95 = stats::percentile(lufs, 0.95);
            row.delta_integrated_lufs_max = stats::maxValue(lufs);
        }
        out.push_back(row);
    }
    return out;
}

} // namespace envdiag
