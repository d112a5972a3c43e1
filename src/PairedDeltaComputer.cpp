#include "PairedDeltaComputer.h"

#include <cmath>
#include <map>
#include <utility>

namespace envdiag {

PairedDeltaComputer::PairedDeltaComputer(std::string baseline)
    : baseline_(std::move(baseline)) {}

double PairedDeltaComputer::snapToZero(double value, double threshold) {
    return std::fabs(value) < threshold ? 0.0 : value;
}

std::optional<double> PairedDeltaComputer::clampedDelta(const std::optional<double>& baseline,
                                                        const std::optional<double>& constrained) {
    if (!baseline || !constrained) {
        return std::nullopt;
    }
    return snapToZero(*constrained - *baseline);
}

PairedDeltaTable PairedDeltaComputer::compute(const RunRecordTable& records, const std::string& condition) const {
    std::vector<const RunRecord*> base;
    std::map<std::pair<std::string, int>, const RunRecord*> constrained;
    for (const auto& rec : records) {
        if (rec.id.condition == baseline_) {
            base.push_back(&rec);
        } else if (rec.id.condition == condition) {
            constrained.emplace(std::make_pair(rec.id.trace_id, rec.id.seed), &rec);
        }
    }

    if (constrained.empty()) {
        throw EmptyPairingError("no records for condition '" + condition + "'");
    }
    if (base.empty()) {
        throw EmptyPairingError("no '" + baseline_ + "' records to pair with '" + condition + "'");
    }

    PairedDeltaTable out;
    for (const RunRecord* b : base) {
        const auto it = constrained.find(std::make_pair(b->id.trace_id, b->id.seed));
        if (it == constrained.end()) {
            continue;
        }
        const RunRecord& c = *it->second;

        PairedDelta row;
        row.trace_id = b->id.trace_id;
        row.seed = b->id.seed;
        row.pattern_label = c.pattern_label;

        row.baseline_integrated_lufs = b->metrics.integrated_lufs;
        row.constrained_integrated_lufs = c.metrics.integrated_lufs;
        row.baseline_lra_lu = b->metrics.lra_lu;
        row.constrained_lra_lu = c.metrics.lra_lu;
        row.baseline_onset_density_eps = b->metrics.onset_density_eps;
        row.constrained_onset_density_eps = c.metrics.onset_density_eps;

        row.tempo_clamped = c.tempo.clamped;
        row.gain_clamped = c.gain.clamped;
        row.accent_clamped = c.accent.clamped;
        row.tempo_delta = c.tempo.delta;
        row.gain_delta = c.gain.delta;
        row.accent_delta = c.accent.delta;

        if (row.anyClamped()) {
            row.delta_integrated_lufs = clampedDelta(b->metrics.integrated_lufs, c.metrics.integrated_lufs);
            row.delta_lra_lu = clampedDelta(b->metrics.lra_lu, c.metrics.lra_lu);
            row.delta_onset_density_eps = clampedDelta(b->metrics.onset_density_eps, c.metrics.onset_density_eps);
        } else {
            // No clamp: generator drift is not attributed to the envelope.
            row.delta_integrated_lufs = 0.0;
            row.delta_lra_lu = 0.0;
            row.delta_onset_density_eps = 0.0;
        }
        out.push_back(std::move(row));
    }
    return out;
}

} // namespace envdiag
