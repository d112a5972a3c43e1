#pragma once

#include <optional>
#include <string>

#include "DiagnosticTypes.h"

namespace envdiag {

// Joins baseline and one constrained condition on (trace_id, seed) and derives
// acoustic deltas (constrained - baseline).
//
// Noise-suppression policy: a pair whose constrained run clamped nothing gets
// all three deltas forced to exactly 0.0. When a clamp fired, deltas with
// magnitude below kDeltaSnapThreshold are snapped to 0.0.
class PairedDeltaComputer {
public:
    explicit PairedDeltaComputer(std::string baseline = kBaselineCondition);

    // Inner join, baseline record order. Throws EmptyPairingError when either
    // side has no rows.
    PairedDeltaTable compute(const RunRecordTable& records, const std::string& condition) const;

    static std::optional<double> clampedDelta(const std::optional<double>& baseline,
                                              const std::optional<double>& constrained);
    static double snapToZero(double value, double threshold = kDeltaSnapThreshold);

private:
    std::string baseline_;
};

} // namespace envdiag
