#pragma once

// PanelDataset.h
//
// Pre-computed inputs for the diagnostic figure (2x3 panel layout):
//   row 1, L2 parameter layer: baseline vs constrained effective value for
//          tempo / gain / accent, with clamp side and envelope bounds.
//   row 2, L1 signal layer: paired delta distributions for onset density,
//          integrated loudness and loudness range.
// Built from the persisted run and paired tables. Drawing is left to the
// renderer.

#include <cstddef>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"
#include "EnvelopeCatalog.h"
#include "TableIO.h"

namespace envdiag {

// Distance from a bound within which a clamped value counts as pinned to it.
inline constexpr double kClampSideTolerance = 0.01;

enum class ClampSide { None, Min, Max };

struct PanelPoint {
    std::string trace_id;
    int seed = 0;
    std::string parameter;  // tempo | gain | accent
    double baseline = 0.0;
    double constrained = 0.0;
    bool clamped = false;
    ClampSide side = ClampSide::None;
};

struct ParamPanelStats {
    std::string parameter;
    std::size_t n_total = 0;
    std::size_t n_clamped = 0;
    std::size_t n_clamped_max = 0;
    std::size_t n_clamped_min = 0;
    double clamp_rate = 0.0;
    ParamBounds bounds{};
};

struct DeltaPanelStats {
    std::string metric;  // onset | lufs | lra
    std::size_t n = 0;
    double median = 0.0;
    double mean = 0.0;
    double iqr = 0.0;
};

struct PanelDataset {
    std::string condition;
    std::vector<PanelPoint> points;
    std::vector<ParamPanelStats> params;  // tempo, gain, accent
    std::vector<DeltaPanelStats> deltas;  // onset, lufs, lra

    const ParamPanelStats* param(const std::string& name) const;
    const DeltaPanelStats* delta(const std::string& name) const;
};

// Throws ConfigError for a missing table or envelope, EmptyPairingError when
// the condition has no L2 pairs or the paired table is empty.
PanelDataset buildPanelDataset(const CsvTable& summary,
                               const CsvTable& paired,
                               const std::string& condition,
                               const EnvelopeCatalog& catalog);

PanelDataset loadPanelDataset(const std::string& summary_csv,
                              const std::string& paired_csv,
                              const std::string& condition,
                              const std::string& conditions_path);

ClampSide classifyClamp(bool clamped, double value, const ParamBounds& bounds);
const char* clampSideName(ClampSide side);

void writePanelPoints(const std::string& path, const PanelDataset& data);
void writePanelStats(const std::string& path, const PanelDataset& data);

} // namespace envdiag
