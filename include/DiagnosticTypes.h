#pragma once

// DiagnosticTypes.h
//
// Shared value types for the envelope enforcement diagnostic pipeline.
// Every stage consumes and produces these by value; nothing here is mutated
// after construction.

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace envdiag {

// Reference condition every constrained condition is paired against.
inline constexpr const char* kBaselineCondition = "baseline";

// Noise floor for paired acoustic deltas when a clamp did fire.
inline constexpr double kDeltaSnapThreshold = 1e-6;

// ============================================================
// Errors
// ============================================================

class DiagnosticError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Required top-level input absent or malformed (conditions config, run root,
// persisted tables a downstream stage depends on).
class ConfigError : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

// A per-run artifact exists but its required content is malformed.
class ArtifactError : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

// Nothing to pair for a condition.
class EmptyPairingError : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

// An output table could not be written.
class OutputError : public DiagnosticError {
public:
    using DiagnosticError::DiagnosticError;
};

// ============================================================
// Envelope
// ============================================================

struct ParamBounds {
    double min = 0.0;
    double max = 0.0;

    bool outOfBounds(double value) const { return value < min || value > max; }
};

struct Envelope {
    std::string condition;
    std::optional<ParamBounds> tempo_bpm;
    std::optional<ParamBounds> gain;
    std::optional<ParamBounds> accent_ratio;

    // Optional extras: dB-domain gain bounds (renderer only) and the
    // envelope's own config hash.
    std::optional<ParamBounds> gain_db;
    std::optional<std::string> config_hash;
};

// ============================================================
// Run identity
// ============================================================

struct RunIdentity {
    std::string condition;
    std::string trace_id;
    int seed = 0;
};

struct RunLocation {
    RunIdentity id;
    std::string path;
};

// ============================================================
// Run record
// ============================================================

struct ParamAudit {
    double requested = 0.0;
    double effective = 0.0;
    // Empty when no bounds are registered for the condition/parameter.
    std::optional<bool> requested_oob;
    std::optional<bool> effective_oob;
    bool clamped = false;
    double delta = 0.0;
};

struct AcousticMetrics {
    std::optional<double> integrated_lufs;
    std::optional<double> lra_lu;
    std::optional<double> onset_density_eps;
    std::optional<double> peak_lufs;
    std::optional<std::string> audio_path;
};

struct RunRecord {
    RunIdentity id;
    std::optional<std::string> pattern_label;
    std::optional<std::string> config_hash;

    ParamAudit tempo;
    ParamAudit gain;   // requested/effective in dB; OOB evaluated on raw gain
    ParamAudit accent;

    std::optional<std::string> gain_unit;
    double accent_pct_requested = 0.0;
    double accent_pct_effective = 0.0;

    AcousticMetrics metrics;
    std::optional<std::string> session_report_path;

    bool anyClamped() const { return tempo.clamped || gain.clamped || accent.clamped; }
};

// ============================================================
// Derived tables
// ============================================================

struct PairedDelta {
    std::string trace_id;
    int seed = 0;
    std::optional<std::string> pattern_label;

    std::optional<double> baseline_integrated_lufs;
    std::optional<double> constrained_integrated_lufs;
    std::optional<double> delta_integrated_lufs;

    std::optional<double> baseline_lra_lu;
    std::optional<double> constrained_lra_lu;
    std::optional<double> delta_lra_lu;

    std::optional<double> baseline_onset_density_eps;
    std::optional<double> constrained_onset_density_eps;
    std::optional<double> delta_onset_density_eps;

    bool tempo_clamped = false;
    bool gain_clamped = false;
    bool accent_clamped = false;
    double tempo_delta = 0.0;
    double gain_delta = 0.0;
    double accent_delta = 0.0;

    bool anyClamped() const { return tempo_clamped || gain_clamped || accent_clamped; }
};

struct ShiftStats {
    double mean = 0.0;
    double p95 = 0.0;
    double max = 0.0;
};

struct ParamEnforcement {
    double requested_oob_rate = 0.0;
    double clamp_rate = 0.0;
    ShiftStats shift{};
    double effective_oob_rate = 0.0;
};

struct EnforcementSummary {
    std::string condition;
    std::optional<std::string> config_hash;
    ParamEnforcement tempo{};
    ParamEnforcement gain{};
    ParamEnforcement accent{};
};

struct TuningSensitivityRow {
    std::string condition;
    double clamp_rate_any = 0.0;
    // Empty when no paired row carries the delta.
    std::optional<double> delta_lra_lu_p95;
    std::optional<double> delta_lra_lu_max;
    std::optional<double> delta_integrated_lufs_p95;
    std::optional<double> delta_integrated_lufs_max;
};

using RunRecordTable = std::vector<RunRecord>;
using PairedDeltaTable = std::vector<PairedDelta>;

} // namespace envdiag
