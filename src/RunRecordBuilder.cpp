#include "RunRecordBuilder.h"

#include "JsonArtifacts.h"

#include <filesystem>
#include <iostream>

namespace envdiag {

namespace {

std::optional<bool> oobFlag(double value, const std::optional<ParamBounds>& bounds) {
    if (!bounds) {
        return std::nullopt;
    }
    return bounds->outOfBounds(value);
}

AcousticMetrics readMetrics(const json::Document& doc) {
    AcousticMetrics m;
    m.integrated_lufs = json::optNumber(doc, "integrated_lufs");
    m.lra_lu = json::optNumber(doc, "lra_lu");
    m.onset_density_eps = json::optNumber(doc, "onset_density_eps");
    m.peak_lufs = json::optNumber(doc, "peak_lufs");
    m.audio_path = json::optString(doc, "audio_path");
    return m;
}

// raw_effective wins; params.effective is the legacy-format fallback.
ParamSource effectiveSource(const json::Document& session, const std::string& path) {
    const json::Document& params = json::requireObject(session, "params", path);
    if (const json::Document* raw = json::member(params, "raw_effective")) {
        return RawParamSource{*raw, path + " [params.raw_effective]"};
    }
    if (const json::Document* legacy = json::member(params, "effective")) {
        return LegacyParamSource{*legacy, path + " [params.effective]"};
    }
    throw ArtifactError(path + ": session report has neither params.raw_effective nor params.effective");
}

} // namespace

RunRecordBuilder::RunRecordBuilder(const EnvelopeCatalog& catalog)
    : catalog_(catalog) {}

RunRecordBuilder::RunRecordBuilder(const EnvelopeCatalog& catalog, const Options& options)
    : catalog_(catalog), options_(options) {}

std::string RunRecordBuilder::artifactPath(const RunLocation& location, const std::string& name) const {
    return (std::filesystem::path(location.path) / name).string();
}

ParamAudit RunRecordBuilder::auditParam(double requested,
                                        double effective,
                                        const std::optional<ParamBounds>& bounds,
                                        double requested_oob_value,
                                        double effective_oob_value) {
    ParamAudit a;
    a.requested = requested;
    a.effective = effective;
    a.requested_oob = oobFlag(requested_oob_value, bounds);
    a.effective_oob = oobFlag(effective_oob_value, bounds);
    a.clamped = requested != effective;
    a.delta = effective - requested;
    return a;
}

std::optional<RunRecord> RunRecordBuilder::build(const RunLocation& location) const {
    const std::string metrics_path = artifactPath(location, options_.artifacts.metrics);
    const std::string reward_path = artifactPath(location, options_.artifacts.reward_spec);
    const std::string session_path = artifactPath(location, options_.artifacts.session_report);

    if (!json::fileExists(metrics_path) || !json::fileExists(reward_path)) {
        if (options_.verbose) {
            std::cerr << "[skip] " << location.path << ": missing "
                      << (json::fileExists(metrics_path) ? options_.artifacts.reward_spec
                                                         : options_.artifacts.metrics)
                      << "\n";
        }
        return std::nullopt;
    }

    const json::Document metrics = json::readDocument(metrics_path);
    const json::Document reward = json::readDocument(reward_path);

    RunRecord rec;
    rec.id = location.id;
    rec.metrics = readMetrics(metrics);

    // Requested values always come from the reward spec; the session report's
    // requested side is pre-formatted.
    const ParamSet requested = resolveParams(
        RawParamSource{json::requireObject(reward, "params_requested", reward_path),
                       reward_path + " [params_requested]"});

    ParamSet effective;
    if (json::fileExists(session_path)) {
        const json::Document session = json::readDocument(session_path);
        effective = resolveParams(effectiveSource(session, session_path));
        rec.pattern_label = json::optString(session, "patternLabel");
        rec.config_hash = json::optString(session, "configHash");
        rec.session_report_path = session_path;
    } else {
        // Legacy policy: no session report means nothing was clamped.
        effective = requested;
        rec.pattern_label = json::optString(reward, "pattern_label");
    }

    const Envelope* env = catalog_.envelopeFor(location.id.condition);
    const std::optional<ParamBounds> no_bounds;

    rec.tempo = auditParam(requested.tempo_bpm, effective.tempo_bpm,
                           env ? env->tempo_bpm : no_bounds,
                           requested.tempo_bpm, effective.tempo_bpm);
    rec.gain = auditParam(requested.gain_db, effective.gain_db,
                          env ? env->gain : no_bounds,
                          requested.gain_raw, effective.gain_raw);
    rec.accent = auditParam(requested.accent_ratio, effective.accent_ratio,
                            env ? env->accent_ratio : no_bounds,
                            requested.accent_ratio, effective.accent_ratio);

    rec.gain_unit = requested.gain_unit;
    rec.accent_pct_requested = requested.accent_pct;
    rec.accent_pct_effective = effective.accent_pct;
    return rec;
}

RunRecordTable RunRecordBuilder::buildAll(const std::vector<RunLocation>& locations) const {
    RunRecordTable table;
    table.reserve(locations.size());
    for (const auto& loc : locations) {
        auto rec = build(loc);
        if (rec) {
            table.push_back(std::move(*rec));
        }
    }
    return table;
}

} // namespace envdiag
