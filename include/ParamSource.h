#pragma once

// ParamSource.h
//
// Requested/effective parameter payloads arrive in two shapes:
//   - raw numeric   (reward_spec params_requested, session params.raw_effective)
//   - legacy        (older session params.effective; values may be formatted
//                    strings such as "120 BPM", "-6.0 dB", "35%")
// The shape is captured once as a tagged union and resolved into a canonical
// ParamSet at record-build time. Nothing downstream inspects the shape.

#include <optional>
#include <string>
#include <variant>

#include "JsonArtifacts.h"

namespace envdiag {

struct ParamSet {
    double tempo_bpm = 0.0;
    double gain_db = 0.0;
    double gain_raw = 0.0;
    double accent_ratio = 0.0;
    double accent_pct = 0.0;
    std::optional<std::string> gain_unit;
};

struct RawParamSource {
    json::Document payload;
    std::string context;  // file path for error messages
};

struct LegacyParamSource {
    json::Document payload;
    std::string context;
};

using ParamSource = std::variant<RawParamSource, LegacyParamSource>;

// Throws ArtifactError when a required field cannot be resolved.
ParamSet resolveParams(const ParamSource& source);

// Leading numeric token of a formatted value ("120 BPM" -> 120, "35%" -> 35).
std::optional<double> parseFormattedNumber(const std::string& text);

} // namespace envdiag
