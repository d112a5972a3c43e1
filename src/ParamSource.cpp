#include "ParamSource.h"

#include "DiagnosticTypes.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

namespace envdiag {

namespace {

ParamSet resolveRaw(const RawParamSource& src) {
    ParamSet p;
    p.tempo_bpm = json::requireNumber(src.payload, "tempo_bpm", src.context);
    p.gain_db = json::requireNumber(src.payload, "gain_db", src.context);
    p.gain_raw = json::requireNumber(src.payload, "gain_raw", src.context);
    p.accent_ratio = json::requireNumber(src.payload, "accent_ratio", src.context);
    p.accent_pct = json::requireNumber(src.payload, "accent_pct", src.context);
    p.gain_unit = json::optString(src.payload, "gain_unit");
    return p;
}

std::optional<double> legacyField(const json::Document& obj, const char* key) {
    const json::Document* v = json::member(obj, key);
    if (!v) return std::nullopt;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) return parseFormattedNumber(v->get<std::string>());
    return std::nullopt;
}

ParamSet resolveLegacy(const LegacyParamSource& src) {
    const auto tempo = legacyField(src.payload, "tempo_bpm");
    const auto gain_db = legacyField(src.payload, "gain_db");
    auto gain_raw = legacyField(src.payload, "gain_raw");
    auto accent_ratio = legacyField(src.payload, "accent_ratio");
    auto accent_pct = legacyField(src.payload, "accent_pct");

    // Older reports dropped the derived forms; reconstruct them.
    if (!gain_raw && gain_db) {
        gain_raw = std::pow(10.0, *gain_db / 20.0);
    }
    if (!accent_ratio && accent_pct) {
        accent_ratio = *accent_pct / 100.0;
    }
    if (!accent_pct && accent_ratio) {
        accent_pct = *accent_ratio * 100.0;
    }

    auto need = [&](const std::optional<double>& v, const char* key) {
        if (!v) {
            throw ArtifactError(src.context + ": cannot resolve legacy field '" + key + "'");
        }
        return *v;
    };

    ParamSet p;
    p.tempo_bpm = need(tempo, "tempo_bpm");
    p.gain_db = need(gain_db, "gain_db");
    p.gain_raw = need(gain_raw, "gain_raw");
    p.accent_ratio = need(accent_ratio, "accent_ratio");
    p.accent_pct = need(accent_pct, "accent_pct");
    p.gain_unit = json::optString(src.payload, "gain_unit");
    return p;
}

} // namespace

std::optional<double> parseFormattedNumber(const std::string& text) {
    const char* s = text.c_str();
    while (*s && !std::strchr("+-.0123456789", *s)) {
        ++s;
    }
    if (!*s) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

ParamSet resolveParams(const ParamSource& source) {
    if (const auto* raw = std::get_if<RawParamSource>(&source)) {
        return resolveRaw(*raw);
    }
    return resolveLegacy(std::get<LegacyParamSource>(source));
}

} // namespace envdiag
