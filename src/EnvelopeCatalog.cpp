#include "EnvelopeCatalog.h"

#include "JsonArtifacts.h"

#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace envdiag {

namespace fs = std::filesystem;

namespace {

std::optional<ParamBounds> readBounds(const json::Document& doc, const char* key, const std::string& path) {
    const json::Document* b = json::member(doc, key);
    if (!b) {
        return std::nullopt;
    }
    const std::string ctx = path + " [" + key + "]";
    ParamBounds bounds;
    bounds.min = json::requireNumber(*b, "min", ctx);
    bounds.max = json::requireNumber(*b, "max", ctx);
    return bounds;
}

// Paths are taken as given first; relative ones fall back to the directory
// holding the conditions file.
std::optional<std::string> resolveEnvelopePath(const std::string& raw, const fs::path& config_dir) {
    std::error_code ec;
    if (fs::is_regular_file(raw, ec)) {
        return raw;
    }
    const fs::path p(raw);
    if (p.is_relative()) {
        const fs::path alt = config_dir / p;
        if (fs::is_regular_file(alt, ec)) {
            return alt.string();
        }
    }
    return std::nullopt;
}

} // namespace

Envelope EnvelopeCatalog::parseEnvelope(const std::string& condition, const std::string& envelope_path) {
    const json::Document doc = json::readDocument(envelope_path);
    Envelope env;
    env.condition = condition;
    env.tempo_bpm = readBounds(doc, "tempo_bpm", envelope_path);
    env.gain = readBounds(doc, "gain", envelope_path);
    env.accent_ratio = readBounds(doc, "accent_ratio", envelope_path);
    env.gain_db = readBounds(doc, "gain_db", envelope_path);
    env.config_hash = json::optString(doc, "configHash");
    return env;
}

EnvelopeCatalog EnvelopeCatalog::load(const std::string& conditions_path) {
    std::error_code ec;
    if (!fs::is_regular_file(conditions_path, ec)) {
        throw ConfigError("conditions config not found: " + conditions_path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(conditions_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("malformed conditions config " + conditions_path + ": " + e.what());
    }

    const YAML::Node conditions = root["conditions"];
    if (!conditions || !conditions.IsMap()) {
        throw ConfigError("no 'conditions' mapping in " + conditions_path);
    }

    const fs::path config_dir = fs::path(conditions_path).parent_path();

    EnvelopeCatalog catalog;
    for (const auto& kv : conditions) {
        const std::string name = kv.first.as<std::string>();
        const YAML::Node cfg = kv.second;

        std::optional<Envelope> envelope;
        if (cfg.IsMap() && cfg["envelope"] && cfg["envelope"].IsScalar()) {
            const auto path = resolveEnvelopePath(cfg["envelope"].as<std::string>(), config_dir);
            if (path) {
                try {
                    envelope = parseEnvelope(name, *path);
                } catch (const ArtifactError& e) {
                    throw ConfigError(e.what());
                }
            }
        }
        catalog.add(name, std::move(envelope));
    }
    return catalog;
}

void EnvelopeCatalog::add(const std::string& condition, std::optional<Envelope> envelope) {
    if (envelope) {
        envelope->condition = condition;
    }
    entries_[condition] = std::move(envelope);
}

const Envelope* EnvelopeCatalog::envelopeFor(const std::string& condition) const {
    const auto it = entries_.find(condition);
    if (it == entries_.end() || !it->second) {
        return nullptr;
    }
    return &(*it->second);
}

bool EnvelopeCatalog::hasCondition(const std::string& condition) const {
    return entries_.count(condition) > 0;
}

std::vector<std::string> EnvelopeCatalog::constrainedConditions() const {
    std::vector<std::string> names;
    for (const auto& kv : entries_) {
        if (kv.first == kBaselineCondition || !kv.second) {
            continue;
        }
        names.push_back(kv.first);
    }
    return names;
}

} // namespace envdiag
