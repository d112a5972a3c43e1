#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"

namespace envdiag {

// Condition name -> envelope bounds, loaded from a YAML conditions config:
//
//   conditions:
//     baseline: {}
//     constrained_default:
//       envelope: envelopes/default.json
//
// Conditions without an envelope (or whose envelope file is missing) are
// still listed but have no bounds; lookups return an empty optional.
class EnvelopeCatalog {
public:
    EnvelopeCatalog() = default;

    // Throws ConfigError when the config file is absent or has no
    // `conditions` mapping, or when an existing envelope file is malformed.
    static EnvelopeCatalog load(const std::string& conditions_path);

    void add(const std::string& condition, std::optional<Envelope> envelope);

    const Envelope* envelopeFor(const std::string& condition) const;
    bool hasCondition(const std::string& condition) const;

    // Sorted; excludes the baseline and conditions without an envelope.
    std::vector<std::string> constrainedConditions() const;

    static Envelope parseEnvelope(const std::string& condition, const std::string& envelope_path);

private:
    std::map<std::string, std::optional<Envelope>> entries_{};
};

} // namespace envdiag
