#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"
#include "EnvelopeCatalog.h"
#include "ParamSource.h"

namespace envdiag {

class RunRecordBuilder {
public:
    struct ArtifactNames {
        std::string metrics = "l1metrics.json";
        std::string reward_spec = "reward_spec.json";
        std::string session_report = "sessionReport.json";
    };

    struct Options {
        ArtifactNames artifacts{};
        bool verbose = false;  // log excluded runs to stderr
    };

    explicit RunRecordBuilder(const EnvelopeCatalog& catalog);
    RunRecordBuilder(const EnvelopeCatalog& catalog, const Options& options);

    // Empty when a required artifact (metrics, reward spec) is absent.
    // Throws ArtifactError when a present artifact is malformed.
    std::optional<RunRecord> build(const RunLocation& location) const;

    // Records in input order; excluded runs are dropped.
    RunRecordTable buildAll(const std::vector<RunLocation>& locations) const;

    // Exposed for tests: one audit row from already-resolved values.
    static ParamAudit auditParam(double requested,
                                 double effective,
                                 const std::optional<ParamBounds>& bounds,
                                 double requested_oob_value,
                                 double effective_oob_value);

private:
    const EnvelopeCatalog& catalog_;
    Options options_{};

    std::string artifactPath(const RunLocation& location, const std::string& name) const;
};

} // namespace envdiag
