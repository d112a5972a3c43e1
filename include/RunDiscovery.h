#pragma once

#include <string>
#include <vector>

#include "DiagnosticTypes.h"

namespace envdiag {

// Enumerates runs stored as <root>/<condition>/<trace_id>/<seed>/.
// This is the only place that knows the on-disk layout.
//
// Non-directory entries are skipped at every level, as are seed directories
// whose name is not an integer. Result is sorted by (condition, trace_id, seed).
// Throws ConfigError when `root` is not a directory.
std::vector<RunLocation> discoverRuns(const std::string& root, bool verbose = false);

} // namespace envdiag
