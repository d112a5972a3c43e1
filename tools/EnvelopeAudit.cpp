#include "DiagnosticPipeline.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {
void printUsage() {
    std::cout << "envdiag_audit usage:\n"
              << "  envdiag_audit [--runs dir] [--conditions file] [--out dir]\n"
              << "                [--condition name]... [--verbose]\n"
              << "  --condition may be repeated; it replaces the default\n"
              << "  constrained_default / constrained_tight / constrained_relaxed set.\n";
}

void printOptional(const std::optional<double>& v) {
    if (v) {
        std::cout << *v;
    } else {
        std::cout << "n/a";
    }
}
} // namespace

int main(int argc, char** argv) {
    envdiag::PipelineConfig config;
    bool conditions_overridden = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--runs" && i + 1 < argc) {
            config.runs_dir = argv[++i];
        } else if (arg == "--conditions" && i + 1 < argc) {
            config.conditions_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if (arg == "--condition" && i + 1 < argc) {
            if (!conditions_overridden) {
                config.conditions.clear();
                conditions_overridden = true;
            }
            config.conditions.push_back(argv[++i]);
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    try {
        const envdiag::DiagnosticPipeline pipeline(config);
        const auto result = pipeline.run();

        std::cout << "Built " << result.records.size() << " run records\n";
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& row : result.tuning) {
            std::cout << "  " << row.condition << ": clamp_rate_any=" << row.clamp_rate_any;
            std::cout << " dLRA_p95=";
            printOptional(row.delta_lra_lu_p95);
            std::cout << " dLUFS_p95=";
            printOptional(row.delta_integrated_lufs_p95);
            std::cout << "\n";
        }
        for (const auto& path : result.written) {
            std::cout << "Wrote " << path << "\n";
        }
    } catch (const envdiag::DiagnosticError& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: unexpected error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
