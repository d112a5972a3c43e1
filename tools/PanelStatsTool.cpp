#include "PanelDataset.h"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
void printUsage() {
    std::cout << "envdiag_panels usage:\n"
              << "  envdiag_panels [--summary file] [--paired file] [--condition name]\n"
              << "                 [--conditions file] [--out prefix]\n"
              << "  Writes <prefix>_points.csv and <prefix>_stats.csv for the figure renderer.\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string summary = "summary/summary_runs.csv";
    std::string paired;
    std::string condition = "constrained_default";
    std::string conditions = "conditions.yaml";
    std::string out = "results/panels_default";
    bool out_set = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--summary" && i + 1 < argc) {
            summary = argv[++i];
        } else if (arg == "--paired" && i + 1 < argc) {
            paired = argv[++i];
        } else if (arg == "--condition" && i + 1 < argc) {
            condition = argv[++i];
        } else if (arg == "--conditions" && i + 1 < argc) {
            conditions = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
            out_set = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (paired.empty()) {
        paired = "summary/" + envdiag::pairedTableName(condition);
    }
    if (!out_set) {
        out = "results/panels_" + envdiag::conditionSuffix(condition);
    }

    try {
        const auto data = envdiag::loadPanelDataset(summary, paired, condition, conditions);

        const std::filesystem::path parent = std::filesystem::path(out).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw envdiag::OutputError("cannot create directory " + parent.string() + ": " + ec.message());
            }
        }
        envdiag::writePanelPoints(out + "_points.csv", data);
        envdiag::writePanelStats(out + "_stats.csv", data);

        std::cout << "Wrote " << out << "_points.csv and " << out << "_stats.csv\n";
        std::cout << std::fixed << std::setprecision(1) << "L2 Clamp rates:";
        for (const auto& p : data.params) {
            std::cout << " " << p.parameter << "=" << p.clamp_rate * 100.0 << "%";
        }
        std::cout << "\n" << std::setprecision(4) << "L1 medians:";
        for (const auto& d : data.deltas) {
            std::cout << " d" << d.metric << "=" << d.median;
        }
        std::cout << "\n";
    } catch (const envdiag::DiagnosticError& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: unexpected error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
