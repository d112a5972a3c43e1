#include "TableIO.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>

namespace envdiag {

namespace csv {

std::string quote(const std::string& text) {
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

void writeDouble(std::ostream& out, double v) {
    // -0.0 prints as "-0".
    if (v == 0.0) {
        v = 0.0;
    }
    out << v;
}

void writeOptDouble(std::ostream& out, const std::optional<double>& v) {
    if (v) {
        writeDouble(out, *v);
    }
}

void writeOptBool(std::ostream& out, const std::optional<bool>& v) {
    if (v) {
        out << (*v ? 1 : 0);
    }
}

void writeOptString(std::ostream& out, const std::optional<std::string>& v) {
    if (v) {
        out << quote(*v);
    }
}

std::ofstream openForWrite(const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw OutputError("cannot write " + path);
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    return out;
}

} // namespace csv

std::string conditionSuffix(const std::string& condition) {
    const std::string prefix = "constrained_";
    if (condition.compare(0, prefix.size(), prefix) == 0) {
        return condition.substr(prefix.size());
    }
    return condition;
}

std::string pairedTableName(const std::string& condition) {
    const std::string suffix = conditionSuffix(condition);
    if (suffix == "default") {
        return "paired_summary.csv";
    }
    return "paired_summary_" + suffix + ".csv";
}

namespace {

void writeAudit(std::ostream& out, const ParamAudit& a) {
    csv::writeDouble(out, a.requested);
    out << ',';
    csv::writeDouble(out, a.effective);
    out << ',';
    csv::writeOptBool(out, a.requested_oob);
    out << ',';
    csv::writeOptBool(out, a.effective_oob);
    out << ',' << (a.clamped ? 1 : 0) << ',';
    csv::writeDouble(out, a.delta);
}

void writeEnforcement(std::ostream& out, const ParamEnforcement& e) {
    csv::writeDouble(out, e.requested_oob_rate);
    out << ',';
    csv::writeDouble(out, e.clamp_rate);
    out << ',';
    csv::writeDouble(out, e.shift.mean);
    out << ',';
    csv::writeDouble(out, e.shift.p95);
    out << ',';
    csv::writeDouble(out, e.shift.max);
    out << ',';
    csv::writeDouble(out, e.effective_oob_rate);
}

void finish(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw OutputError("write failed: " + path);
    }
}

} // namespace

void writeRunRecords(const std::string& path, const RunRecordTable& records) {
    std::ofstream out = csv::openForWrite(path);
    out << "trace_id,seed,condition,pattern_label,config_hash,"
           "tempo_req,tempo_eff,tempo_req_oob,tempo_eff_oob,tempo_clamped,tempo_delta,"
           "gain_req,gain_eff,gain_req_oob,gain_eff_oob,gain_clamped,gain_delta,gain_unit,"
           "accent_req,accent_eff,accent_req_oob,accent_eff_oob,accent_clamped,accent_delta,"
           "accent_pct_req,accent_pct_eff,"
           "integrated_lufs,lra_lu,onset_density_eps,peak_lufs,audio_path,session_report_path\n";

    for (const auto& r : records) {
        out << csv::quote(r.id.trace_id) << ',' << r.id.seed << ',' << csv::quote(r.id.condition) << ',';
        csv::writeOptString(out, r.pattern_label);
        out << ',';
        csv::writeOptString(out, r.config_hash);
        out << ',';
        writeAudit(out, r.tempo);
        out << ',';
        writeAudit(out, r.gain);
        out << ',';
        csv::writeOptString(out, r.gain_unit);
        out << ',';
        writeAudit(out, r.accent);
        out << ',';
        csv::writeDouble(out, r.accent_pct_requested);
        out << ',';
        csv::writeDouble(out, r.accent_pct_effective);
        out << ',';
        csv::writeOptDouble(out, r.metrics.integrated_lufs);
        out << ',';
        csv::writeOptDouble(out, r.metrics.lra_lu);
        out << ',';
        csv::writeOptDouble(out, r.metrics.onset_density_eps);
        out << ',';
        csv::writeOptDouble(out, r.metrics.peak_lufs);
        out << ',';
        csv::writeOptString(out, r.metrics.audio_path);
        out << ',';
        csv::writeOptString(out, r.session_report_path);
        out << '\n';
    }
    finish(out, path);
}

void writePairedDeltas(const std::string& path, const PairedDeltaTable& rows) {
    std::ofstream out = csv::openForWrite(path);
    out << "trace_id,seed,pattern_label,"
           "baseline_integrated_lufs,constrained_integrated_lufs,delta_integrated_lufs,"
           "baseline_lra_lu,constrained_lra_lu,delta_lra_lu,"
           "baseline_onset_density_eps,constrained_onset_density_eps,delta_onset_density_eps,"
           "tempo_clamped,gain_clamped,accent_clamped,tempo_delta,gain_delta,accent_delta\n";

    for (const auto& r : rows) {
        out << csv::quote(r.trace_id) << ',' << r.seed << ',';
        csv::writeOptString(out, r.pattern_label);
        const std::optional<double> values[] = {
            r.baseline_integrated_lufs, r.constrained_integrated_lufs, r.delta_integrated_lufs,
            r.baseline_lra_lu, r.constrained_lra_lu, r.delta_lra_lu,
            r.baseline_onset_density_eps, r.constrained_onset_density_eps, r.delta_onset_density_eps,
        };
        for (const auto& v : values) {
            out << ',';
            csv::writeOptDouble(out, v);
        }
        out << ',' << (r.tempo_clamped ? 1 : 0)
            << ',' << (r.gain_clamped ? 1 : 0)
            << ',' << (r.accent_clamped ? 1 : 0) << ',';
        csv::writeDouble(out, r.tempo_delta);
        out << ',';
        csv::writeDouble(out, r.gain_delta);
        out << ',';
        csv::writeDouble(out, r.accent_delta);
        out << '\n';
    }
    finish(out, path);
}

void writeEnforcementSummary(const std::string& path, const EnforcementSummary& s) {
    std::ofstream out = csv::openForWrite(path);
    out << "condition,config_hash";
    for (const char* p : {"tempo", "gain", "accent"}) {
        out << ',' << p << "_requested_oob_rate"
            << ',' << p << "_clamp_rate"
            << ',' << p << "_shift_mean"
            << ',' << p << "_shift_p95"
            << ',' << p << "_shift_max"
            << ',' << p << "_effective_oob_rate";
    }
    out << '\n';

    out << csv::quote(s.condition) << ',';
    csv::writeOptString(out, s.config_hash);
    out << ',';
    writeEnforcement(out, s.tempo);
    out << ',';
    writeEnforcement(out, s.gain);
    out << ',';
    writeEnforcement(out, s.accent);
    out << '\n';
    finish(out, path);
}

void writeTuningSensitivity(const std::string& path, const std::vector<TuningSensitivityRow>& rows) {
    std::ofstream out = csv::openForWrite(path);
    out << "condition,clamp_rate_any,delta_lra_lu_p95,delta_lra_lu_max,"
           "delta_integrated_lufs_p95,delta_integrated_lufs_max\n";
    for (const auto& r : rows) {
        out << csv::quote(r.condition) << ',';
        csv::writeDouble(out, r.clamp_rate_any);
        out << ',';
        csv::writeOptDouble(out, r.delta_lra_lu_p95);
        out << ',';
        csv::writeOptDouble(out, r.delta_lra_lu_max);
        out << ',';
        csv::writeOptDouble(out, r.delta_integrated_lufs_p95);
        out << ',';
        csv::writeOptDouble(out, r.delta_integrated_lufs_max);
        out << '\n';
    }
    finish(out, path);
}

// ============================================================
// Reader
// ============================================================

CsvTable parseCsv(const std::string& content) {
    std::vector<std::vector<std::string>> lines;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool record_has_data = false;

    auto endField = [&]() {
        record.push_back(field);
        field.clear();
    };
    auto endRecord = [&]() {
        endField();
        if (record_has_data || record.size() > 1 || !record.front().empty()) {
            lines.push_back(record);
        }
        record.clear();
        record_has_data = false;
    };

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') {
            in_quotes = true;
            record_has_data = true;
        } else if (c == ',') {
            endField();
        } else if (c == '\n') {
            endRecord();
        } else if (c != '\r') {
            field += c;
        }
    }
    if (!field.empty() || !record.empty() || record_has_data) {
        endRecord();
    }

    CsvTable table;
    if (lines.empty()) {
        return table;
    }
    table.header = lines.front();
    table.rows.assign(lines.begin() + 1, lines.end());
    return table;
}

CsvTable readCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("missing table: " + path);
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseCsv(content);
}

int CsvTable::columnIndex(const std::string& name) const {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool CsvTable::hasColumn(const std::string& name) const {
    return columnIndex(name) >= 0;
}

std::optional<std::string> CsvTable::text(std::size_t row, const std::string& column) const {
    const int idx = columnIndex(column);
    if (idx < 0 || row >= rows.size()) {
        return std::nullopt;
    }
    const auto& cells = rows[row];
    if (static_cast<std::size_t>(idx) >= cells.size() || cells[idx].empty()) {
        return std::nullopt;
    }
    return cells[idx];
}

std::optional<double> CsvTable::number(std::size_t row, const std::string& column) const {
    const auto cell = text(row, column);
    if (!cell) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(cell->c_str(), &end);
    if (end == cell->c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return v;
}

std::optional<bool> CsvTable::flag(std::size_t row, const std::string& column) const {
    const auto cell = text(row, column);
    if (!cell) {
        return std::nullopt;
    }
    if (*cell == "1" || *cell == "true" || *cell == "True" || *cell == "1.0") {
        return true;
    }
    if (*cell == "0" || *cell == "false" || *cell == "False" || *cell == "0.0") {
        return false;
    }
    return std::nullopt;
}

} // namespace envdiag
