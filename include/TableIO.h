#pragma once

// TableIO.h
//
// CSV persistence for every pipeline table.
//
// Format: header row, doubles at round-trip precision (max_digits10, default
// notation), bools as 0/1, absent values as empty cells, strings quoted only
// when they contain a comma, quote or newline. Writers truncate; nothing is
// ever appended.

#include <cstddef>
#include <optional>
#include <fstream>
#include <string>
#include <vector>

#include "DiagnosticTypes.h"

namespace envdiag {

namespace csv {

std::string quote(const std::string& text);

void writeDouble(std::ostream& out, double v);
void writeOptDouble(std::ostream& out, const std::optional<double>& v);
void writeOptBool(std::ostream& out, const std::optional<bool>& v);
void writeOptString(std::ostream& out, const std::optional<std::string>& v);

// Opens for truncating write with the round-trip numeric format applied.
// Throws OutputError naming the path.
std::ofstream openForWrite(const std::string& path);

} // namespace csv

// Condition name without the "constrained_" prefix.
std::string conditionSuffix(const std::string& condition);
// paired_summary.csv for constrained_default, otherwise
// paired_summary_<suffix>.csv.
std::string pairedTableName(const std::string& condition);

void writeRunRecords(const std::string& path, const RunRecordTable& records);
void writePairedDeltas(const std::string& path, const PairedDeltaTable& rows);
void writeEnforcementSummary(const std::string& path, const EnforcementSummary& summary);
void writeTuningSensitivity(const std::string& path, const std::vector<TuningSensitivityRow>& rows);

class CsvTable {
public:
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    bool hasColumn(const std::string& name) const;

    // Empty for absent columns and empty cells. number() also returns empty
    // for cells that do not parse; flag() accepts 0/1/true/false.
    std::optional<std::string> text(std::size_t row, const std::string& column) const;
    std::optional<double> number(std::size_t row, const std::string& column) const;
    std::optional<bool> flag(std::size_t row, const std::string& column) const;

private:
    int columnIndex(const std::string& name) const;
};

// Throws ConfigError naming the path when the file is absent.
CsvTable readCsv(const std::string& path);
CsvTable parseCsv(const std::string& content);

} // namespace envdiag
