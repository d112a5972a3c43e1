#include "PanelDataset.h"

#include "Statistics.h"

#include <map>
#include <utility>

namespace envdiag {

namespace {

using PairKey = std::pair<std::string, int>;

struct ParamColumns {
    const char* name;
    const char* baseline_column;     // x: requested value on the baseline run
    const char* constrained_column;  // y: effective value on the constrained run
    const char* clamp_column;
};

const ParamColumns kParamColumns[] = {
    {"tempo", "tempo_req", "tempo_eff", "tempo_clamped"},
    {"gain", "gain_req", "gain_eff", "gain_clamped"},
    {"accent", "accent_req", "accent_eff", "accent_clamped"},
};

std::optional<PairKey> rowKey(const CsvTable& t, std::size_t row) {
    const auto trace = t.text(row, "trace_id");
    const auto seed = t.number(row, "seed");
    if (!trace || !seed) {
        return std::nullopt;
    }
    return PairKey{*trace, static_cast<int>(*seed)};
}

ParamBounds boundsFor(const Envelope& env, const std::string& param) {
    std::optional<ParamBounds> b;
    if (param == "tempo") {
        b = env.tempo_bpm;
    } else if (param == "gain") {
        b = env.gain_db ? env.gain_db : env.gain;
    } else {
        b = env.accent_ratio;
    }
    if (!b) {
        throw ConfigError("envelope for '" + env.condition + "' has no bounds for " + param);
    }
    return *b;
}

std::vector<double> presentColumn(const CsvTable& t, const std::string& column, double sign) {
    std::vector<double> out;
    for (std::size_t i = 0; i < t.size(); ++i) {
        const auto v = t.number(i, column);
        if (v) {
            out.push_back(sign * *v);
        }
    }
    return out;
}

DeltaPanelStats deltaStats(const std::string& metric, const std::vector<double>& values) {
    DeltaPanelStats s;
    s.metric = metric;
    s.n = values.size();
    if (values.size() < 2) {
        return s;
    }
    const auto d = stats::describe(values);
    s.median = d.median;
    s.mean = d.mean;
    s.iqr = d.iqr;
    return s;
}

} // namespace

const ParamPanelStats* PanelDataset::param(const std::string& name) const {
    for (const auto& p : params) {
        if (p.parameter == name) return &p;
    }
    return nullptr;
}

const DeltaPanelStats* PanelDataset::delta(const std::string& name) const {
    for (const auto& d : deltas) {
        if (d.metric == name) return &d;
    }
    return nullptr;
}

ClampSide classifyClamp(bool clamped, double value, const ParamBounds& bounds) {
    if (!clamped) return ClampSide::None;
    if (value >= bounds.max - kClampSideTolerance) return ClampSide::Max;
    if (value <= bounds.min + kClampSideTolerance) return ClampSide::Min;
    return ClampSide::None;
}

const char* clampSideName(ClampSide side) {
    switch (side) {
    case ClampSide::Min: return "min";
    case ClampSide::Max: return "max";
    case ClampSide::None: break;
    }
    return "none";
}

PanelDataset buildPanelDataset(const CsvTable& summary,
                               const CsvTable& paired,
                               const std::string& condition,
                               const EnvelopeCatalog& catalog) {
    const Envelope* env = catalog.envelopeFor(condition);
    if (!env) {
        throw ConfigError("no envelope registered for condition '" + condition + "'");
    }

    // Baseline x constrained join on (trace_id, seed), baseline order.
    std::vector<std::pair<std::size_t, std::size_t>> merged;
    {
        std::map<PairKey, std::size_t> constrained;
        for (std::size_t i = 0; i < summary.size(); ++i) {
            if (summary.text(i, "condition").value_or("") != condition) continue;
            if (const auto key = rowKey(summary, i)) constrained.emplace(*key, i);
        }
        for (std::size_t i = 0; i < summary.size(); ++i) {
            if (summary.text(i, "condition").value_or("") != kBaselineCondition) continue;
            const auto key = rowKey(summary, i);
            if (!key) continue;
            const auto it = constrained.find(*key);
            if (it != constrained.end()) merged.emplace_back(i, it->second);
        }
    }
    if (merged.empty()) {
        throw EmptyPairingError("No L2 data found for condition: " + condition);
    }
    if (paired.empty()) {
        throw EmptyPairingError("No L1 data found in paired table for condition: " + condition);
    }

    // Clamp flags come from the paired table; unmatched pairs count as unclamped.
    std::map<PairKey, std::size_t> paired_index;
    for (std::size_t i = 0; i < paired.size(); ++i) {
        if (const auto key = rowKey(paired, i)) paired_index.emplace(*key, i);
    }

    PanelDataset data;
    data.condition = condition;

    for (const auto& cols : kParamColumns) {
        ParamPanelStats ps;
        ps.parameter = cols.name;
        ps.bounds = boundsFor(*env, cols.name);

        for (const auto& m : merged) {
            const auto x = summary.number(m.first, cols.baseline_column);
            const auto y = summary.number(m.second, cols.constrained_column);
            if (!x || !y) continue;

            bool clamped = false;
            const auto key = rowKey(summary, m.first);
            const auto pit = paired_index.find(*key);
            if (pit != paired_index.end()) {
                clamped = paired.flag(pit->second, cols.clamp_column).value_or(false);
            }

            PanelPoint pt;
            pt.trace_id = key->first;
            pt.seed = key->second;
            pt.parameter = cols.name;
            pt.baseline = *x;
            pt.constrained = *y;
            pt.clamped = clamped;
            pt.side = classifyClamp(clamped, *y, ps.bounds);

            ++ps.n_total;
            if (clamped) ++ps.n_clamped;
            if (pt.side == ClampSide::Max) ++ps.n_clamped_max;
            if (pt.side == ClampSide::Min) ++ps.n_clamped_min;
            data.points.push_back(std::move(pt));
        }
        ps.clamp_rate = ps.n_total > 0
            ? static_cast<double>(ps.n_clamped) / static_cast<double>(ps.n_total)
            : 0.0;
        data.params.push_back(ps);
    }

    // The relaxed envelope's LRA delta runs opposite to the other variants;
    // flip it so all three figures read in the same direction.
    const double lra_sign = condition.find("relaxed") != std::string::npos ? -1.0 : 1.0;
    data.deltas.push_back(deltaStats("onset", presentColumn(paired, "delta_onset_density_eps", 1.0)));
    data.deltas.push_back(deltaStats("lufs", presentColumn(paired, "delta_integrated_lufs", 1.0)));
    data.deltas.push_back(deltaStats("lra", presentColumn(paired, "delta_lra_lu", lra_sign)));
    return data;
}

PanelDataset loadPanelDataset(const std::string& summary_csv,
                              const std::string& paired_csv,
                              const std::string& condition,
                              const std::string& conditions_path) {
    const CsvTable summary = readCsv(summary_csv);
    const CsvTable paired = readCsv(paired_csv);
    const EnvelopeCatalog catalog = EnvelopeCatalog::load(conditions_path);
    return buildPanelDataset(summary, paired, condition, catalog);
}

void writePanelPoints(const std::string& path, const PanelDataset& data) {
    std::ofstream out = csv::openForWrite(path);
    out << "condition,parameter,trace_id,seed,baseline,constrained,clamped,clamp_side\n";
    for (const auto& p : data.points) {
        out << csv::quote(data.condition) << ',' << p.parameter << ','
            << csv::quote(p.trace_id) << ',' << p.seed << ',';
        csv::writeDouble(out, p.baseline);
        out << ',';
        csv::writeDouble(out, p.constrained);
        out << ',' << (p.clamped ? 1 : 0) << ',' << clampSideName(p.side) << '\n';
    }
    out.flush();
    if (!out) {
        throw OutputError("write failed: " + path);
    }
}

void writePanelStats(const std::string& path, const PanelDataset& data) {
    std::ofstream out = csv::openForWrite(path);
    out << "condition,panel,layer,n,n_clamped,n_clamped_max,n_clamped_min,clamp_rate,"
           "bound_min,bound_max,median,mean,iqr\n";
    for (const auto& p : data.params) {
        out << csv::quote(data.condition) << ',' << p.parameter << ",L2,"
            << p.n_total << ',' << p.n_clamped << ',' << p.n_clamped_max << ',' << p.n_clamped_min << ',';
        csv::writeDouble(out, p.clamp_rate);
        out << ',';
        csv::writeDouble(out, p.bounds.min);
        out << ',';
        csv::writeDouble(out, p.bounds.max);
        out << ",,,\n";
    }
    for (const auto& d : data.deltas) {
        out << csv::quote(data.condition) << ',' << d.metric << ",L1," << d.n << ",,,,,,,";
        csv::writeDouble(out, d.median);
        out << ',';
        csv::writeDouble(out, d.mean);
        out << ',';
        csv::writeDouble(out, d.iqr);
        out << '\n';
    }
    out.flush();
    if (!out) {
        throw OutputError("write failed: " + path);
    }
}

} // namespace envdiag
