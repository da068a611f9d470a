#pragma once
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>
#include "../Params.hpp"
#include "../Tables.hpp"
#include "../io/csv_io.h"
#include "../io/RunLog.hpp"

namespace Kapital {

// Results of several runs, normalized against the baseline's first period
class RunSummary {
public:
    struct Row {
        std::string run;
        std::string legend;
        std::string closure;   // "P ex" or "P end"
        int period = 0;
        double lam = 0.0;
        double inv = 0.0;      // percent change from baseline, first period
        double cap = 0.0;
        double p = 0.0;
        double q = 0.0;
        double p_market = 0.0;
    };

    // Result tables keyed by run stem
    using RunSet = std::map<std::string, ResultTable>;

    // Run result files ("r*.csv") in a directory
    static RunSet load_dir(const std::string& dir) {
        namespace fs = std::filesystem;
        if (!fs::is_directory(dir)) {
            throw std::runtime_error("Results directory not found: " + dir);
        }
        RunSet runs;
        for (const auto& entry : fs::directory_iterator(dir)) {
            std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && entry.path().extension() == ".csv" && name[0] == 'r') {
                runs[entry.path().stem().string()] = CsvIO::read_results(entry.path().string());
            }
        }
        return runs;
    }

    // Stems present in both sets
    static std::vector<std::string> common_runs(const RunSet& x, const RunSet& y) {
        std::vector<std::string> out;
        for (const auto& kv : x) {
            if (y.count(kv.first)) out.push_back(kv.first);
        }
        return out;
    }

    // closures: ordered (label, runs). The baseline's first period in the first
    // closure that has it is the reference point.
    static std::vector<Row> build(const std::vector<std::pair<std::string, const RunSet*>>& closures,
                                  const std::vector<std::string>& stems,
                                  const ModelConfig& cfg,
                                  bool normalize_p_market) {
        // Every run needs a legend; "omit" drops it
        for (const auto& stem : stems) {
            if (!cfg.legend.count(stem)) {
                throw std::runtime_error("No legend mapping for run: " + stem);
            }
        }

        const ResultTable* ref = nullptr;
        for (const auto& c : closures) {
            auto it = c.second->find(cfg.baseline);
            if (it != c.second->end()) { ref = &it->second; break; }
        }
        if (!ref) {
            throw std::runtime_error("Baseline run " + cfg.baseline + " not found in results");
        }
        const int r0 = ref->index.first_pos();

        std::vector<Row> rows;
        for (const auto& c : closures) {
            for (const auto& stem : stems) {
                auto it = c.second->find(stem);
                if (it == c.second->end()) continue;
                const std::string& legend = cfg.legend.at(stem);
                if (legend == "omit") continue;

                const ResultTable& d = it->second;
                for (int i = 0; i < d.rows(); ++i) {
                    Row row;
                    row.run = stem;
                    row.legend = legend;
                    row.closure = c.first;
                    row.period = d.index[i];
                    row.lam = d.lam[i];
                    row.inv = pct(d.inv[i], ref->inv[r0]);
                    row.cap = pct(d.cap[i], ref->cap[r0]);
                    row.p = pct(d.p[i], ref->p[r0]);
                    row.q = pct(d.q[i], ref->q[r0]);
                    row.p_market = normalize_p_market ? pct(d.p_market[i], ref->p_market[r0]) : d.p_market[i];
                    rows.push_back(row);
                }
            }
        }

        std::stable_sort(rows.begin(), rows.end(), [](const Row& x, const Row& y) {
            if (x.legend != y.legend) return x.legend < y.legend;
            if (x.closure != y.closure) return x.closure < y.closure;
            return x.period < y.period;
        });
        return rows;
    }

    // lam, inv and cap at the given periods, one line per run and closure
    static void log_snapshots(const std::vector<Row>& rows, RunLog& log, const std::vector<int>& periods = {0, 100}) {
        for (const auto& row : rows) {
            if (std::find(periods.begin(), periods.end(), row.period) == periods.end()) continue;
            std::ostringstream msg;
            msg << std::fixed << std::setprecision(2)
                << "period " << row.period << " lam=" << row.lam << " inv=" << row.inv << " cap=" << row.cap;
            log.log(row.legend + " [" + row.closure + "]", msg.str());
        }
    }

    static void write_csv(const std::string& filename, const std::vector<Row>& rows, int last_year) {
        std::ofstream f(filename);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open output file: " + filename);
        }
        f << "run,legend,closure,period,lam,inv,cap,p,q,p_market\n";
        f << std::setprecision(10);
        for (const auto& r : rows) {
            if (r.period > last_year) continue;
            f << r.run << "," << quote(r.legend) << "," << r.closure << "," << r.period << ","
              << r.lam << "," << r.inv << "," << r.cap << "," << r.p << "," << r.q << "," << r.p_market << "\n";
        }
    }

private:
    // Exactly zero when x == base
    static double pct(double x, double base) { return 100.0 * (x / base - 1.0); }

    static std::string quote(const std::string& s) {
        if (s.find(',') == std::string::npos) return s;
        return "\"" + s + "\"";
    }
};

} // namespace Kapital
