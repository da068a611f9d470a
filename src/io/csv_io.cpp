#include "csv_io.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace Kapital {

std::string CsvIO::trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::vector<std::string> CsvIO::split_line(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        out.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') out.push_back("");
    return out;
}

CsvIO::RawTable CsvIO::read_raw(const std::string& filename) {
    std::ifstream f(filename);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open CSV file: " + filename);
    }

    RawTable raw;
    std::string line;
    int line_no = 0;

    // Header
    while (std::getline(f, line)) {
        ++line_no;
        if (!trim(line).empty()) {
            raw.header = split_line(trim(line));
            break;
        }
    }
    if (raw.header.empty()) {
        throw std::runtime_error("CSV file has no header: " + filename);
    }

    while (std::getline(f, line)) {
        ++line_no;
        std::string t = trim(line);
        if (t.empty()) continue;

        auto fields = split_line(t);
        if (fields.size() != raw.header.size()) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": expected "
                                     + std::to_string(raw.header.size()) + " fields, found "
                                     + std::to_string(fields.size()));
        }

        std::vector<double> row(fields.size());
        for (size_t k = 0; k < fields.size(); ++k) {
            size_t used = 0;
            try {
                row[k] = std::stod(fields[k], &used);
            } catch (const std::exception&) {
                used = 0;
            }
            if (used == 0 || used != fields[k].size()) {
                throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": bad number '"
                                         + fields[k] + "' in column " + raw.header[k]);
            }
        }
        raw.rows.push_back(row);
        raw.line_numbers.push_back(line_no);
    }

    if (raw.rows.empty()) {
        throw std::runtime_error("CSV file has no data rows: " + filename);
    }
    return raw;
}

int CsvIO::column_of(const RawTable& raw, const std::string& name, const std::string& filename) {
    auto it = std::find(raw.header.begin(), raw.header.end(), name);
    if (it == raw.header.end()) {
        throw std::runtime_error("CSV file " + filename + " has no column '" + name + "'");
    }
    return static_cast<int>(it - raw.header.begin());
}

PeriodIndex CsvIO::sorted_index(const RawTable& raw, int period_col, const std::string& filename,
                                std::vector<int>& order) {
    const int n = static_cast<int>(raw.rows.size());

    for (int i = 0; i < n; ++i) {
        double v = raw.rows[i][period_col];
        if (v != std::floor(v)) {
            throw std::runtime_error(filename + ":" + std::to_string(raw.line_numbers[i])
                                     + ": period must be an integer");
        }
    }

    order.resize(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int x, int y) {
        return raw.rows[x][period_col] < raw.rows[y][period_col];
    });

    std::vector<int> periods(n);
    for (int i = 0; i < n; ++i) {
        periods[i] = static_cast<int>(raw.rows[order[i]][period_col]);
        if (i > 0 && periods[i] == periods[i - 1]) {
            throw std::runtime_error(filename + ":" + std::to_string(raw.line_numbers[order[i]])
                                     + ": duplicate period " + std::to_string(periods[i]));
        }
    }
    return PeriodIndex(periods);
}

ExogenousTable CsvIO::read_exogenous(const std::string& filename) {
    RawTable raw = read_raw(filename);

    int c_period = column_of(raw, "period", filename);
    int c_a = column_of(raw, "a", filename);
    int c_sub = column_of(raw, "sub", filename);
    int c_itc = column_of(raw, "itc", filename);
    int c_td = column_of(raw, "td", filename);

    std::vector<int> order;
    PeriodIndex idx = sorted_index(raw, c_period, filename, order);

    ExogenousTable exo(idx);
    for (int i = 0; i < idx.size(); ++i) {
        const auto& row = raw.rows[order[i]];
        exo.a[i] = row[c_a];
        exo.sub[i] = row[c_sub];
        exo.itc[i] = row[c_itc];
        exo.td[i] = row[c_td];
    }
    return exo;
}

void CsvIO::write_results(const std::string& filename, const ResultTable& table) {
    std::ofstream f(filename);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open output file: " + filename);
    }

    const auto& cols = ResultTable::columns();

    f << "period";
    for (const auto& c : cols) f << "," << c.first;
    f << "\n";

    f << std::setprecision(17);
    for (int i = 0; i < table.rows(); ++i) {
        f << table.index[i];
        for (const auto& c : cols) {
            f << "," << (table.*c.second)[i];
        }
        f << "\n";
    }

    f.close();
    if (!f) {
        throw std::runtime_error("Failed writing output file: " + filename);
    }
}

ResultTable CsvIO::read_results(const std::string& filename) {
    RawTable raw = read_raw(filename);

    int c_period = column_of(raw, "period", filename);
    std::vector<int> order;
    PeriodIndex idx = sorted_index(raw, c_period, filename, order);

    ResultTable table(idx);
    for (const auto& c : ResultTable::columns()) {
        int k = column_of(raw, c.first, filename);
        Eigen::VectorXd& col = table.*c.second;
        for (int i = 0; i < idx.size(); ++i) {
            col[i] = raw.rows[order[i]][k];
        }
    }
    return table;
}

} // namespace Kapital
