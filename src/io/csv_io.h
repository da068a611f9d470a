#ifndef KAPITAL_CSV_IO_H
#define KAPITAL_CSV_IO_H

#include <string>
#include <vector>
#include "../Tables.hpp"

namespace Kapital {

class CsvIO {
public:
    // Simulation definition: header with period,a,sub,itc,td (any order, extra columns ignored).
    // Rows are sorted by period; duplicates are rejected.
    static ExogenousTable read_exogenous(const std::string& filename);

    // Result table keyed by period, 17 significant digits
    static void write_results(const std::string& filename, const ResultTable& table);

    // Header-driven read of a previously written result table
    static ResultTable read_results(const std::string& filename);

private:
    struct RawTable {
        std::vector<std::string> header;
        std::vector<std::vector<double>> rows;
        std::vector<int> line_numbers;
    };

    static RawTable read_raw(const std::string& filename);
    static int column_of(const RawTable& raw, const std::string& name, const std::string& filename);
    static std::vector<std::string> split_line(const std::string& line);
    static std::string trim(const std::string& s);

    // Period labels and the row permutation that sorts them
    static PeriodIndex sorted_index(const RawTable& raw, int period_col, const std::string& filename,
                                    std::vector<int>& order);
};

} // namespace Kapital

#endif // KAPITAL_CSV_IO_H
