#ifndef KAPITAL_ROLLING_MERGE_H
#define KAPITAL_ROLLING_MERGE_H

#include "../Params.hpp"
#include "../Tables.hpp"

namespace Kapital {

// Splices a rolling run onto the baseline it was started from.
class RollingMerge {
public:
    // Initial capital for a rolling run: the configured cap0 when present,
    // otherwise the baseline's capital stock at the join period.
    static double resolve_initial_capital(const RollingSpec& spec, const ResultTable& base);

    // The run's periods are shifted forward by `join`. For join > 0 the first
    // `join` baseline rows are followed by the run minus its last `join` rows.
    // The result carries the baseline's period index.
    static ResultTable roll_onto(const ResultTable& run, const ResultTable& base, int join);

private:
    static void check_alignment(const ResultTable& run, const ResultTable& base, int join);
};

} // namespace Kapital

#endif // KAPITAL_ROLLING_MERGE_H
