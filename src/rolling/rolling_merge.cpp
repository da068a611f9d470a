#include "rolling_merge.h"
#include "../Errors.hpp"
#include <stdexcept>
#include <string>

namespace Kapital {

double RollingMerge::resolve_initial_capital(const RollingSpec& spec, const ResultTable& base) {
    if (spec.has_cap0) {
        return spec.cap0;
    }
    if (!base.index.contains(spec.year)) {
        throw ConfigurationMismatchError("Baseline " + spec.base + " has no period "
                                         + std::to_string(spec.year) + " to take capital from");
    }
    return base.at(spec.year, "cap");
}

void RollingMerge::check_alignment(const ResultTable& run, const ResultTable& base, int join) {
    if (join < 0) {
        throw std::invalid_argument("Rolling join period must be non-negative, got " + std::to_string(join));
    }
    if (run.rows() != base.rows()) {
        throw ConfigurationMismatchError("Rolling run has " + std::to_string(run.rows())
                                         + " periods but its baseline has " + std::to_string(base.rows()));
    }
    if (join > base.rows()) {
        throw ConfigurationMismatchError("Join period " + std::to_string(join)
                                         + " is beyond the baseline's " + std::to_string(base.rows()) + " periods");
    }
}

ResultTable RollingMerge::roll_onto(const ResultTable& run, const ResultTable& base, int join) {
    check_alignment(run, base, join);

    // Shifted copy of the run; labels are replaced by the baseline's below
    ResultTable shifted = run;
    shifted.index = run.index.shifted(join);

    ResultTable merged(base.index);

    if (join > 0) {
        const int n = base.rows();
        const int keep = n - join;
        for (const auto& c : ResultTable::columns()) {
            Eigen::VectorXd& dst = merged.*c.second;
            dst.head(join) = (base.*c.second).head(join);
            dst.tail(keep) = (shifted.*c.second).head(keep);
        }
    } else {
        for (const auto& c : ResultTable::columns()) {
            merged.*c.second = shifted.*c.second;
        }
    }

    merged.index = base.index;
    return merged;
}

} // namespace Kapital
