#pragma once
#include <vector>
#include <string>
#include <stdexcept>

namespace Kapital {

// Ordered set of period identifiers.
// Recursions walk positions 0..size-1, "next" is position+1, "previous" is position-1.
class PeriodIndex {
public:
    PeriodIndex() = default;

    explicit PeriodIndex(const std::vector<int>& p) : periods_(p) {
        if (periods_.empty()) {
            throw std::invalid_argument("PeriodIndex: at least one period is required");
        }
        for (int i = 1; i < size(); ++i) {
            if (periods_[i] <= periods_[i - 1]) {
                throw std::invalid_argument("PeriodIndex: periods must be strictly increasing (at "
                                            + std::to_string(periods_[i]) + ")");
            }
        }
    }

    // Contiguous range [first, first + n)
    static PeriodIndex range(int first, int n) {
        std::vector<int> p(n);
        for (int i = 0; i < n; ++i) p[i] = first + i;
        return PeriodIndex(p);
    }

    int size() const { return static_cast<int>(periods_.size()); }
    const std::vector<int>& periods() const { return periods_; }

    int first() const { return periods_.front(); }
    int last() const { return periods_.back(); }

    int first_pos() const { return 0; }
    int last_pos() const { return size() - 1; }

    bool has_next(int pos) const { return pos + 1 < size(); }
    bool has_prev(int pos) const { return pos > 0; }

    // Position of a period label, -1 when absent
    int position(int period) const {
        int lo = 0, hi = size() - 1;
        while (lo <= hi) {
            int mid = (lo + hi) / 2;
            if (periods_[mid] == period) return mid;
            if (periods_[mid] < period) lo = mid + 1;
            else hi = mid - 1;
        }
        return -1;
    }

    bool contains(int period) const { return position(period) >= 0; }

    int operator[](int pos) const { return periods_[pos]; }

    PeriodIndex shifted(int offset) const {
        std::vector<int> p(periods_);
        for (auto& v : p) v += offset;
        return PeriodIndex(p);
    }

    bool operator==(const PeriodIndex& other) const { return periods_ == other.periods_; }
    bool operator!=(const PeriodIndex& other) const { return !(*this == other); }

private:
    std::vector<int> periods_;
};

} // namespace Kapital
