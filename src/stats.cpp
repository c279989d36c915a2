#include "stats.hpp"
#include <algorithm>
#include <cmath>

CascadeStats::CascadeStats(double max_cascade, int num_bins)
: max_cascade_(max_cascade),
  cutoffs_(size_t(num_bins)+1),
  counts_(size_t(num_bins), 0)
{
    // linspace(0, max_cascade, num_bins+1); el ultimo borde exacto
    for (int i=0; i<=num_bins; ++i)
        cutoffs_[size_t(i)] = max_cascade * double(i) / double(num_bins);
    cutoffs_.back() = max_cascade;
}

int bin_index(const std::vector<double>& cutoffs, int size) {
    if (size < 0 || cutoffs.empty()) return -1;
    auto it = std::upper_bound(cutoffs.begin(), cutoffs.end(), double(size));
    if (it == cutoffs.end() || it == cutoffs.begin()) return -1;
    return int(it - cutoffs.begin()) - 1;
}

void CascadeStats::record_average(const SandGrid& grid) {
    avg_.push_back(grid.mean());
}

bool CascadeStats::record_avalanche(int size) {
    largest_ = std::max(largest_, size);
    int b = bin_index(cutoffs_, size);
    if (b < 0) { ++discarded_; return false; }
    counts_[size_t(b)] += 1;
    ++recorded_;
    return true;
}

std::vector<double> CascadeStats::bin_centers() const {
    std::vector<double> c(counts_.size());
    for (size_t i=0; i<c.size(); ++i) c[i] = 0.5 * (cutoffs_[i] + cutoffs_[i+1]);
    return c;
}

std::vector<double> CascadeStats::log_relative_counts() const {
    std::vector<double> out(counts_.size(), 0.0);
    double mx = 0.0;
    for (size_t i=0; i<out.size(); ++i) {
        out[i] = std::log10(double(counts_[i]) + 1.0);
        mx = std::max(mx, out[i]);
    }
    if (mx <= 0.0) return out;
    for (auto& v : out) v /= mx;
    return out;
}
