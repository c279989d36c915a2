#pragma once
#include <vector>
#include <cstdint>
#include "grid.hpp"

// ------------------- Estadisticas de cascada -------------------
// Serie de alturas medias + histograma de tamaños de avalancha.
// Bins de igual ancho sobre [0, max_cascade]; lo que cae fuera se descarta.
class CascadeStats {
public:
    CascadeStats(double max_cascade, int num_bins);

    void record_average(const SandGrid& grid);

    // true si el tamaño cayo en algun bin
    bool record_avalanche(int size);

    const std::vector<double>&  averages()    const { return avg_; }
    const std::vector<int64_t>& bin_counts()  const { return counts_; }
    const std::vector<double>&  bin_cutoffs() const { return cutoffs_; }
    std::vector<double> bin_centers() const;

    // log10(n+1) normalizado a [0,1]; solo para graficar
    std::vector<double> log_relative_counts() const;

    int64_t recorded()  const { return recorded_; }
    int64_t discarded() const { return discarded_; }
    int     largest()   const { return largest_; }
    double  max_cascade() const { return max_cascade_; }
    int     num_bins()    const { return int(counts_.size()); }

    void reserve(size_t n) { avg_.reserve(n); }

private:
    double max_cascade_;
    std::vector<double>  cutoffs_;   // num_bins+1 bordes crecientes
    std::vector<int64_t> counts_;
    std::vector<double>  avg_;
    int64_t recorded_  = 0;
    int64_t discarded_ = 0;
    int     largest_   = 0;
};

// Indice del bin de 'size': primer borde > size, menos uno; -1 si no hay
int bin_index(const std::vector<double>& cutoffs, int size);
