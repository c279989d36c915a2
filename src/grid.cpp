#include "grid.hpp"
#include <algorithm>
#include <numeric>

SandGrid::SandGrid(int N_)
: N(N_), h(size_t(N_)*size_t(N_), 0) {}

Neighbors SandGrid::neighbors(int x, int y) const {
    static const int DX[4] = {-1, 0, 0, +1};
    static const int DY[4] = { 0,-1,+1,  0};
    Neighbors out;
    for (int k=0; k<4; ++k) {
        int nx = x + DX[k], ny = y + DY[k];
        if (in_bounds(nx, ny)) out.c[out.n++] = Cell{nx, ny};
    }
    return out;
}

std::vector<Cell> SandGrid::unstable_cells() const {
    std::vector<Cell> out;
    for (int x=0; x<N; ++x)
        for (int y=0; y<N; ++y)
            if (h[idx(x,y)] >= TOPPLE_THRESHOLD) out.push_back(Cell{x, y});
    return out;
}

bool SandGrid::is_stable() const {
    return std::none_of(h.begin(), h.end(),
                        [](int v){ return v >= TOPPLE_THRESHOLD; });
}

void SandGrid::randomize(RNG& rng) {
    for (auto& v : h) v = rng.rbi(0, TOPPLE_THRESHOLD-1);
}

void SandGrid::fill(int v) {
    std::fill(h.begin(), h.end(), v);
}

double SandGrid::mean() const {
    if (h.empty()) return 0.0;
    return double(total_mass()) / double(h.size());
}

int64_t SandGrid::total_mass() const {
    return std::accumulate(h.begin(), h.end(), int64_t(0));
}
