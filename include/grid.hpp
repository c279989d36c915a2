#pragma once
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include "config.hpp"
#include "rng.hpp"

struct Cell {
    int x, y;   // x = fila, y = columna
};
inline bool operator==(const Cell& a, const Cell& b) { return a.x==b.x && a.y==b.y; }

// Vecinos ortogonales validos de una celda (0..4)
struct Neighbors {
    std::array<Cell,4> c;
    int n = 0;
};

// ------------------- Grilla de arena -------------------
// Alturas enteras en orden fila-mayor. Bordes disipativos: lo que sale
// de la grilla se pierde.
class SandGrid {
public:
    explicit SandGrid(int N);

    int size() const { return N; }
    inline size_t idx(int x, int y) const { return size_t(x)*size_t(N) + size_t(y); }
    inline bool in_bounds(int x, int y) const { return x>=0 && x<N && y>=0 && y<N; }

    int  at(int x, int y) const { return h[idx(x,y)]; }
    void set(int x, int y, int v) { h[idx(x,y)] = v; }
    void deposit(int x, int y, int amount) { h[idx(x,y)] += amount; }
    bool is_unstable(int x, int y) const { return h[idx(x,y)] >= TOPPLE_THRESHOLD; }

    Neighbors neighbors(int x, int y) const;

    // Barrido completo, en orden fila-mayor
    std::vector<Cell> unstable_cells() const;
    bool is_stable() const;

    // Alturas iniciales uniformes en [0, TOPPLE_THRESHOLD)
    void randomize(RNG& rng);
    void fill(int v);

    double  mean() const;
    int64_t total_mass() const;

    const std::vector<int>& heights() const { return h; }

private:
    int N;
    std::vector<int> h;
};
