#include "topple.hpp"

void topple_cell(SandGrid& grid, const Cell& c) {
    grid.set(c.x, c.y, 0);
    Neighbors nb = grid.neighbors(c.x, c.y);
    for (int k=0; k<nb.n; ++k) grid.deposit(nb.c[k].x, nb.c[k].y, 1);
}

DropResult drop_grain(SandGrid& grid, RNG& rng, const ToppleHook& hook) {
    const int N = grid.size();
    int x = rng.rbi(0, N-1);
    int y = rng.rbi(0, N-1);
    return drop_grain_at(grid, x, y, hook);
}

DropResult drop_grain_at(SandGrid& grid, int x, int y, const ToppleHook& hook) {
    DropResult r;
    r.x = x; r.y = y;
    r.toppled.assign(size_t(grid.size())*size_t(grid.size()), 0);

    grid.deposit(x, y, 1);
    if (hook) hook(ToppleEvent::Deposit, Cell{x, y}, 0, grid, r.toppled);

    if (!grid.is_unstable(x, y)) return r;

    // Oleadas: cada una procesa un lote fijo, mutando la grilla en sitio.
    // Una celda posterior del lote puede recibir granos de las anteriores,
    // pero igual queda en 0 cuando le toca.
    std::vector<Cell> batch{ Cell{x, y} };
    while (!batch.empty()) {
        ++r.waves;
        for (const Cell& c : batch) {
            topple_cell(grid, c);
            r.toppled[grid.idx(c.x, c.y)] += 1;
            r.avalanche += 1;
            if (hook) hook(ToppleEvent::Topple, c, r.waves, grid, r.toppled);
        }
        batch = grid.unstable_cells();
    }
    return r;
}
