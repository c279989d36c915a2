#pragma once
#include <vector>
#include <functional>
#include "grid.hpp"
#include "rng.hpp"

enum class ToppleEvent {
    Deposit,   // grano recien depositado
    Topple     // una celda inestable se derrumbo
};

// Resultado de un grano completamente relajado
struct DropResult {
    int x = 0, y = 0;          // celda donde cayo el grano
    int avalanche = 0;         // derrumbes totales (repeticiones incluidas)
    int waves = 0;             // oleadas de relajacion
    std::vector<int> toppled;  // derrumbes por celda en este grano (N*N)
};

// Observador de solo lectura, llamado tras el deposito y tras cada derrumbe.
// 'wave' es 0 para el deposito y 1.. para las oleadas.
using ToppleHook = std::function<void(ToppleEvent ev, const Cell& cell, int wave,
                                      const SandGrid& grid,
                                      const std::vector<int>& toppled)>;

// Deja caer un grano en una celda uniforme y relaja la grilla
DropResult drop_grain(SandGrid& grid, RNG& rng, const ToppleHook& hook = nullptr);

// Igual, pero en una celda dada (ya validada)
DropResult drop_grain_at(SandGrid& grid, int x, int y, const ToppleHook& hook = nullptr);

// Derrumba una celda: la deja en 0 y reparte 1 a cada vecino valido
void topple_cell(SandGrid& grid, const Cell& c);
