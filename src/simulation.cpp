#include "simulation.hpp"
#include <iostream>
#include <iomanip>
#include <utility>

static const AppConfig& checked(const AppConfig& c) {
    validate_config(c);
    return c;
}

Simulation::Simulation(const AppConfig& c)
: cfg(checked(c)),
  rng(c.seed),
  grid(c.grid_size),
  stats(c.max_cascade, c.num_bins)
{
    grid.randomize(rng);
    stats.reserve(size_t(cfg.iterations) + 1);
    stats.record_average(grid);   // linea base, antes de cualquier grano
}

bool Simulation::stop_requested() const {
    for (auto* s : sinks) if (s->wants_stop()) return true;
    return false;
}

Snapshot Simulation::snapshot(FrameKind kind, int wave, const std::vector<int>& toppled) const {
    Snapshot s;
    s.kind = kind;
    s.drop = drops;
    s.wave = wave;
    s.grid_size = grid.size();
    s.heights = grid.heights();
    s.toppled = toppled;
    s.averages = stats.averages();
    s.bin_counts = stats.bin_counts();
    s.bin_cutoffs = stats.bin_cutoffs();
    s.bin_heights = stats.log_relative_counts();
    s.iterations = cfg.iterations;
    return s;
}

void Simulation::publish(const Snapshot& s) {
    for (auto* sink : sinks) sink->publish(s);
    ++published;
}

ToppleHook Simulation::make_hook() {
    if (!publishing()) return nullptr;
    return [this](ToppleEvent ev, const Cell&, int wave,
                  const SandGrid&, const std::vector<int>& toppled) {
        FrameKind k = (ev == ToppleEvent::Deposit) ? FrameKind::Deposit : FrameKind::Topple;
        publish(snapshot(k, wave, toppled));
    };
}

const DropResult& Simulation::finish_drop(DropResult&& r) {
    ++drops;
    stats.record_average(grid);
    stats.record_avalanche(r.avalanche);
    last = std::move(r);
    if (publishing()) publish(snapshot(FrameKind::DropDone, last.waves, last.toppled));
    return last;
}

const DropResult& Simulation::step() {
    return finish_drop(drop_grain(grid, rng, make_hook()));
}

const DropResult& Simulation::step_at(int x, int y) {
    return finish_drop(drop_grain_at(grid, x, y, make_hook()));
}

void Simulation::run() {
    while (drops < cfg.iterations) {
        const DropResult& r = step();
        if (cfg.log_every > 0 && drops % cfg.log_every == 0) {
            std::cout << "grano " << drops << "/" << cfg.iterations
                      << "  avalancha=" << r.avalanche
                      << "  oleadas=" << r.waves
                      << "  media=" << std::fixed << std::setprecision(4)
                      << stats.averages().back() << "\n";
            std::cout.unsetf(std::ios::floatfield);
        }
        if (stop_requested()) {
            std::cout << "Detenido tras " << drops << " granos\n";
            break;
        }
    }
}
