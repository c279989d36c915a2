#pragma once
#include <vector>
#include <cstdint>
#include "config.hpp"
#include "rng.hpp"
#include "grid.hpp"
#include "topple.hpp"
#include "stats.hpp"

enum class FrameKind {
    Deposit,   // tras depositar el grano
    Topple,    // tras cada derrumbe
    DropDone   // grano relajado, estadisticas al dia
};

// Copia inmutable del estado para renderizadores y grabadores
struct Snapshot {
    FrameKind kind = FrameKind::DropDone;
    int drop  = 0;                  // granos completados antes de este evento
    int wave  = 0;
    int grid_size = 0;
    std::vector<int>     heights;
    std::vector<int>     toppled;
    std::vector<double>  averages;
    std::vector<int64_t> bin_counts;
    std::vector<double>  bin_cutoffs;
    std::vector<double>  bin_heights;   // log10 relativo, para graficar
    int iterations = 0;
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void publish(const Snapshot& s) = 0;
    // p.ej. la ventana se cerro
    virtual bool wants_stop() const { return false; }
};

struct Simulation {
    AppConfig cfg;
    RNG rng;
    SandGrid grid;
    CascadeStats stats;
    std::vector<FrameSink*> sinks;   // no propietario

    int drops = 0;
    int64_t published = 0;
    DropResult last;

    explicit Simulation(const AppConfig& c);

    void add_sink(FrameSink* s) { sinks.push_back(s); }
    bool publishing() const { return (cfg.display || cfg.save) && !sinks.empty(); }
    bool stop_requested() const;

    // Un grano en celda aleatoria / dada
    const DropResult& step();
    const DropResult& step_at(int x, int y);

    // Corre cfg.iterations granos (o hasta que un sink pida parar)
    void run();

    Snapshot snapshot(FrameKind kind, int wave, const std::vector<int>& toppled) const;

private:
    const DropResult& finish_drop(DropResult&& r);
    void publish(const Snapshot& s);
    ToppleHook make_hook();
};
