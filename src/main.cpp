#include <SDL.h>
#include <iostream>
#include <iomanip>
#include <memory>
#include "config.hpp"
#include "simulation.hpp"
#include "sinks.hpp"

int main(int argc, char** argv) {
    try {
        AppConfig cfg;
        if (!parse_args(argc, argv, cfg)) return 0;

        Simulation sim(cfg);
        std::cout << "Grilla " << cfg.grid_size << "x" << cfg.grid_size
                  << ", " << cfg.iterations << " granos\n";
        std::cout << "Altura media inicial: " << sim.stats.averages().front() << "\n";

        std::unique_ptr<SdlDisplay> display;
        std::unique_ptr<BmpFrameWriter> writer;
        if (cfg.display) {
            display = std::make_unique<SdlDisplay>(cfg.width, cfg.height, cfg.pause_ms);
            sim.add_sink(display.get());
        }
        if (cfg.save) {
            writer = std::make_unique<BmpFrameWriter>(cfg.out_dir, cfg.width, cfg.height);
            sim.add_sink(writer.get());
        }

        Uint64 pf = SDL_GetPerformanceFrequency();
        Uint64 t0 = SDL_GetPerformanceCounter();
        sim.run();
        Uint64 t1 = SDL_GetPerformanceCounter();
        double secs = double(t1 - t0)/double(pf);

        const CascadeStats& st = sim.stats;
        std::cout << "Granos: " << sim.drops
                  << " | media final=" << std::fixed << std::setprecision(4) << st.averages().back()
                  << " | avalanchas en histograma=" << st.recorded()
                  << " | fuera de rango=" << st.discarded()
                  << " | mayor=" << st.largest()
                  << " | " << std::setprecision(2) << secs << " s\n";
        if (writer)
            std::cout << "Cuadros escritos: " << writer->frames_written()
                      << " en " << writer->dir() << "\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
}
