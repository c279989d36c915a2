#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <limits>

// Umbral de derrumbe del modelo de Bak-Tang-Wiesenfeld (fijo)
constexpr int TOPPLE_THRESHOLD = 4;

struct AppConfig {
    int    grid_size   = 30;     // lado de la grilla (>=1)
    int    iterations  = 5000;   // granos a dejar caer (>=0)
    int    seed        = -1;     // -1 -> random_device

    // ---- Histograma de avalanchas ----
    double max_cascade = 100.0;  // dominio [0, max_cascade]
    int    num_bins    = 50;

    // ---- Salida ----
    bool   display     = false;  // ventana SDL
    bool   save        = false;  // un BMP por evento
    std::string out_dir = "images";
    int    pause_ms    = 0;      // pausa entre cuadros en pantalla
    int    width       = 1200;   // tamaño de la figura (px)
    int    height      = 1000;
    int    log_every   = 0;      // progreso en consola cada K granos (0=off)
};

inline void print_usage(const char* prog) {
    std::cout << "Uso: " << prog
              << " [--size N] [--iterations I] [--max-cascade M] [--bins B] [--seed S]"
                 " [--display] [--save] [--out DIR] [--pause MS]"
                 " [--width W] [--height H] [--log-every K]\n";
}

inline bool parse_int(const char* s, int& out, int minv, int maxv) {
    try { long v = std::stol(s); if (v<minv || v>maxv) return false; out=int(v); return true; }
    catch (const std::exception&) { return false; }
}
inline bool parse_double(const char* s, double& out, double minv, double maxv) {
    try { double v = std::stod(s); if (!(v>minv) || v>maxv) return false; out=v; return true; }
    catch (const std::exception&) { return false; }
}

// Falla rapido ante una configuracion que el nucleo no puede simular
inline void validate_config(const AppConfig& cfg) {
    if (cfg.grid_size <= 0)     throw std::invalid_argument("grid_size debe ser >= 1");
    if (cfg.iterations < 0)     throw std::invalid_argument("iterations debe ser >= 0");
    if (cfg.num_bins <= 0)      throw std::invalid_argument("num_bins debe ser >= 1");
    if (!(cfg.max_cascade > 0)) throw std::invalid_argument("max_cascade debe ser > 0");
    if (cfg.pause_ms < 0)       throw std::invalid_argument("pause_ms debe ser >= 0");
}

// Devuelve false si se pidio --help (ya impreso)
inline bool parse_args(int argc, char** argv, AppConfig& cfg) {
    const int IMAX = std::numeric_limits<int>::max();
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* name){ if (i+1>=argc) throw std::runtime_error(std::string("Falta valor para ")+name); return argv[++i]; };

        if (a=="--size"||a=="-n"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.grid_size,1,4096)) throw std::runtime_error("size invalido (1..4096)"); }
        else if (a=="--iterations"||a=="-i"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.iterations,0,IMAX)) throw std::runtime_error("iterations invalido (>=0)"); }
        else if (a=="--max-cascade"){ const char* v=need(a.c_str()); if(!parse_double(v,cfg.max_cascade,0.0,1e9)) throw std::runtime_error("max-cascade invalido (>0)"); }
        else if (a=="--bins"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.num_bins,1,100000)) throw std::runtime_error("bins invalido (1..100000)"); }
        else if (a=="--seed"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.seed,-1,IMAX)) throw std::runtime_error("seed invalida"); }
        else if (a=="--display"){ cfg.display=true; }
        else if (a=="--save"){ cfg.save=true; }
        else if (a=="--out"){ cfg.out_dir=need(a.c_str()); if(cfg.out_dir.empty()) throw std::runtime_error("out vacio"); }
        else if (a=="--pause"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.pause_ms,0,10000)) throw std::runtime_error("pause invalida (0..10000 ms)"); }
        else if (a=="--width"||a=="-w"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.width,320,16384)) throw std::runtime_error("width invalido (>=320)"); }
        else if (a=="--height"||a=="-h"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.height,240,16384)) throw std::runtime_error("height invalido (>=240)"); }
        else if (a=="--log-every"){ const char* v=need(a.c_str()); if(!parse_int(v,cfg.log_every,0,IMAX)) throw std::runtime_error("log-every invalido (>=0)"); }
        else if (a=="--help"||a=="-?"){ print_usage(argv[0]); return false; }
        else { std::ostringstream oss; oss<<"Argumento desconocido: "<<a; throw std::runtime_error(oss.str()); }
    }
    validate_config(cfg);
    return true;
}
