#pragma once
#include <SDL.h>
#include <string>
#include <cstdint>
#include "simulation.hpp"
#include "render.hpp"

// Ventana SDL que muestra la figura en cada evento publicado
class SdlDisplay : public FrameSink {
public:
    SdlDisplay(int width, int height, int pause_ms, bool vsync = false);
    ~SdlDisplay() override;
    SdlDisplay(const SdlDisplay&) = delete;
    SdlDisplay& operator=(const SdlDisplay&) = delete;

    void publish(const Snapshot& s) override;
    bool wants_stop() const override { return quit_; }

private:
    SDL_Window*   window_   = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture*  tex_      = nullptr;
    FrameBuffer fb_;
    int pause_ms_ = 0;
    bool quit_ = false;

    void poll_events();
};

// Un BMP por evento: <dir>/00000000.bmp, 00000001.bmp, ...
class BmpFrameWriter : public FrameSink {
public:
    BmpFrameWriter(const std::string& dir, int width, int height);

    void publish(const Snapshot& s) override;
    int64_t frames_written() const { return count_; }
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
    FrameBuffer fb_;
    int64_t count_ = 0;
};

// Nombre de cuadro con 8 digitos, ordenable lexicograficamente
std::string frame_name(int64_t index);
