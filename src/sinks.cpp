#include "sinks.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

// ---------------- SdlDisplay ----------------

SdlDisplay::SdlDisplay(int width, int height, int pause_ms, bool vsync)
: pause_ms_(pause_ms) {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0)
        throw std::runtime_error(std::string("SDL_Init error: ") + SDL_GetError());

    window_ = SDL_CreateWindow("Sandpile 2D",
                               SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               width, height, SDL_WINDOW_SHOWN);
    if (!window_) {
        std::string err = std::string("SDL_CreateWindow: ") + SDL_GetError();
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        throw std::runtime_error(err);
    }

    Uint32 flags = SDL_RENDERER_ACCELERATED;
    if (vsync) flags |= SDL_RENDERER_PRESENTVSYNC;
    renderer_ = SDL_CreateRenderer(window_, -1, flags);
    if (!renderer_) {
        std::string err = std::string("SDL_CreateRenderer: ") + SDL_GetError();
        SDL_DestroyWindow(window_); SDL_QuitSubSystem(SDL_INIT_VIDEO);
        throw std::runtime_error(err);
    }

    tex_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888,
                             SDL_TEXTUREACCESS_STREAMING, width, height);
    if (!tex_) {
        std::string err = std::string("SDL_CreateTexture: ") + SDL_GetError();
        SDL_DestroyRenderer(renderer_); SDL_DestroyWindow(window_);
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        throw std::runtime_error(err);
    }
    fb_.resize(width, height);
}

SdlDisplay::~SdlDisplay() {
    SDL_DestroyTexture(tex_);
    SDL_DestroyRenderer(renderer_);
    SDL_DestroyWindow(window_);
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

void SdlDisplay::poll_events() {
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        if (ev.type == SDL_QUIT) quit_ = true;
        else if (ev.type == SDL_KEYDOWN && ev.key.keysym.sym == SDLK_ESCAPE) quit_ = true;
    }
}

void SdlDisplay::publish(const Snapshot& s) {
    poll_events();
    if (quit_) return;

    render_frame(s, fb_);
    if (SDL_UpdateTexture(tex_, nullptr, fb_.px.data(), fb_.w * int(sizeof(Uint32))) != 0)
        throw std::runtime_error(std::string("SDL_UpdateTexture: ") + SDL_GetError());

    SDL_RenderClear(renderer_);
    SDL_RenderCopy(renderer_, tex_, nullptr, nullptr);
    SDL_RenderPresent(renderer_);

    if (s.kind == FrameKind::DropDone) {
        std::ostringstream tt;
        tt << "Sandpile 2D"
           << " | N=" << s.grid_size
           << " | grano " << s.drop << "/" << s.iterations;
        SDL_SetWindowTitle(window_, tt.str().c_str());
    }
    if (pause_ms_ > 0) SDL_Delay(Uint32(pause_ms_));
}

// ---------------- BmpFrameWriter ----------------

std::string frame_name(int64_t index) {
    std::ostringstream oss;
    oss << std::setw(8) << std::setfill('0') << index << ".bmp";
    return oss.str();
}

BmpFrameWriter::BmpFrameWriter(const std::string& dir, int width, int height)
: dir_(dir) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error(
            "BmpFrameWriter: no se pudo crear " + dir_ + " : " + ec.message());
    }
    fb_.resize(width, height);
}

void BmpFrameWriter::publish(const Snapshot& s) {
    render_frame(s, fb_);

    SDL_Surface* surf = SDL_CreateRGBSurfaceWithFormatFrom(
        fb_.px.data(), fb_.w, fb_.h, 32, fb_.w * int(sizeof(Uint32)),
        SDL_PIXELFORMAT_ARGB8888);
    if (!surf)
        throw std::runtime_error(std::string("SDL_CreateRGBSurface: ") + SDL_GetError());

    fs::path path = fs::path(dir_) / frame_name(count_);
    int rc = SDL_SaveBMP(surf, path.string().c_str());
    SDL_FreeSurface(surf);
    if (rc != 0)
        throw std::runtime_error("SDL_SaveBMP " + path.string() + ": " + SDL_GetError());
    ++count_;
}
