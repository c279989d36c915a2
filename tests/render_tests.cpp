#include "render.hpp"
#include "sinks.hpp"
#include "simulation.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static Snapshot quiet_snapshot(int N) {
    AppConfig cfg;
    cfg.grid_size = N;
    cfg.iterations = 10;
    cfg.seed = 21;
    Simulation sim(cfg);
    sim.grid.fill(0);
    return sim.snapshot(FrameKind::DropDone, 0, std::vector<int>(size_t(N)*size_t(N), 0));
}

static Uint32 pixel(const FrameBuffer& fb, int x, int y) {
    return fb.px[size_t(y)*size_t(fb.w) + size_t(x)];
}

void test_palette() {
    assert(height_color(0) == 0xFFCCD3FCu);
    assert(height_color(3) == 0xFF334EF1u);
    assert(height_color(4) == 0xFFEE4B2Bu);
    assert(height_color(7) == height_color(4));
    assert(toppled_color(5) == 0xFFFFFFFFu);
    assert(toppled_color(10) == toppled_color(25));
    std::cout << "[PASS] Height and topple palettes.\n";
}

void test_panels_inside_frame() {
    const int W = 400, H = 300;
    for (int row=0; row<2; ++row)
        for (int col=0; col<2; ++col) {
            PanelRect r = panel_rect(W, H, row, col);
            assert(r.x0 > 0 && r.y0 > 0);
            assert(r.x0 + r.w < W && r.y0 + r.h < H);
        }
    PanelRect a = panel_rect(W, H, 0, 0), b = panel_rect(W, H, 0, 1);
    assert(a.x0 + a.w < b.x0);
    std::cout << "[PASS] Panels fit inside the figure.\n";
}

void test_render_empty_grid() {
    Snapshot s = quiet_snapshot(5);
    FrameBuffer fb;
    fb.resize(400, 300);
    render_frame(s, fb);

    PanelRect rg = panel_rect(fb.w, fb.h, 0, 0);
    assert(pixel(fb, rg.x0 + rg.w/2, rg.y0 + rg.h/2) == height_color(0));
    PanelRect rt = panel_rect(fb.w, fb.h, 0, 1);
    assert(pixel(fb, rt.x0 + 1, rt.y0 + 1) == toppled_color(0));

    // Sin avalanchas registradas el histograma queda vacio
    PanelRect rh = panel_rect(fb.w, fb.h, 1, 1);
    assert(pixel(fb, rh.x0 + rh.w/2, rh.y0 + rh.h - 1) == 0xFFFFFFFFu);
    std::cout << "[PASS] Empty grid renders with the base color.\n";
}

void test_render_is_deterministic() {
    AppConfig cfg;
    cfg.grid_size = 10;
    cfg.iterations = 200;
    cfg.seed = 4;
    Simulation sim(cfg);
    sim.run();
    Snapshot s = sim.snapshot(FrameKind::DropDone, 0, sim.last.toppled);

    FrameBuffer a, b;
    a.resize(360, 280);
    b.resize(360, 280);
    render_frame(s, a);
    render_frame(s, b);
    assert(a.px == b.px);

    // La celda (0,0) se dibuja en la esquina superior izquierda del panel
    PanelRect rg = panel_rect(a.w, a.h, 0, 0);
    assert(pixel(a, rg.x0, rg.y0) == height_color(sim.grid.at(0,0)));
    std::cout << "[PASS] Rendering is deterministic.\n";
}

void test_render_rejects_tiny_frame() {
    Snapshot s = quiet_snapshot(3);
    FrameBuffer fb;
    fb.resize(32, 32);
    bool threw = false;
    try { render_frame(s, fb); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Tiny figure rejected.\n";
}

void test_frame_names_sort() {
    assert(frame_name(0) == "00000000.bmp");
    assert(frame_name(7) == "00000007.bmp");
    assert(frame_name(12345678) == "12345678.bmp");
    assert(frame_name(9) < frame_name(10));
    assert(frame_name(99999) < frame_name(100000));
    std::cout << "[PASS] Frame names are zero-padded.\n";
}

void test_bmp_writer() {
    fs::path dir = fs::temp_directory_path() / "sandpile_render_tests";
    std::error_code ec;
    fs::remove_all(dir, ec);

    AppConfig cfg;
    cfg.grid_size = 3;
    cfg.iterations = 1;
    cfg.seed = 2;
    cfg.save = true;
    Simulation sim(cfg);
    BmpFrameWriter writer(dir.string(), 320, 240);
    sim.add_sink(&writer);

    sim.grid.fill(0);
    sim.grid.set(1,1,3);
    sim.step_at(1,1);   // deposito + 1 derrumbe + fin
    assert(writer.frames_written() == 3);

    for (int i=0; i<3; ++i) {
        fs::path p = dir / frame_name(i);
        assert(fs::exists(p));
        std::ifstream in(p, std::ios::binary);
        char magic[2] = {0, 0};
        in.read(magic, 2);
        assert(magic[0] == 'B' && magic[1] == 'M');
    }
    assert(!fs::exists(dir / frame_name(3)));
    fs::remove_all(dir, ec);
    std::cout << "[PASS] BMP frames written in order.\n";
}

int main() {
    test_palette();
    test_panels_inside_frame();
    test_render_empty_grid();
    test_render_is_deterministic();
    test_render_rejects_tiny_frame();
    test_frame_names_sort();
    test_bmp_writer();
    std::cout << "All render tests passed.\n";
    return 0;
}
