#include "render.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <omp.h>

static inline Uint8 to_byte(float x){
    int v = int(std::round(255.0f * std::clamp(x, 0.0f, 1.0f)));
    return (Uint8)v;
}

struct Vec3 { float x,y,z; };
static inline Vec3 v3(float x,float y,float z){ return {x,y,z}; }
static inline Vec3 lerp3(Vec3 a, Vec3 b, float t){
    return { a.x + (b.x-a.x)*t, a.y + (b.y-a.y)*t, a.z + (b.z-a.z)*t };
}
static inline Uint32 to_argb(Vec3 c){ return pack_ARGB(255, to_byte(c.x), to_byte(c.y), to_byte(c.z)); }

static const Uint32 WHITE = 0xFFFFFFFFu;
static const Uint32 FRAME = 0xFF505050u;
static const Uint32 BLUE  = 0xFF0000FFu;

// #CCD3FC #99A7F8 #667AF5 #334EF1 #EE4B2B
static const Uint32 HEIGHT_PALETTE[5] = {
    0xFFCCD3FCu, 0xFF99A7F8u, 0xFF667AF5u, 0xFF334EF1u, 0xFFEE4B2Bu
};

Uint32 height_color(int h) {
    return HEIGHT_PALETTE[std::clamp(h, 0, 4)];
}

// Rampa tipo "seismic": azul oscuro -> azul -> blanco -> rojo -> rojo oscuro
static inline Vec3 ramp_seismic(float t) {
    Vec3 c0 = v3(0.0f, 0.0f, 0.3f);
    Vec3 c1 = v3(0.0f, 0.0f, 1.0f);
    Vec3 c2 = v3(1.0f, 1.0f, 1.0f);
    Vec3 c3 = v3(1.0f, 0.0f, 0.0f);
    Vec3 c4 = v3(0.5f, 0.0f, 0.0f);
    t = std::clamp(t, 0.0f, 1.0f);
    if (t < 0.25f) return lerp3(c0, c1, t/0.25f);
    if (t < 0.50f) return lerp3(c1, c2, (t-0.25f)/0.25f);
    if (t < 0.75f) return lerp3(c2, c3, (t-0.50f)/0.25f);
    return lerp3(c3, c4, (t-0.75f)/0.25f);
}

Uint32 toppled_color(int n) {
    return to_argb(ramp_seismic(float(n) / 10.0f));
}

PanelRect panel_rect(int W, int H, int row, int col) {
    int m  = std::max(8, W/40);
    int pw = std::max(1, (W - 3*m) / 2);
    int ph = std::max(1, (H - 3*m) / 2);
    return { m + col*(pw+m), m + row*(ph+m), pw, ph };
}

static inline void put(FrameBuffer& fb, int x, int y, Uint32 c) {
    if (x<0 || y<0 || x>=fb.w || y>=fb.h) return;
    fb.px[size_t(y)*size_t(fb.w) + size_t(x)] = c;
}

static void draw_frame(FrameBuffer& fb, const PanelRect& r) {
    for (int x=r.x0-1; x<=r.x0+r.w; ++x) { put(fb, x, r.y0-1, FRAME); put(fb, x, r.y0+r.h, FRAME); }
    for (int y=r.y0-1; y<=r.y0+r.h; ++y) { put(fb, r.x0-1, y, FRAME); put(fb, r.x0+r.w, y, FRAME); }
}

// Celdas de la grilla escaladas al panel (vecino mas cercano)
template <class ColorFn>
static void draw_cells(FrameBuffer& fb, const PanelRect& r, int N,
                       const std::vector<int>& v, ColorFn color)
{
    if (N <= 0 || v.size() < size_t(N)*size_t(N)) return;
    #pragma omp parallel for collapse(2)
    for (int py=0; py<r.h; ++py) {
        for (int px=0; px<r.w; ++px) {
            int cx = std::min(N-1, int((long long)py * N / r.h));
            int cy = std::min(N-1, int((long long)px * N / r.w));
            Uint32* row = fb.px.data() + size_t(r.y0+py)*size_t(fb.w);
            row[r.x0+px] = color(v[size_t(cx)*size_t(N) + size_t(cy)]);
        }
    }
}

static void draw_averages(FrameBuffer& fb, const PanelRect& r,
                          const std::vector<double>& avg, int iterations)
{
    const int n = int(avg.size());
    if (n == 0) return;

    double ylo = 1.45, yhi = 2.15;
    for (double a : avg) { ylo = std::min(ylo, a); yhi = std::max(yhi, a); }
    const double xmax = std::max(1.0, double(iterations) * 1.05);

    auto to_row = [&](double a)->int {
        double t = (a - ylo) / (yhi - ylo);
        return r.y0 + r.h - 1 - int(std::round(t * double(r.h - 1)));
    };

    // Por columna: rango vertical de las muestras que caen en ella,
    // incluyendo la anterior para que la linea no tenga huecos
    #pragma omp parallel for
    for (int px=0; px<r.w; ++px) {
        double t0 = double(px)   * xmax / double(r.w);
        double t1 = double(px+1) * xmax / double(r.w);
        int i0 = int(std::ceil(t0));
        int i1 = std::min(n, int(std::ceil(t1)));
        if (i0 >= n) continue;
        int lo = std::max(0, i0-1);
        int hi = std::max(i1, i0+1);
        double amin = avg[size_t(lo)], amax = avg[size_t(lo)];
        for (int i=lo; i<hi && i<n; ++i) {
            amin = std::min(amin, avg[size_t(i)]);
            amax = std::max(amax, avg[size_t(i)]);
        }
        int ya = std::max(r.y0, to_row(amax) - 1);
        int yb = std::min(r.y0 + r.h - 1, to_row(amin) + 1);
        for (int y=ya; y<=yb; ++y)
            fb.px[size_t(y)*size_t(fb.w) + size_t(r.x0+px)] = BLUE;
    }
}

static void draw_histogram(FrameBuffer& fb, const PanelRect& r,
                           const std::vector<double>& heights)
{
    const int nb = int(heights.size());
    if (nb == 0) return;
    #pragma omp parallel for
    for (int px=0; px<r.w; ++px) {
        int b = std::min(nb-1, int((long long)px * nb / r.w));
        double frac = std::clamp(heights[size_t(b)] / 1.05, 0.0, 1.0);
        int bar = int(std::round(frac * double(r.h)));
        for (int k=0; k<bar; ++k)
            fb.px[size_t(r.y0 + r.h - 1 - k)*size_t(fb.w) + size_t(r.x0+px)] = BLUE;
    }
}

void render_frame(const Snapshot& s, FrameBuffer& fb) {
    if (fb.w < 64 || fb.h < 64)
        throw std::invalid_argument("render_frame: figura demasiado chica (min 64x64)");
    if (fb.px.size() != size_t(fb.w)*size_t(fb.h)) fb.resize(fb.w, fb.h);
    std::fill(fb.px.begin(), fb.px.end(), WHITE);

    PanelRect rg = panel_rect(fb.w, fb.h, 0, 0);
    PanelRect rt = panel_rect(fb.w, fb.h, 0, 1);
    PanelRect ra = panel_rect(fb.w, fb.h, 1, 0);
    PanelRect rh = panel_rect(fb.w, fb.h, 1, 1);

    draw_cells(fb, rg, s.grid_size, s.heights, height_color);
    draw_cells(fb, rt, s.grid_size, s.toppled, toppled_color);
    draw_averages(fb, ra, s.averages, s.iterations);
    draw_histogram(fb, rh, s.bin_heights);

    draw_frame(fb, ra);
    draw_frame(fb, rh);
}
