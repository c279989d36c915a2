#pragma once
#include <SDL.h>
#include <vector>
#include "simulation.hpp"

// Buffer ARGB8888 de la figura completa
struct FrameBuffer {
    int w=0, h=0;
    std::vector<Uint32> px;
    void resize(int W, int H) { w=W; h=H; px.assign(size_t(W)*size_t(H), 0u); }
};

struct PanelRect { int x0, y0, w, h; };

// Figura 2x2: (0,0) alturas, (0,1) derrumbes del grano,
// (1,0) altura media vs grano, (1,1) histograma log10 relativo
PanelRect panel_rect(int W, int H, int row, int col);

// Paleta discreta de alturas 0..4 (>=4 usa el ultimo color)
Uint32 height_color(int h);
// Mapa divergente azul-blanco-rojo, vmin=0, vmax=10
Uint32 toppled_color(int n);

void render_frame(const Snapshot& s, FrameBuffer& fb);

inline Uint32 pack_ARGB(Uint8 a, Uint8 R, Uint8 G, Uint8 B) {
    return (Uint32(a)<<24) | (Uint32(R)<<16) | (Uint32(G)<<8) | Uint32(B);
}
