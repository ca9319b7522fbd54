// ============================================================================
//  File: include/frame_render.hpp — Vues ASCII et SVG d'une PixelFrame
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  • N'utilise que la surface de lecture de la frame (all_indices), jamais
//    la disposition des bits.
//  • Sorties déterministes (mêmes pixels => même chaîne, octet pour octet).
// ============================================================================

#pragma once
#include <string>

#include "pixel_frame.hpp"

namespace pxf {

// Agrandissement max accepté par les exports raster (PNG) et le CLI :
// 255*32 = 8160 px de côté.
constexpr int kMaxScale = 32;

struct RenderOptions {
    // ASCII : un glyphe par index palette (0..3). Si moins de 4 glyphes,
    // l'index est écrit en chiffre ('0'..'3').
    std::string glyphs = ".#%@";

    // SVG
    int  scale = 10;         // taille d'un pixel en unités utilisateur (>=1, calcul 64 bits)
    int  background = -1;    // index peint en fond puis omis ; -1 = aucun
    bool merge_runs = true;  // fusionne les suites horizontales de même index
};

std::string render_ascii(const PixelFrame& frame, const RenderOptions& opts = RenderOptions());
std::string render_svg(const PixelFrame& frame, const RenderOptions& opts = RenderOptions());

} // namespace pxf
