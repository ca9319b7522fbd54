// ============================================================================
//  File: include/io_frame_image.hpp — Pont PixelFrame <-> images (DOC+)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  OBJET
//  -----
//  • Export RGB8 (agrandissement entier "scale" dans [1,kMaxScale], bloc
//    scale×scale par pixel).
//  • PNG via stb_image / stb_image_write (implémentation : compile_stb.cpp).
//  • TIFF palette 2 bits/pixel via libtiff (PXF_USE_TIFF), colormap 16 bits
//    = canal*257. Les lignes TIFF sont MSB d'abord : repack ligne par ligne,
//    le buffer de la frame n'est jamais écrit tel quel.
//
//  IMPORT
//  ------
//  • Image carrée, côtés multiples de scale, côté/scale <= 255.
//  • Chaque bloc scale×scale doit être uniforme et sa couleur une couleur
//    exacte de la palette ; sinon échec (pas de quantification).
// ============================================================================

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "frame_render.hpp"
#include "pixel_frame.hpp"

namespace PxfIO {

struct ImageRGB8
{
    int w=0,h=0,c=3;
    std::vector<uint8_t> data;
};

// scale hors [1,kMaxScale] -> false, out intact.
bool frame_to_rgb(const pxf::PixelFrame& frame, int scale, ImageRGB8& out, std::string* err = nullptr);

// Conversion inverse (mêmes règles que l'import PNG).
bool rgb_to_frame(const ImageRGB8& img, int scale, pxf::PixelFrame& out, std::string* err = nullptr);

bool save_frame_png(const std::string& path, const pxf::PixelFrame& frame, int scale,
                    std::string* err = nullptr);
bool load_frame_png(const std::string& path, int scale, pxf::PixelFrame& out,
                    std::string* err = nullptr);

// Disponibles seulement si compilé avec libtiff ; sinon renvoient false.
bool tiff_available();
bool save_frame_tiff(const std::string& path, const pxf::PixelFrame& frame,
                     std::string* err = nullptr);
bool load_frame_tiff(const std::string& path, pxf::PixelFrame& out,
                     std::string* err = nullptr);

} // namespace PxfIO
