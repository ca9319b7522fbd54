// ============================================================================
//  File: src/io_frame_image.cpp — Pont PixelFrame <-> PNG / TIFF
// ============================================================================

#include "io_frame_image.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "stb_image.h"
#include "stb_image_write.h"

#ifdef PXF_USE_TIFF
#include <tiffio.h>
#endif

using namespace PxfIO;

namespace {

void set_err(std::string* e, const std::string& msg)
{
    if(e) *e = msg;
}

struct StbPixels {
    unsigned char* p=nullptr;
    ~StbPixels(){ if(p) stbi_image_free(p); }
};

} // namespace

// == [1] Frame <-> RGB8 ======================================================
bool PxfIO::frame_to_rgb(const pxf::PixelFrame& frame, int scale, ImageRGB8& out, std::string* err)
{
    if(scale<1 || scale>pxf::kMaxScale)
    {
        set_err(err, "image: scale must be in [1," + std::to_string(pxf::kMaxScale) + "]");
        return false;
    }
    const int n = frame.size();
    ImageRGB8 img;
    img.w = n*scale;
    img.h = n*scale;
    img.c = 3;
    img.data.assign((size_t)img.w*img.h*3, 0);

    const std::vector<pxf::Color24> colors = frame.all_colors();
    for(int y=0; y<img.h; ++y)
    {
        uint8_t* row = &img.data[(size_t)y*img.w*3];
        for(int x=0; x<img.w; ++x)
        {
            const pxf::Color24 c = colors[(size_t)(y/scale)*n + (size_t)(x/scale)];
            pxf::unpack_color(c, row[x*3+0], row[x*3+1], row[x*3+2]);
        }
    }
    out = std::move(img);
    return true;
}

bool PxfIO::rgb_to_frame(const ImageRGB8& img, int scale, pxf::PixelFrame& out, std::string* err)
{
    if(scale<1)
    {
        set_err(err, "image: scale must be >= 1");
        return false;
    }
    if(img.c!=3 || img.data.size()!=(size_t)img.w*img.h*3)
    {
        set_err(err, "image: expected packed RGB8");
        return false;
    }
    if(img.w!=img.h)
    {
        set_err(err, "image: not square");
        return false;
    }
    if(img.w%scale!=0)
    {
        set_err(err, "image: side is not a multiple of scale");
        return false;
    }
    const int n = img.w/scale;
    if(n>255)
    {
        set_err(err, "image: frame side exceeds 255");
        return false;
    }

    const auto at = [&](size_t px, size_t py){
        const uint8_t* p = &img.data[(py*(size_t)img.w + px)*3];
        return pxf::pack_color(p[0], p[1], p[2]);
    };

    pxf::PixelFrame f((uint8_t)n);
    for(int y=0; y<n; ++y)
    {
        for(int x=0; x<n; ++x)
        {
            const size_t x0 = (size_t)x*scale, y0 = (size_t)y*scale;
            const pxf::Color24 c = at(x0, y0);
            uint8_t idx=0;
            if(!pxf::ok(pxf::color_index(c, idx)))
            {
                set_err(err, "image: color " + pxf::color_to_hex(c) +
                             " not in palette at (" + std::to_string(x) + "," + std::to_string(y) + ")");
                return false;
            }
            // bloc scale×scale : couleur uniforme exigée
            for(size_t by=0; by<(size_t)scale; ++by)
            {
                for(size_t bx=0; bx<(size_t)scale; ++bx)
                {
                    if(at(x0+bx, y0+by)!=c)
                    {
                        set_err(err, "image: block (" + std::to_string(x) + "," + std::to_string(y) +
                                     ") is not uniform");
                        return false;
                    }
                }
            }
            if(!pxf::ok(f.set_pixel(x, y, idx)))
            {
                set_err(err, "image: pixel write failed");
                return false;
            }
        }
    }
    out = std::move(f);
    return true;
}

// == [2] PNG (stb) ===========================================================
bool PxfIO::save_frame_png(const std::string& path, const pxf::PixelFrame& frame, int scale,
                           std::string* err)
{
    if(frame.size()==0)
    {
        set_err(err, "png: empty frame");
        return false;
    }
    ImageRGB8 img;
    if(!frame_to_rgb(frame, scale, img, err)) return false;
    if(stbi_write_png(path.c_str(), img.w, img.h, 3, img.data.data(), img.w*3)==0)
    {
        set_err(err, "png: write failed: " + path);
        return false;
    }
    return true;
}

bool PxfIO::load_frame_png(const std::string& path, int scale, pxf::PixelFrame& out,
                           std::string* err)
{
    int x=0,y=0,n=0;
    StbPixels pix;
    pix.p = stbi_load(path.c_str(), &x, &y, &n, 3);
    if(!pix.p)
    {
        const char* why = stbi_failure_reason();
        set_err(err, std::string("png: load failed: ") + (why? why : path.c_str()));
        return false;
    }
    ImageRGB8 img;
    img.w=x;
    img.h=y;
    img.c=3;
    img.data.assign(pix.p, pix.p+(size_t)x*y*3);
    return rgb_to_frame(img, scale, out, err);
}

// == [3] TIFF palette 2 bits (libtiff) ======================================
#ifdef PXF_USE_TIFF

namespace {

struct Tiff {
    TIFF* t=nullptr;
    ~Tiff(){ if(t) TIFFClose(t); }
};

} // namespace

bool PxfIO::tiff_available(){ return true; }

bool PxfIO::save_frame_tiff(const std::string& path, const pxf::PixelFrame& frame,
                            std::string* err)
{
    const uint32_t n = frame.size();
    if(n==0)
    {
        set_err(err, "tiff: empty frame");
        return false;
    }
    Tiff tif;
    tif.t = TIFFOpen(path.c_str(), "w");
    if(!tif.t)
    {
        set_err(err, "tiff: create failed: " + path);
        return false;
    }

    uint16_t cr[pxf::kPaletteSize], cg[pxf::kPaletteSize], cb[pxf::kPaletteSize];
    for(uint8_t i=0; i<pxf::kPaletteSize; ++i)
    {
        const pxf::Color24 c = pxf::kPaletteColors[i];
        cr[i] = (uint16_t)(pxf::unpack_red(c)*257);
        cg[i] = (uint16_t)(pxf::unpack_green(c)*257);
        cb[i] = (uint16_t)(pxf::unpack_blue(c)*257);
    }

    TIFFSetField(tif.t, TIFFTAG_IMAGEWIDTH,  n);
    TIFFSetField(tif.t, TIFFTAG_IMAGELENGTH, n);
    TIFFSetField(tif.t, TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tif.t, TIFFTAG_BITSPERSAMPLE, pxf::kBitsPerPixel);
    TIFFSetField(tif.t, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
    TIFFSetField(tif.t, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif.t, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_PALETTE);
    TIFFSetField(tif.t, TIFFTAG_COLORMAP, cr, cg, cb);
    TIFFSetField(tif.t, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(tif.t, 0));

    const std::vector<uint8_t> idx = frame.all_indices();
    std::vector<uint8_t> line((n*pxf::kBitsPerPixel + 7)/8);
    for(uint32_t y=0; y<n; ++y)
    {
        std::fill(line.begin(), line.end(), 0);
        for(uint32_t x=0; x<n; ++x)
        {
            // TIFF : premier pixel dans les bits de poids fort
            const unsigned shift = 6 - (x%4)*2;
            line[x/4] = (uint8_t)(line[x/4] | (idx[(size_t)y*n + x] << shift));
        }
        if(TIFFWriteScanline(tif.t, line.data(), y, 0)<0)
        {
            set_err(err, "tiff: write scanline failed");
            return false;
        }
    }
    return true;
}

bool PxfIO::load_frame_tiff(const std::string& path, pxf::PixelFrame& out,
                            std::string* err)
{
    Tiff tif;
    tif.t = TIFFOpen(path.c_str(), "r");
    if(!tif.t)
    {
        set_err(err, "tiff: open failed: " + path);
        return false;
    }
    uint32_t w=0,h=0;
    uint16_t spp=0,bps=0,photo=0;
    TIFFGetField(tif.t, TIFFTAG_IMAGEWIDTH, &w);
    TIFFGetField(tif.t, TIFFTAG_IMAGELENGTH, &h);
    TIFFGetFieldDefaulted(tif.t, TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tif.t, TIFFTAG_BITSPERSAMPLE, &bps);
    TIFFGetField(tif.t, TIFFTAG_PHOTOMETRIC, &photo);
    if(spp!=1 || bps!=pxf::kBitsPerPixel || photo!=PHOTOMETRIC_PALETTE)
    {
        set_err(err, "tiff: expected 2-bit palette image");
        return false;
    }
    if(w!=h || w==0 || w>255)
    {
        set_err(err, "tiff: expected square image with side 1..255");
        return false;
    }

    uint16_t *cr=nullptr, *cg=nullptr, *cb=nullptr;
    if(!TIFFGetField(tif.t, TIFFTAG_COLORMAP, &cr, &cg, &cb))
    {
        set_err(err, "tiff: missing colormap");
        return false;
    }
    // entrée colormap -> index palette (-1 si couleur hors palette)
    int lut[pxf::kPaletteSize];
    for(uint8_t i=0; i<pxf::kPaletteSize; ++i)
    {
        uint8_t idx=0;
        const pxf::Color24 c = pxf::pack_color((uint8_t)(cr[i]>>8), (uint8_t)(cg[i]>>8), (uint8_t)(cb[i]>>8));
        lut[i] = pxf::ok(pxf::color_index(c, idx)) ? (int)idx : -1;
    }

    pxf::PixelFrame f((uint8_t)w);
    std::vector<uint8_t> line((size_t)TIFFScanlineSize(tif.t));
    for(uint32_t y=0; y<h; ++y)
    {
        if(TIFFReadScanline(tif.t, line.data(), y, 0)<0)
        {
            set_err(err, "tiff: read scanline failed");
            return false;
        }
        for(uint32_t x=0; x<w; ++x)
        {
            const unsigned shift = 6 - (x%4)*2;
            const uint8_t entry = (uint8_t)((line[x/4] >> shift) & pxf::kIndexMask);
            if(lut[entry]<0)
            {
                set_err(err, "tiff: colormap entry not in palette");
                return false;
            }
            if(!pxf::ok(f.set_pixel((int)x, (int)y, (uint8_t)lut[entry])))
            {
                set_err(err, "tiff: pixel write failed");
                return false;
            }
        }
    }
    out = std::move(f);
    return true;
}

#else

bool PxfIO::tiff_available(){ return false; }

bool PxfIO::save_frame_tiff(const std::string&, const pxf::PixelFrame&, std::string* err)
{
    set_err(err, "tiff: built without libtiff (PXF_USE_TIFF)");
    return false;
}

bool PxfIO::load_frame_tiff(const std::string&, pxf::PixelFrame&, std::string* err)
{
    set_err(err, "tiff: built without libtiff (PXF_USE_TIFF)");
    return false;
}

#endif
