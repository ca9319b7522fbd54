// ============================================================================
//  File: src/minitest_containers.cpp — Tests .pxf / PNG / TIFF
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  [A] .pxf : écriture/lecture, méta, CRC, rejets (magic, longueur, CRC)
//  [B] PNG  : export scale s puis import scale s => mêmes index
//  [C] TIFF : palette 2 bits (SKIP si compilé sans libtiff)
// ============================================================================

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "io_frame_image.hpp"
#include "io_pxf.hpp"
#include "pixel_frame.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pxf;

static std::string tmp_path(const char* name)
{
    return (std::filesystem::temp_directory_path() / name).string();
}

static std::vector<uint8_t> slurp(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
}

static bool spit(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream f(path, std::ios::binary);
    f.write((const char*)bytes.data(), (std::streamsize)bytes.size());
    return (bool)f;
}

// Motif déterministe : diagonales des 4 couleurs
static PixelFrame make_pattern(uint8_t n)
{
    PixelFrame f(n);
    std::vector<int> xs, ys;
    std::vector<uint8_t> idx;
    for(int y=0; y<n; ++y)
    {
        for(int x=0; x<n; ++x)
        {
            xs.push_back(x);
            ys.push_back(y);
            idx.push_back((uint8_t)((x + 2*y) % 4));
        }
    }
    if(!ok(f.batch_set_pixels(xs, ys, idx))) return PixelFrame(0);
    return f;
}

// ------------------ TEST A : .pxf --------------------------------------------
static bool test_pxf_roundtrip()
{
    const std::string path = tmp_path("pxf_minitest_a.pxf");
    const uint8_t sizes[] = { 0, 1, 7, 32, 255 };
    for(uint8_t n : sizes)
    {
        const PixelFrame f = make_pattern(n);
        std::string err;
        T_ASSERT( PxfContainer::pxf_write(path, f, PxfContainer::meta_make("diag \"q\""), &err) );

        PixelFrame g;
        std::string meta;
        T_ASSERT( PxfContainer::pxf_read(path, g, &meta, &err) );
        T_ASSERT( g==f );
        T_ASSERT( g.raw_bytes()==f.raw_bytes() );

        std::string title;
        T_ASSERT( PxfContainer::meta_find_str(meta, "title", title) );
        T_ASSERT( title=="diag \"q\"" );

        // taille fichier = 20 (en-tête) + méta + payload + 4 (CRC)
        T_ASSERT( slurp(path).size()==20 + meta.size() + f.total_bytes() + 4 );
    }
    std::remove(path.c_str());
    return true;
}

static bool test_pxf_rejects()
{
    const std::string path = tmp_path("pxf_minitest_b.pxf");
    const PixelFrame f = make_pattern(10);
    T_ASSERT( PxfContainer::pxf_write(path, f, "{}") );
    const std::vector<uint8_t> good = slurp(path);
    T_ASSERT( good.size()==20 + 2 + 25 + 4 );

    PixelFrame g(3);
    std::string err;

    // payload altéré -> CRC
    std::vector<uint8_t> bad = good;
    bad[20 + 2 + 5] ^= 0x01;
    T_ASSERT( spit(path, bad) );
    T_ASSERT( !PxfContainer::pxf_read(path, g, nullptr, &err) );
    T_ASSERT( err=="pxf: payload crc mismatch" );
    T_ASSERT( g.size()==3 );

    // magic
    bad = good;
    bad[0] = 'Q';
    T_ASSERT( spit(path, bad) );
    T_ASSERT( !PxfContainer::pxf_read(path, g, nullptr, &err) );
    T_ASSERT( err=="pxf: bad magic" );

    // en-tête altéré (taille) -> CRC d'en-tête
    bad = good;
    bad[5] = 11;
    T_ASSERT( spit(path, bad) );
    T_ASSERT( !PxfContainer::pxf_read(path, g, nullptr, &err) );
    T_ASSERT( err=="pxf: header crc mismatch" );

    // fichier tronqué
    bad.assign(good.begin(), good.end()-3);
    T_ASSERT( spit(path, bad) );
    T_ASSERT( !PxfContainer::pxf_read(path, g, nullptr, &err) );

    std::remove(path.c_str());
    T_ASSERT( !PxfContainer::pxf_read(path, g, nullptr, &err) );
    return true;
}

static bool test_meta_escaping()
{
    const std::string title = "a\"b\\c\nd\te\x01" "f";
    const std::string meta = PxfContainer::meta_make(title);
    T_ASSERT( meta=="{\"title\":\"a\\\"b\\\\c\\nd\\te\\u0001f\"}" );
    // aucun caractère de contrôle brut dans la méta écrite
    for(char c : meta) T_ASSERT( (unsigned char)c>=0x20 );

    std::string back;
    T_ASSERT( PxfContainer::meta_find_str(meta, "title", back) );
    T_ASSERT( back==title );

    T_ASSERT( PxfContainer::json_escape("plain")=="plain" );
    T_ASSERT( PxfContainer::json_escape("C:\\tmp\\\"x\".pxf")=="C:\\\\tmp\\\\\\\"x\\\".pxf" );

    // passage par le fichier
    const std::string path = tmp_path("pxf_minitest_e.pxf");
    T_ASSERT( PxfContainer::pxf_write(path, make_pattern(3), meta) );
    PixelFrame g;
    std::string meta2;
    T_ASSERT( PxfContainer::pxf_read(path, g, &meta2) );
    back.clear();
    T_ASSERT( PxfContainer::meta_find_str(meta2, "title", back) && back==title );
    std::remove(path.c_str());
    return true;
}

// pxf_read remplace les pixels, pas les observateurs de la frame cible
static bool test_read_keeps_observers()
{
    const std::string path = tmp_path("pxf_minitest_f.pxf");
    T_ASSERT( PxfContainer::pxf_write(path, make_pattern(6), "{}") );

    int calls=0;
    PixelFrame g(2);
    FrameEvents ev;
    ev.on_pixel = [&](int, int, uint8_t){ ++calls; };
    g.set_events(ev);
    T_ASSERT( PxfContainer::pxf_read(path, g) );
    T_ASSERT( g==make_pattern(6) );
    T_ASSERT( calls==0 );
    T_ASSERT( g.set_pixel(5,5,0)==Status::Ok );
    T_ASSERT( calls==1 );
    std::remove(path.c_str());
    return true;
}

static bool test_crc32()
{
    const char* s = "123456789";
    T_ASSERT( PxfContainer::crc32(s, 9)==0xCBF43926u );
    T_ASSERT( PxfContainer::crc32(nullptr, 0)==0u );
    return true;
}

// ------------------ TEST B : PNG ---------------------------------------------
static bool test_png_roundtrip()
{
    const std::string path = tmp_path("pxf_minitest_c.png");
    const PixelFrame f = make_pattern(12);
    const int scales[] = { 1, 3 };
    for(int s : scales)
    {
        std::string err;
        T_ASSERT( PxfIO::save_frame_png(path, f, s, &err) );
        PixelFrame g;
        T_ASSERT( PxfIO::load_frame_png(path, s, g, &err) );
        T_ASSERT( g.size()==12 );
        T_ASSERT( g.all_indices()==f.all_indices() );
    }

    // scale incompatible : 36 px / 5 non entier
    PixelFrame g;
    std::string err;
    T_ASSERT( !PxfIO::load_frame_png(path, 5, g, &err) );
    std::remove(path.c_str());

    T_ASSERT( !PxfIO::save_frame_png(path, PixelFrame(0), 1, &err) );
    return true;
}

static bool test_raster_scale_limit()
{
    const PixelFrame f = make_pattern(255);
    PxfIO::ImageRGB8 img;
    img.w = 7;
    std::string err;

    // 255 * 100000000 dépasserait int : refus propre, sortie intacte
    T_ASSERT( !PxfIO::frame_to_rgb(f, 100000000, img, &err) );
    T_ASSERT( err.find("scale must be in")!=std::string::npos );
    T_ASSERT( img.w==7 && img.data.empty() );
    T_ASSERT( !PxfIO::frame_to_rgb(f, kMaxScale+1, img) );
    T_ASSERT( !PxfIO::frame_to_rgb(f, 0, img) );
    T_ASSERT( !PxfIO::frame_to_rgb(f, -3, img) );

    const std::string path = tmp_path("pxf_minitest_g.png");
    std::remove(path.c_str());
    T_ASSERT( !PxfIO::save_frame_png(path, f, 1000, &err) );
    T_ASSERT( !std::filesystem::exists(path) );

    // borne incluse
    T_ASSERT( PxfIO::frame_to_rgb(make_pattern(2), kMaxScale, img) );
    T_ASSERT( img.w==2*kMaxScale && img.data.size()==(size_t)img.w*img.h*3 );
    return true;
}

static bool test_rgb_bridge()
{
    const PixelFrame f = make_pattern(5);
    PxfIO::ImageRGB8 img;
    T_ASSERT( PxfIO::frame_to_rgb(f, 2, img) );
    T_ASSERT( img.w==10 && img.h==10 && img.data.size()==300 );
    // pixel (1,0) = index 1 = noir, bloc 2x2 en (2..3, 0..1)
    T_ASSERT( img.data[(0*10+2)*3]==0 && img.data[(1*10+3)*3+2]==0 );
    // pixel (0,0) = index 0 = blanc
    T_ASSERT( img.data[0]==255 && img.data[1]==255 && img.data[2]==255 );

    PixelFrame g;
    std::string err;
    T_ASSERT( PxfIO::rgb_to_frame(img, 2, g, &err) );
    T_ASSERT( g==f );

    // couleur hors palette -> rejet
    img.data[0] = 254;
    T_ASSERT( !PxfIO::rgb_to_frame(img, 2, g, &err) );
    T_ASSERT( err.find("not in palette")!=std::string::npos );

    // bloc non uniforme (pixel hors coin haut-gauche) -> rejet
    img.data[0] = 255;
    T_ASSERT( PxfIO::rgb_to_frame(img, 2, g) );
    const size_t inner = ((size_t)1*10 + 1)*3;   // (1,1) : bloc du pixel (0,0)
    img.data[inner+0] = 0;
    img.data[inner+1] = 0;
    img.data[inner+2] = 0;                       // noir : couleur palette, mais bloc mixte
    T_ASSERT( !PxfIO::rgb_to_frame(img, 2, g, &err) );
    T_ASSERT( err.find("not uniform")!=std::string::npos );
    img.data[inner+0] = 1;                       // hors palette dans le bloc
    T_ASSERT( !PxfIO::rgb_to_frame(img, 2, g, &err) );
    T_ASSERT( g==f );
    // scale 1 : chaque pixel est son propre bloc, l'erreur devient "not in palette"
    T_ASSERT( !PxfIO::rgb_to_frame(img, 1, g, &err) );
    T_ASSERT( err.find("not in palette")!=std::string::npos );

    // non carrée
    PxfIO::ImageRGB8 rect;
    rect.w=4;
    rect.h=2;
    rect.data.assign(24, 255);
    T_ASSERT( !PxfIO::rgb_to_frame(rect, 1, g, &err) );
    return true;
}

// ------------------ TEST C : TIFF --------------------------------------------
static bool test_tiff_roundtrip()
{
    std::string err;
    const std::string path = tmp_path("pxf_minitest_d.tif");
    if(!PxfIO::tiff_available())
    {
        T_ASSERT( !PxfIO::save_frame_tiff(path, make_pattern(4), &err) );
        std::cout << "[SKIP] TIFF (PXF_USE_TIFF non défini)\n";
        return true;
    }
    const uint8_t sizes[] = { 1, 5, 16, 255 };
    for(uint8_t n : sizes)
    {
        const PixelFrame f = make_pattern(n);
        T_ASSERT( PxfIO::save_frame_tiff(path, f, &err) );
        PixelFrame g;
        T_ASSERT( PxfIO::load_frame_tiff(path, g, &err) );
        T_ASSERT( g==f );
    }
    std::remove(path.c_str());
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_pxf_roundtrip();
    ok &= test_pxf_rejects();
    ok &= test_crc32();
    ok &= test_meta_escaping();
    ok &= test_read_keeps_observers();
    std::cout << "[A] pxf container : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_png_roundtrip();
    ok &= test_rgb_bridge();
    ok &= test_raster_scale_limit();
    std::cout << "[B] png bridge : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_tiff_roundtrip();
    std::cout << "[C] tiff bridge : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
