// ============================================================================
//  File: src/minitest_frame.cpp — Tests PixelFrame (buffer packé 2 bits)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  [A] construction : tailles, buffer à zéro, taille 0 / 255
//  [B] set/get pixel : isolation des voisins, bornes, couleurs
//  [C] reset, batch (tout ou rien), from_raw
//  [D] notifications
// ============================================================================

#include <cstdint>
#include <iostream>
#include <random>
#include <utility>
#include <vector>

#include "pixel_frame.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pxf;

static bool all_equal(const std::vector<uint8_t>& v, uint8_t x)
{
    for(uint8_t e : v) if(e!=x) return false;
    return true;
}

// ------------------ TEST A : construction ------------------------------------
static bool test_construct()
{
    const int sizes[] = { 0, 1, 2, 3, 7, 8, 15, 16, 100, 255 };
    for(int n : sizes)
    {
        PixelFrame f((uint8_t)n);
        T_ASSERT( f.size()==n );
        T_ASSERT( f.total_pixels()==(uint32_t)(n*n) );
        T_ASSERT( f.raw_bytes().size()==(size_t)((n*n + 3)/4) );
        T_ASSERT( f.total_bytes()==f.raw_bytes().size() );
        T_ASSERT( all_equal(f.raw_bytes(), 0) );
        const std::vector<uint8_t> idx = f.all_indices();
        T_ASSERT( idx.size()==(size_t)(n*n) );
        T_ASSERT( all_equal(idx, 0) );
        const std::vector<Color24> cols = f.all_colors();
        T_ASSERT( cols.size()==(size_t)(n*n) );
        for(Color24 c : cols) T_ASSERT( c==kWhite );
    }
    PixelFrame big(255);
    T_ASSERT( big.total_pixels()==65025u );
    T_ASSERT( big.total_bytes()==16257u );
    return true;
}

// ------------------ TEST B : pixels ------------------------------------------
static bool test_scenario_8x8()
{
    PixelFrame f(8);
    T_ASSERT( f.set_pixel(5,2,2)==Status::Ok );
    T_ASSERT( f.set_pixel(2,5,3)==Status::Ok );

    uint8_t v=0;
    T_ASSERT( f.get_pixel(5,2,v)==Status::Ok && v==2 );
    T_ASSERT( f.get_pixel(2,5,v)==Status::Ok && v==3 );

    int zeros=0;
    for(int y=0; y<8; ++y)
    {
        for(int x=0; x<8; ++x)
        {
            if((x==5&&y==2) || (x==2&&y==5)) continue;
            T_ASSERT( f.get_pixel(x,y,v)==Status::Ok );
            if(v==0) ++zeros;
        }
    }
    T_ASSERT( zeros==62 );
    T_ASSERT( f.raw_bytes().size()==16 );

    // p=2*8+5=21 -> octet 5, position 1 ; p=5*8+2=42 -> octet 10, position 2
    T_ASSERT( f.raw_bytes()[5]==(2<<2) );
    T_ASSERT( f.raw_bytes()[10]==(3<<4) );

    const std::vector<uint8_t> idx = f.all_indices();
    T_ASSERT( idx[2*8+5]==2 && idx[5*8+2]==3 );
    return true;
}

static bool test_neighbors_untouched()
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> D(0, 12);
    std::uniform_int_distribution<int> I(0, 3);

    PixelFrame f(13);
    std::vector<uint8_t> model((size_t)13*13, 0);
    for(int k=0; k<2000; ++k)
    {
        const int x=D(rng), y=D(rng);
        const uint8_t idx=(uint8_t)I(rng);
        T_ASSERT( f.set_pixel(x,y,idx)==Status::Ok );
        model[(size_t)y*13+x]=idx;
    }
    T_ASSERT( f.all_indices()==model );
    return true;
}

static bool test_bounds()
{
    const int sizes[] = { 1, 5, 8, 255 };
    for(int n : sizes)
    {
        PixelFrame f((uint8_t)n);
        uint8_t v=0;
        T_ASSERT( f.set_pixel(n,0,0)==Status::CoordinatesOutOfBounds );
        T_ASSERT( f.set_pixel(0,n,0)==Status::CoordinatesOutOfBounds );
        T_ASSERT( f.set_pixel(-1,0,0)==Status::CoordinatesOutOfBounds );
        T_ASSERT( f.get_pixel(n,n,v)==Status::CoordinatesOutOfBounds );
        T_ASSERT( f.set_pixel(n-1,n-1,3)==Status::Ok );
        T_ASSERT( f.get_pixel(n-1,n-1,v)==Status::Ok && v==3 );
        // bornes vérifiées avant l'index
        T_ASSERT( f.set_pixel(n,0,9)==Status::CoordinatesOutOfBounds );
    }

    PixelFrame empty(0);
    uint8_t v=0;
    Color24 c=0;
    T_ASSERT( empty.set_pixel(0,0,0)==Status::CoordinatesOutOfBounds );
    T_ASSERT( empty.get_pixel(0,0,v)==Status::CoordinatesOutOfBounds );
    T_ASSERT( empty.get_pixel_color(0,0,c)==Status::CoordinatesOutOfBounds );
    T_ASSERT( empty.reset(1)==Status::Ok );
    T_ASSERT( empty.raw_bytes().empty() );

    PixelFrame f(4);
    T_ASSERT( f.set_pixel(1,1,4)==Status::IndexOutOfRange );
    T_ASSERT( all_equal(f.raw_bytes(), 0) );
    return true;
}

static bool test_colors()
{
    PixelFrame f(6);
    T_ASSERT( f.set_pixel_color(0,0,kPurple)==Status::Ok );
    T_ASSERT( f.set_pixel_color(5,5,0x45A2F8u)==Status::Ok );
    T_ASSERT( f.set_pixel_color(1,0,0x45A2F9u)==Status::ColorNotInPalette );
    T_ASSERT( f.set_pixel_color(6,0,kBlack)==Status::CoordinatesOutOfBounds );

    uint8_t v=0;
    Color24 c=0;
    T_ASSERT( f.get_pixel(0,0,v)==Status::Ok && v==2 );
    T_ASSERT( f.get_pixel_color(5,5,c)==Status::Ok && c==kBlue );
    T_ASSERT( f.get_pixel_color(1,0,c)==Status::Ok && c==kWhite );

    const std::vector<Color24> cols = f.all_colors();
    T_ASSERT( cols[0]==kPurple && cols[35]==kBlue && cols[1]==kWhite );
    return true;
}

// ------------------ TEST C : reset / batch / raw -----------------------------
static bool test_reset()
{
    const int sizes[] = { 0, 3, 8, 255 };
    for(int n : sizes)
    {
        PixelFrame f((uint8_t)n);
        for(uint8_t k=0; k<4; ++k)
        {
            T_ASSERT( f.reset(k)==Status::Ok );
            T_ASSERT( all_equal(f.all_indices(), k) );
        }
        T_ASSERT( f.reset(3)==Status::Ok );
        T_ASSERT( all_equal(f.raw_bytes(), 0xFF) );
        T_ASSERT( f.reset(4)==Status::IndexOutOfRange );
        T_ASSERT( all_equal(f.raw_bytes(), 0xFF) );
    }
    return true;
}

static bool test_batch()
{
    PixelFrame f(8);
    T_ASSERT( f.batch_set_pixels({0,1,2}, {0,1}, {1,2,3})==Status::ArrayLengthMismatch );
    T_ASSERT( all_equal(f.raw_bytes(), 0) );

    T_ASSERT( f.batch_set_pixels({0,1,7}, {0,1,7}, {1,2,3})==Status::Ok );
    uint8_t v=0;
    T_ASSERT( f.get_pixel(0,0,v)==Status::Ok && v==1 );
    T_ASSERT( f.get_pixel(1,1,v)==Status::Ok && v==2 );
    T_ASSERT( f.get_pixel(7,7,v)==Status::Ok && v==3 );

    // élément invalide au milieu : rien n'est écrit
    const std::vector<uint8_t> before = f.raw_bytes();
    T_ASSERT( f.batch_set_pixels({2,8,3}, {2,0,3}, {3,3,3})==Status::CoordinatesOutOfBounds );
    T_ASSERT( f.raw_bytes()==before );
    T_ASSERT( f.batch_set_pixels({2,4,3}, {2,0,3}, {3,7,3})==Status::IndexOutOfRange );
    T_ASSERT( f.raw_bytes()==before );

    // ordre gauche→droite : la dernière écriture gagne
    T_ASSERT( f.batch_set_pixels({4,4}, {4,4}, {2,1})==Status::Ok );
    T_ASSERT( f.get_pixel(4,4,v)==Status::Ok && v==1 );

    T_ASSERT( f.batch_set_pixels({}, {}, {})==Status::Ok );

    T_ASSERT( f.batch_set_pixel_colors({5,6}, {5,6}, {kPurple, kBlue})==Status::Ok );
    T_ASSERT( f.get_pixel(6,6,v)==Status::Ok && v==3 );
    const std::vector<uint8_t> snap = f.raw_bytes();
    T_ASSERT( f.batch_set_pixel_colors({0,1}, {0,1}, {kBlack, 0x111111u})==Status::ColorNotInPalette );
    T_ASSERT( f.batch_set_pixel_colors({0}, {0,1}, {kBlack})==Status::ArrayLengthMismatch );
    T_ASSERT( f.raw_bytes()==snap );
    return true;
}

static bool test_from_raw()
{
    PixelFrame f(9);
    T_ASSERT( f.batch_set_pixels({0,8,4}, {0,8,4}, {3,2,1})==Status::Ok );

    PixelFrame g;
    T_ASSERT( PixelFrame::from_raw(9, f.raw_bytes(), g)==Status::Ok );
    T_ASSERT( g==f );
    T_ASSERT( g.all_indices()==f.all_indices() );

    PixelFrame h(3);
    T_ASSERT( PixelFrame::from_raw(9, std::vector<uint8_t>(20, 0), h)==Status::ArrayLengthMismatch );
    T_ASSERT( h.size()==3 );

    PixelFrame z;
    T_ASSERT( PixelFrame::from_raw(0, {}, z)==Status::Ok );
    T_ASSERT( z.total_bytes()==0 );

    // copie indépendante (aucun partage de buffer)
    PixelFrame copy = f;
    T_ASSERT( copy.set_pixel(1,1,3)==Status::Ok );
    uint8_t v=0;
    T_ASSERT( f.get_pixel(1,1,v)==Status::Ok && v==0 );
    T_ASSERT( copy!=f );
    return true;
}

// ------------------ TEST D : notifications -----------------------------------
static bool test_events()
{
    int pixel_calls=0, last_x=-1, last_y=-1, last_idx=-1;
    size_t batch_count=0;
    int batch_calls=0, reset_calls=0, reset_idx=-1;

    FrameEvents ev;
    ev.on_pixel = [&](int x, int y, uint8_t idx){ ++pixel_calls; last_x=x; last_y=y; last_idx=idx; };
    ev.on_batch = [&](size_t n){ ++batch_calls; batch_count=n; };
    ev.on_reset = [&](uint8_t idx){ ++reset_calls; reset_idx=idx; };

    PixelFrame f(4);
    f.set_events(ev);

    T_ASSERT( f.set_pixel(3,2,1)==Status::Ok );
    T_ASSERT( pixel_calls==1 && last_x==3 && last_y==2 && last_idx==1 );
    T_ASSERT( f.set_pixel(4,0,1)==Status::CoordinatesOutOfBounds );
    T_ASSERT( f.set_pixel_color(0,0,0x123456u)==Status::ColorNotInPalette );
    T_ASSERT( pixel_calls==1 );

    T_ASSERT( f.batch_set_pixels({0,1,2}, {0,0,0}, {1,1,1})==Status::Ok );
    T_ASSERT( batch_calls==1 && batch_count==3 );
    T_ASSERT( pixel_calls==1 );
    T_ASSERT( f.batch_set_pixels({0}, {9}, {1})==Status::CoordinatesOutOfBounds );
    T_ASSERT( batch_calls==1 );

    T_ASSERT( f.reset(2)==Status::Ok );
    T_ASSERT( reset_calls==1 && reset_idx==2 );
    T_ASSERT( f.reset(5)==Status::IndexOutOfRange );
    T_ASSERT( reset_calls==1 );
    return true;
}

// Observateurs : liés à l'objet, jamais copiés avec les pixels
static bool test_events_ownership()
{
    int src_calls=0, dst_calls=0;

    PixelFrame src(4);
    FrameEvents a;
    a.on_pixel = [&](int, int, uint8_t){ ++src_calls; };
    src.set_events(a);

    // copie : aucun observateur hérité
    PixelFrame copy = src;
    T_ASSERT( copy.set_pixel(0,0,1)==Status::Ok );
    T_ASSERT( src_calls==0 );

    PixelFrame moved = std::move(copy);
    T_ASSERT( moved.set_pixel(1,0,1)==Status::Ok );
    T_ASSERT( src_calls==0 );
    T_ASSERT( copy.size()==0 && copy.total_bytes()==0 );

    // affectation : la destination garde ses observateurs
    PixelFrame dst(2);
    FrameEvents b;
    b.on_pixel = [&](int, int, uint8_t){ ++dst_calls; };
    dst.set_events(b);
    dst = src;
    T_ASSERT( dst.size()==4 && dst==src );
    T_ASSERT( dst.set_pixel(3,3,2)==Status::Ok );
    T_ASSERT( dst_calls==1 && src_calls==0 );

    T_ASSERT( PixelFrame::from_raw(2, std::vector<uint8_t>(1, 0xFF), dst)==Status::Ok );
    T_ASSERT( dst.size()==2 );
    T_ASSERT( dst.set_pixel(1,1,0)==Status::Ok );
    T_ASSERT( dst_calls==2 );

    T_ASSERT( src.set_pixel(2,2,3)==Status::Ok );
    T_ASSERT( src_calls==1 && dst_calls==2 );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_construct();
    std::cout << "[A] construct : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_scenario_8x8();
    ok &= test_neighbors_untouched();
    ok &= test_bounds();
    ok &= test_colors();
    std::cout << "[B] pixels : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_reset();
    ok &= test_batch();
    ok &= test_from_raw();
    std::cout << "[C] reset/batch/raw : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_events();
    ok &= test_events_ownership();
    std::cout << "[D] events : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
