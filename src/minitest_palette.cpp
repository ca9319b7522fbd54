// ============================================================================
//  File: src/minitest_palette.cpp — Tests codec couleur + palette 2 bits
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  [A] pack/unpack RGB <-> 24 bits (exhaustif sur r,g,b ∈ [0,255]³)
//  [B] palette : bijection couleur <-> index, erreurs
//  [C] octet packé : pack/unpack, position get/set, erreurs
//  [D] séquences et noms
// ============================================================================

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "pxf_color.hpp"
#include "pxf_palette.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pxf;

// ------------------ TEST A : codec couleur -----------------------------------
static bool test_color_codec()
{
    T_ASSERT( pack_color(255,128,64)==0xFF8040u );
    T_ASSERT( unpack_red(0xFF8040u)==255 );
    T_ASSERT( unpack_green(0xFF8040u)==128 );
    T_ASSERT( unpack_blue(0xFF8040u)==64 );

    for(int r=0; r<256; ++r)
    {
        for(int g=0; g<256; ++g)
        {
            for(int b=0; b<256; ++b)
            {
                const Color24 c = pack_color((uint8_t)r,(uint8_t)g,(uint8_t)b);
                uint8_t r2,g2,b2;
                unpack_color(c, r2, g2, b2);
                if(r2!=r || g2!=g || b2!=b || c>kColorMask)
                {
                    std::cerr<<"[FAIL] roundtrip rgb("<<r<<","<<g<<","<<b<<")\n";
                    return false;
                }
            }
        }
    }
    return true;
}

static bool test_color_hex()
{
    T_ASSERT( color_to_hex(0x8C1C84u)=="#8C1C84" );
    T_ASSERT( color_to_hex(0x000000u)=="#000000" );
    T_ASSERT( color_to_hex(0x45A2F8u)=="#45A2F8" );

    Color24 c=0;
    T_ASSERT( parse_color_hex("#45a2f8", c) && c==0x45A2F8u );
    T_ASSERT( parse_color_hex("0xFFFFFF", c) && c==0xFFFFFFu );
    T_ASSERT( parse_color_hex("8C1C84", c) && c==0x8C1C84u );
    T_ASSERT( !parse_color_hex("#12345", c) );
    T_ASSERT( !parse_color_hex("#12345G", c) );
    T_ASSERT( !parse_color_hex("", c) );
    return true;
}

// ------------------ TEST B : palette -----------------------------------------
static bool test_palette_mapping()
{
    const Color24 expect[4] = { 0xFFFFFFu, 0x000000u, 0x8C1C84u, 0x45A2F8u };
    for(uint8_t i=0; i<4; ++i)
    {
        Color24 c=0;
        uint8_t back=99;
        T_ASSERT( color_from_index(i, c)==Status::Ok );
        T_ASSERT( c==expect[i] );
        T_ASSERT( color_index(c, back)==Status::Ok );
        T_ASSERT( back==i );
    }

    Color24 c=0x123456u;
    T_ASSERT( color_from_index(4, c)==Status::IndexOutOfRange );
    T_ASSERT( color_from_index(255, c)==Status::IndexOutOfRange );
    T_ASSERT( c==0x123456u ); // sortie intacte en cas d'échec

    uint8_t idx=7;
    T_ASSERT( color_index(0xFFFFFEu, idx)==Status::ColorNotInPalette );
    T_ASSERT( color_index(0x8C1C85u, idx)==Status::ColorNotInPalette );
    T_ASSERT( color_index(0x01000000u, idx)==Status::ColorNotInPalette );
    T_ASSERT( idx==7 );
    return true;
}

// ------------------ TEST C : octet packé -------------------------------------
static bool test_pack_indices()
{
    uint8_t b=0;
    T_ASSERT( pack_indices({0,1,2,3}, b)==Status::Ok );
    T_ASSERT( b==0xE4 );

    const std::array<uint8_t,4> q = unpack_indices(0xE4);
    T_ASSERT( q[0]==0 && q[1]==1 && q[2]==2 && q[3]==3 );

    T_ASSERT( pack_indices({}, b)==Status::Ok && b==0 );
    T_ASSERT( pack_indices({3}, b)==Status::Ok && b==0x03 );
    T_ASSERT( pack_indices({0,0,1}, b)==Status::Ok && b==0x10 );

    // tous les préfixes de longueur <= 4 sur {0..3}
    for(int len=0; len<=4; ++len)
    {
        int combos=1;
        for(int k=0; k<len; ++k) combos*=4;
        for(int m=0; m<combos; ++m)
        {
            std::vector<uint8_t> xs;
            int v=m;
            for(int k=0; k<len; ++k){ xs.push_back((uint8_t)(v%4)); v/=4; }
            T_ASSERT( pack_indices(xs, b)==Status::Ok );
            const std::array<uint8_t,4> u = unpack_indices(b);
            for(int k=0; k<len; ++k) T_ASSERT( u[(size_t)k]==xs[(size_t)k] );
        }
    }

    b=0x5A;
    T_ASSERT( pack_indices({0,1,2,3,0}, b)==Status::TooManyIndices );
    T_ASSERT( pack_indices({0,4}, b)==Status::IndexOutOfRange );
    T_ASSERT( b==0x5A );
    // TooManyIndices prime sur un index invalide
    T_ASSERT( pack_indices({9,9,9,9,9}, b)==Status::TooManyIndices );
    return true;
}

static bool test_positions()
{
    uint8_t idx=0;
    for(uint8_t p=0; p<4; ++p)
    {
        T_ASSERT( index_at_position(0xE4, p, idx)==Status::Ok );
        T_ASSERT( idx==p );
    }
    T_ASSERT( index_at_position(0xE4, 4, idx)==Status::PositionOutOfRange );

    uint8_t out=0;
    T_ASSERT( set_index_at_position(0xE4, 0, 3, out)==Status::Ok );
    T_ASSERT( out==0xE7 );
    T_ASSERT( set_index_at_position(0xFF, 2, 0, out)==Status::Ok );
    T_ASSERT( out==0xCF );
    T_ASSERT( set_index_at_position(0x00, 3, 2, out)==Status::Ok );
    T_ASSERT( out==0x80 );

    out=0x11;
    T_ASSERT( set_index_at_position(0x00, 4, 1, out)==Status::PositionOutOfRange );
    T_ASSERT( set_index_at_position(0x00, 1, 4, out)==Status::IndexOutOfRange );
    T_ASSERT( set_index_at_position(0x00, 9, 9, out)==Status::PositionOutOfRange );
    T_ASSERT( out==0x11 );

    uint8_t tmpl=0;
    T_ASSERT( fill_byte(2, tmpl)==Status::Ok && tmpl==0xAA );
    T_ASSERT( fill_byte(4, tmpl)==Status::IndexOutOfRange );
    return true;
}

// ------------------ TEST D : séquences & noms --------------------------------
static bool test_sequences()
{
    std::vector<uint8_t> idx;
    T_ASSERT( colors_to_indices({kBlue, kWhite, kPurple, kBlack}, idx)==Status::Ok );
    T_ASSERT( (idx==std::vector<uint8_t>{3,0,2,1}) );

    std::vector<uint8_t> keep = {9};
    T_ASSERT( colors_to_indices({kBlue, 0x010203u, kWhite}, keep)==Status::ColorNotInPalette );
    T_ASSERT( keep.size()==1 && keep[0]==9 );

    std::vector<Color24> cols;
    T_ASSERT( indices_to_colors({0,1,2,3}, cols)==Status::Ok );
    T_ASSERT( (cols==std::vector<Color24>{kWhite, kBlack, kPurple, kBlue}) );
    T_ASSERT( indices_to_colors({0,5,1}, cols)==Status::IndexOutOfRange );
    T_ASSERT( cols.size()==4 );
    return true;
}

static bool test_names()
{
    uint8_t idx=0;
    T_ASSERT( std::string(color_name(2))=="purple" );
    T_ASSERT( color_name(4)==nullptr );
    T_ASSERT( index_from_name("Blue", idx)==Status::Ok && idx==3 );
    T_ASSERT( index_from_name("WHITE", idx)==Status::Ok && idx==0 );
    T_ASSERT( index_from_name("red", idx)==Status::IndexOutOfRange );
    T_ASSERT( std::string(status_name(Status::TooManyIndices))=="TooManyIndices" );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_color_codec();
    ok &= test_color_hex();
    std::cout << "[A] color codec : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_palette_mapping();
    std::cout << "[B] palette : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_pack_indices();
    ok &= test_positions();
    std::cout << "[C] packed byte : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_sequences();
    ok &= test_names();
    std::cout << "[D] sequences/names : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
