// ============================================================================
//  File: src/minitest_render.cpp — Tests vues ASCII / SVG
//  Project: pixframe 2-bit Pixel-Art Frames v1
// ============================================================================

#include <cstdint>
#include <iostream>
#include <string>

#include "frame_render.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pxf;

static size_t count_of(const std::string& s, const std::string& needle)
{
    size_t n=0;
    for(size_t p=s.find(needle); p!=std::string::npos; p=s.find(needle, p+needle.size())) ++n;
    return n;
}

// ------------------ TEST A : ASCII -------------------------------------------
static bool test_ascii()
{
    PixelFrame f(3);
    T_ASSERT( render_ascii(f)=="...\n...\n...\n" );

    T_ASSERT( f.set_pixel(0,0,1)==Status::Ok );
    T_ASSERT( f.set_pixel(2,1,2)==Status::Ok );
    T_ASSERT( f.set_pixel(1,2,3)==Status::Ok );
    T_ASSERT( render_ascii(f)=="#..\n..%\n.@.\n" );

    RenderOptions ro;
    ro.glyphs = "WKPB";
    T_ASSERT( render_ascii(f, ro)=="KWW\nWWP\nWBW\n" );

    ro.glyphs = "";
    T_ASSERT( render_ascii(f, ro)=="100\n002\n030\n" );

    T_ASSERT( render_ascii(PixelFrame(0)).empty() );
    return true;
}

// ------------------ TEST B : SVG ---------------------------------------------
static bool test_svg_header()
{
    PixelFrame f(4);
    RenderOptions ro;
    ro.scale = 5;
    const std::string svg = render_svg(f, ro);
    T_ASSERT( svg.compare(0, 4, "<svg")==0 );
    T_ASSERT( svg.find("width=\"20\" height=\"20\"")!=std::string::npos );
    T_ASSERT( svg.find("viewBox=\"0 0 4 4\"")!=std::string::npos );
    T_ASSERT( svg.find("shape-rendering=\"crispEdges\"")!=std::string::npos );
    T_ASSERT( svg.size()>=7 && svg.compare(svg.size()-7, 7, "</svg>\n")==0 );
    // frame blanche, runs fusionnés : 1 rect par ligne
    T_ASSERT( count_of(svg, "<rect")==4 );
    T_ASSERT( count_of(svg, "fill=\"#FFFFFF\"")==4 );
    T_ASSERT( svg.find("<rect x=\"0\" y=\"2\" width=\"4\" height=\"1\" fill=\"#FFFFFF\"/>")!=std::string::npos );
    return true;
}

static bool test_svg_runs_and_background()
{
    PixelFrame f(4);
    T_ASSERT( f.batch_set_pixels({1,2,3}, {0,0,0}, {2,2,3})==Status::Ok );

    RenderOptions ro;
    std::string svg = render_svg(f, ro);
    // ligne 0 : W | PP | B -> 3 rects ; lignes 1..3 : 1 rect chacune
    T_ASSERT( count_of(svg, "<rect")==6 );
    T_ASSERT( svg.find("<rect x=\"1\" y=\"0\" width=\"2\" height=\"1\" fill=\"#8C1C84\"/>")!=std::string::npos );
    T_ASSERT( svg.find("<rect x=\"3\" y=\"0\" width=\"1\" height=\"1\" fill=\"#45A2F8\"/>")!=std::string::npos );

    ro.merge_runs = false;
    svg = render_svg(f, ro);
    T_ASSERT( count_of(svg, "<rect")==16 );

    // fond blanc : un rect plein, puis seulement les pixels non blancs
    ro.merge_runs = true;
    ro.background = 0;
    svg = render_svg(f, ro);
    T_ASSERT( count_of(svg, "<rect")==3 );
    T_ASSERT( svg.find("<rect x=\"0\" y=\"0\" width=\"4\" height=\"4\" fill=\"#FFFFFF\"/>")!=std::string::npos );

    // index de fond hors palette : ignoré
    ro.background = 7;
    svg = render_svg(f, ro);
    T_ASSERT( count_of(svg, "<rect")==6 );

    // déterminisme
    T_ASSERT( render_svg(f, ro)==svg );
    return true;
}

static bool test_svg_empty()
{
    const std::string svg = render_svg(PixelFrame(0));
    T_ASSERT( count_of(svg, "<rect")==0 );
    T_ASSERT( svg.find("viewBox=\"0 0 0 0\"")!=std::string::npos );
    return true;
}

static bool test_svg_large_scale()
{
    // 255 * 100000000 dépasse int : dimensions calculées en 64 bits
    RenderOptions ro;
    ro.scale = 100000000;
    const std::string svg = render_svg(PixelFrame(255), ro);
    T_ASSERT( svg.find("width=\"25500000000\" height=\"25500000000\"")!=std::string::npos );
    T_ASSERT( svg.find("viewBox=\"0 0 255 255\"")!=std::string::npos );
    T_ASSERT( svg.find("=\"-")==std::string::npos );

    ro.scale = 2147483647;
    const std::string big = render_svg(PixelFrame(255), ro);
    T_ASSERT( big.find("width=\"547608329985\"")!=std::string::npos );

    // scale <= 0 : ramené à 1
    ro.scale = -5;
    T_ASSERT( render_svg(PixelFrame(3), ro).find("width=\"3\" height=\"3\"")!=std::string::npos );
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main()
{
    bool ok = true;

    ok &= test_ascii();
    std::cout << "[A] ascii : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_svg_header();
    ok &= test_svg_runs_and_background();
    ok &= test_svg_empty();
    ok &= test_svg_large_scale();
    std::cout << "[B] svg : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
