// ============================================================================
//  File: src/minitest_cli.cpp — Tests pxftool (codes retour, fichiers)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  Usage : minitest_cli <chemin/vers/pxftool>
//
//  [A] entiers : hors plage int / non décimaux -> usage (2), fichier intact
//  [B] set/new : bornes frame -> échec d'opération (1)
//  [C] scale   : png borné à kMaxScale, svg 64 bits
//  [D] info --json : titre et chemin échappés
// ============================================================================

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

#include "frame_render.hpp"
#include "io_pxf.hpp"
#include "pixel_frame.hpp"

// ------------------ ASSERT minimaliste --------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pxf;

static std::string g_tool;

static std::string tmp_path(const char* name)
{
    return (std::filesystem::temp_directory_path() / name).string();
}

static std::string q(const std::string& s){ return "\"" + s + "\""; }

// Code retour de "pxftool <args>" (-1 si le process n'a pas terminé normalement)
static int run(const std::string& args, const std::string& stdout_to = std::string())
{
    std::string cmd = q(g_tool) + " " + args;
    if(!stdout_to.empty()) cmd += " > " + q(stdout_to);
    const int rc = std::system(cmd.c_str());
#if defined(_WIN32)
    return rc;
#else
    if(rc==-1 || !WIFEXITED(rc)) return -1;
    return WEXITSTATUS(rc);
#endif
}

static std::string slurp_text(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), {});
}

static bool read_frame(const std::string& path, PixelFrame& f)
{
    return PxfContainer::pxf_read(path, f);
}

// ------------------ TEST A : entiers -----------------------------------------
static bool test_integer_parsing()
{
    const std::string p = tmp_path("pxf_cli_a.pxf");
    std::remove(p.c_str());

    // 2^32 tronqué en int donnerait 0 : doit être refusé
    T_ASSERT( run("new " + q(p) + " --size 4294967296")==2 );
    T_ASSERT( !std::filesystem::exists(p) );
    T_ASSERT( run("new " + q(p) + " --size 99999999999999999999999")==2 );
    T_ASSERT( run("new " + q(p) + " --size 12x")==2 );
    T_ASSERT( run("new " + q(p) + " --size 256")==2 );
    T_ASSERT( run("new " + q(p) + " --size -1")==2 );
    T_ASSERT( !std::filesystem::exists(p) );

    T_ASSERT( run("new " + q(p) + " --size 8")==0 );
    PixelFrame f;
    T_ASSERT( read_frame(p, f) && f.size()==8 );

    // 4294967299 tronqué donnerait x=3 : doit être refusé, fichier intact
    T_ASSERT( run("set " + q(p) + " 4294967299 0 --index 2")==2 );
    T_ASSERT( run("set " + q(p) + " 0 -4294967296 --index 2")==2 );
    T_ASSERT( run("svg " + q(p) + " --out " + q(tmp_path("pxf_cli_a.svg")) + " --scale 4294967306")==2 );
    T_ASSERT( run("svg " + q(p) + " --out " + q(tmp_path("pxf_cli_a.svg")) + " --bg 4294967296")==2 );
    PixelFrame g;
    T_ASSERT( read_frame(p, g) && g==f );
    for(uint8_t v : g.all_indices()) T_ASSERT( v==0 );

    std::remove(p.c_str());
    std::remove(tmp_path("pxf_cli_a.svg").c_str());
    return true;
}

// ------------------ TEST B : bornes frame ------------------------------------
static bool test_set_bounds()
{
    const std::string p = tmp_path("pxf_cli_b.pxf");
    T_ASSERT( run("new " + q(p) + " --size 8 --fill black")==0 );

    T_ASSERT( run("set " + q(p) + " 8 0 --index 2")==1 );
    T_ASSERT( run("set " + q(p) + " 0 -1 --index 2")==1 );
    T_ASSERT( run("set " + q(p) + " 0 0 --index 4")==1 );
    T_ASSERT( run("set " + q(p) + " 0 0 --color " + q("#123456"))==1 );
    T_ASSERT( run("set " + q(p) + " 0 0")==1 );

    PixelFrame f;
    T_ASSERT( read_frame(p, f) );
    for(uint8_t v : f.all_indices()) T_ASSERT( v==1 );

    T_ASSERT( run("set " + q(p) + " 3 0 --index 2")==0 );
    T_ASSERT( run("set " + q(p) + " 7 7 --color blue")==0 );
    T_ASSERT( read_frame(p, f) );
    uint8_t v=0;
    T_ASSERT( f.get_pixel(3,0,v)==Status::Ok && v==2 );
    T_ASSERT( f.get_pixel(7,7,v)==Status::Ok && v==3 );
    T_ASSERT( f.get_pixel(4,0,v)==Status::Ok && v==1 );

    T_ASSERT( run("info " + q(tmp_path("pxf_cli_missing.pxf")))==1 );
    T_ASSERT( run("bogus " + q(p))==2 );
    std::remove(p.c_str());
    return true;
}

// ------------------ TEST C : scale -------------------------------------------
static bool test_scale_limits()
{
    const std::string p = tmp_path("pxf_cli_c.pxf");
    const std::string png = tmp_path("pxf_cli_c.png");
    const std::string svg = tmp_path("pxf_cli_c.svg");
    std::remove(png.c_str());
    T_ASSERT( run("new " + q(p) + " --size 255")==0 );

    T_ASSERT( run("png " + q(p) + " --out " + q(png) + " --scale 100000000")==2 );
    T_ASSERT( run("png " + q(p) + " --out " + q(png) + " --scale " + std::to_string(kMaxScale+1))==2 );
    T_ASSERT( run("png " + q(p) + " --out " + q(png) + " --scale 0")==2 );
    T_ASSERT( !std::filesystem::exists(png) );

    T_ASSERT( run("svg " + q(p) + " --out " + q(svg) + " --scale 100000000 --bg 0")==0 );
    const std::string text = slurp_text(svg);
    T_ASSERT( text.find("width=\"25500000000\"")!=std::string::npos );

    std::remove(p.c_str());
    std::remove(svg.c_str());
    return true;
}

// ------------------ TEST D : info --json -------------------------------------
static bool test_info_json_escaping()
{
    const std::string p = tmp_path("pxf_cli_d.pxf");
    const std::string out = tmp_path("pxf_cli_d.json");
    T_ASSERT( PxfContainer::pxf_write(p, PixelFrame(2), PxfContainer::meta_make("say \"hi\"\\now\nnext")) );

    T_ASSERT( run("info " + q(p) + " --json", out)==0 );
    const std::string js = slurp_text(out);
    T_ASSERT( js.find("\"title\": \"say \\\"hi\\\"\\\\now\\nnext\"")!=std::string::npos );
    // une seule ligne par champ : aucun saut de ligne brut dans le titre
    T_ASSERT( js.find("\nnext")==std::string::npos );
    T_ASSERT( js.find("\"white\": 4")!=std::string::npos );

    std::remove(p.c_str());
    std::remove(out.c_str());
    return true;
}

// ------------------ DRIVER ---------------------------------------------------
int main(int argc, char** argv)
{
    if(argc<2)
    {
        std::cerr << "usage: minitest_cli <pxftool>\n";
        return 2;
    }
    g_tool = argv[1];

    bool ok = true;

    ok &= test_integer_parsing();
    std::cout << "[A] integers : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_set_bounds();
    std::cout << "[B] frame bounds : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_scale_limits();
    std::cout << "[C] scale : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_info_json_escaping();
    std::cout << "[D] info json : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
