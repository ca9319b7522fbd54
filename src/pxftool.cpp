// ============================================================================
//  File: src/pxftool.cpp — CLI pour frames .pxf
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  COMMANDES
//  ---------
//  pxftool new        <out.pxf> --size N [--fill IDX|NAME] [--title T]
//  pxftool info       <in.pxf> [--json]
//  pxftool set        <in.pxf> X Y (--index I | --color C) [--out o.pxf]
//  pxftool fill       <in.pxf> (--index I | --color C) [--out o.pxf]
//  pxftool ascii      <in.pxf> [--glyphs ".#%@"]
//  pxftool svg        <in.pxf> --out o.svg [--scale S] [--bg IDX] [--no-merge]
//  pxftool png        <in.pxf> --out o.png [--scale S]     (S <= 32)
//  pxftool tiff       <in.pxf> --out o.tif
//  pxftool import-png <in.png> --out o.pxf [--scale S] [--title T]
//                     (blocs S×S uniformes, couleurs palette exactes)
//
//  Entiers : décimaux complets dans la plage int, sinon usage (code 2).
//  Couleurs : "#RRGGBB", "0xRRGGBB" ou nom palette (white/black/purple/blue).
//  Codes retour : 0 OK, 1 échec d'opération, 2 usage.
// ============================================================================

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "frame_render.hpp"
#include "io_frame_image.hpp"
#include "io_pxf.hpp"
#include "pixel_frame.hpp"

// ---------------------------------------------------------------------- Usage
static void usage()
{
    std::cerr <<
              "pxftool new <out.pxf> --size N [--fill IDX|NAME] [--title T]\n"
              "pxftool info <in.pxf> [--json]\n"
              "pxftool set <in.pxf> X Y (--index I | --color C) [--out o.pxf]\n"
              "pxftool fill <in.pxf> (--index I | --color C) [--out o.pxf]\n"
              "pxftool ascii <in.pxf> [--glyphs \".#%@\"]\n"
              "pxftool svg <in.pxf> --out o.svg [--scale S] [--bg IDX] [--no-merge]\n"
              "pxftool png <in.pxf> --out o.png [--scale S<=32]\n"
              "pxftool tiff <in.pxf> --out o.tif\n"
              "pxftool import-png <in.png> --out o.pxf [--scale S] [--title T]  (uniform SxS blocks)\n";
}

struct Args
{
    std::string cmd;
    std::vector<std::string> pos;   // arguments positionnels après la commande
    std::string out;
    std::string title;
    std::string glyphs = ".#%@";
    std::string index;              // --index / --fill (nombre ou nom)
    std::string color;              // --color
    int  size = -1;
    int  scale = -1;
    int  bg = -1;
    bool merge = true;
    bool json = false;
};

// Entier décimal complet, dans la plage de int ; sinon refus (pas de troncature).
static bool parse_int(const std::string& s, int& out)
{
    if(s.empty()) return false;
    char* end=nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if(errno==ERANGE || *end!='\0') return false;
    if(v<INT_MIN || v>INT_MAX) return false;
    out = (int)v;
    return true;
}

// --scale absent -> défaut ; présent -> doit être dans [1,max].
static bool check_scale(const Args& a, int max)
{
    if(a.scale==-1 || (a.scale>=1 && a.scale<=max)) return true;
    std::cerr<<"[pxftool] --scale must be in [1,"<<max<<"]\n";
    return false;
}

static bool parse_args(int argc, char** argv, Args& a)
{
    if(argc<3) return false;
    a.cmd = argv[1];
    for(int i=2; i<argc; ++i)
    {
        const std::string s = argv[i];
        const bool has_val = i+1<argc;
        if(s=="--out" && has_val) a.out = argv[++i];
        else if(s=="--title" && has_val) a.title = argv[++i];
        else if(s=="--glyphs" && has_val) a.glyphs = argv[++i];
        else if((s=="--index" || s=="--fill") && has_val) a.index = argv[++i];
        else if(s=="--color" && has_val) a.color = argv[++i];
        else if(s=="--size" && has_val)
        {
            if(!parse_int(argv[++i], a.size))
            {
                std::cerr<<"[pxftool] bad --size: "<<argv[i]<<"\n";
                return false;
            }
        }
        else if(s=="--scale" && has_val)
        {
            if(!parse_int(argv[++i], a.scale) || a.scale<1)
            {
                std::cerr<<"[pxftool] bad --scale: "<<argv[i]<<"\n";
                return false;
            }
        }
        else if(s=="--bg" && has_val)
        {
            if(!parse_int(argv[++i], a.bg))
            {
                std::cerr<<"[pxftool] bad --bg: "<<argv[i]<<"\n";
                return false;
            }
        }
        else if(s=="--no-merge") a.merge = false;
        else if(s=="--json") a.json = true;
        else if(s.size()>2 && s.compare(0,2,"--")==0)
        {
            std::cerr<<"[pxftool] unknown option: "<<s<<"\n";
            return false;
        }
        else a.pos.push_back(s);
    }
    return !a.pos.empty();
}

// Index palette depuis "--index" (nombre ou nom) ou "--color" (hex ou nom).
static bool resolve_index(const Args& a, uint8_t& out)
{
    if(!a.index.empty())
    {
        int v=-1;
        if(parse_int(a.index, v))
        {
            if(v<0 || v>=pxf::kPaletteSize)
            {
                std::cerr<<"[pxftool] "<<pxf::status_name(pxf::Status::IndexOutOfRange)<<": "<<a.index<<"\n";
                return false;
            }
            out = (uint8_t)v;
            return true;
        }
        if(!pxf::ok(pxf::index_from_name(a.index, out)))
        {
            std::cerr<<"[pxftool] unknown palette name: "<<a.index<<"\n";
            return false;
        }
        return true;
    }
    if(!a.color.empty())
    {
        if(pxf::ok(pxf::index_from_name(a.color, out))) return true;
        pxf::Color24 c=0;
        if(!pxf::parse_color_hex(a.color, c))
        {
            std::cerr<<"[pxftool] bad color: "<<a.color<<"\n";
            return false;
        }
        const pxf::Status s = pxf::color_index(c, out);
        if(!pxf::ok(s))
        {
            std::cerr<<"[pxftool] "<<pxf::status_name(s)<<": "<<pxf::color_to_hex(c)<<"\n";
            return false;
        }
        return true;
    }
    std::cerr<<"[pxftool] --index or --color required\n";
    return false;
}

static bool load(const std::string& path, pxf::PixelFrame& f, std::string& meta)
{
    std::string err;
    if(!PxfContainer::pxf_read(path, f, &meta, &err))
    {
        std::cerr<<"[pxftool] read failed: "<<path<<" ("<<err<<")\n";
        return false;
    }
    return true;
}

static bool store(const std::string& path, const pxf::PixelFrame& f, const std::string& meta)
{
    std::string err;
    if(!PxfContainer::pxf_write(path, f, meta, &err))
    {
        std::cerr<<"[pxftool] write failed: "<<path<<" ("<<err<<")\n";
        return false;
    }
    return true;
}

static bool write_text(const std::string& path, const std::string& text)
{
    std::ofstream f(path, std::ios::binary);
    if(!f) return false;
    f << text;
    return (bool)f;
}

// ------------------------------------------------------------------ Commandes
static int cmd_new(const Args& a)
{
    if(a.size<0 || a.size>255)
    {
        std::cerr<<"[pxftool] --size must be in [0,255]\n";
        return 2;
    }
    pxf::PixelFrame f((uint8_t)a.size);
    if(!a.index.empty() || !a.color.empty())
    {
        uint8_t idx=0;
        if(!resolve_index(a, idx)) return 1;
        const pxf::Status s = f.reset(idx);
        if(!pxf::ok(s))
        {
            std::cerr<<"[pxftool] reset: "<<pxf::status_name(s)<<"\n";
            return 1;
        }
    }
    if(!store(a.pos[0], f, PxfContainer::meta_make(a.title))) return 1;
    std::cout<<"created "<<a.pos[0]<<" ("<<(int)f.size()<<"x"<<(int)f.size()<<", "<<f.total_bytes()<<" bytes)\n";
    return 0;
}

static int cmd_info(const Args& a)
{
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;

    uint32_t hist[pxf::kPaletteSize] = {0,0,0,0};
    for(uint8_t v : f.all_indices()) ++hist[v];
    const uint32_t crc = PxfContainer::crc32(f.raw_bytes().data(), f.raw_bytes().size());
    std::string title;
    if(!PxfContainer::meta_find_str(meta, "title", title)) title = "(none)";

    if(a.json)
    {
        std::cout << "{\n"
                  << "  \"pxf\": {\n"
                  << "    \"file\": \""<<PxfContainer::json_escape(a.pos[0])<<"\",\n"
                  << "    \"size\": "<<(int)f.size()<<", \"pixels\": "<<f.total_pixels()<<", \"bytes\": "<<f.total_bytes()<<",\n"
                  << "    \"title\": \""<<PxfContainer::json_escape(title)<<"\",\n"
                  << "    \"crc32\": \""<< std::hex << std::uppercase << std::setw(8) << std::setfill('0') << crc << std::dec << std::setfill(' ') << "\",\n"
                  << "    \"histogram\": {";
        for(uint8_t i=0; i<pxf::kPaletteSize; ++i)
        {
            std::cout << (i? ", " : "") << "\"" << pxf::color_name(i) << "\": " << hist[i];
        }
        std::cout << "}\n  }\n}\n";
    }
    else
    {
        std::cout<<"== .pxf ==\n"
                 <<"file: "<<a.pos[0]<<"\n"
                 <<"title: "<<title<<"\n"
                 <<"size: "<<(int)f.size()<<" x "<<(int)f.size()<<" ("<<f.total_pixels()<<" px)\n"
                 <<"bytes: "<<f.total_bytes()<<"\n"
                 <<"crc32: 0x"<< std::hex << std::uppercase << std::setw(8) << std::setfill('0') << crc << std::dec << std::setfill(' ') << "\n";
        for(uint8_t i=0; i<pxf::kPaletteSize; ++i)
        {
            std::cout<<"  ["<<(int)i<<"] "<<std::setw(6)<<std::left<<pxf::color_name(i)<<std::right
                     <<" "<<pxf::color_to_hex(pxf::kPaletteColors[i])<<" : "<<hist[i]<<"\n";
        }
    }
    return 0;
}

static int cmd_set(const Args& a)
{
    if(a.pos.size()<3)
    {
        usage();
        return 2;
    }
    int x=-1, y=-1;
    if(!parse_int(a.pos[1], x) || !parse_int(a.pos[2], y))
    {
        std::cerr<<"[pxftool] bad coordinates\n";
        return 2;
    }
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    uint8_t idx=0;
    if(!resolve_index(a, idx)) return 1;
    const pxf::Status s = f.set_pixel(x, y, idx);
    if(!pxf::ok(s))
    {
        std::cerr<<"[pxftool] set ("<<x<<","<<y<<"): "<<pxf::status_name(s)<<"\n";
        return 1;
    }
    return store(a.out.empty()? a.pos[0] : a.out, f, meta) ? 0 : 1;
}

static int cmd_fill(const Args& a)
{
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    uint8_t idx=0;
    if(!resolve_index(a, idx)) return 1;
    const pxf::Status s = f.reset(idx);
    if(!pxf::ok(s))
    {
        std::cerr<<"[pxftool] reset: "<<pxf::status_name(s)<<"\n";
        return 1;
    }
    return store(a.out.empty()? a.pos[0] : a.out, f, meta) ? 0 : 1;
}

static int cmd_ascii(const Args& a)
{
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    pxf::RenderOptions ro;
    ro.glyphs = a.glyphs;
    std::cout << pxf::render_ascii(f, ro);
    return 0;
}

static int cmd_svg(const Args& a)
{
    if(a.out.empty())
    {
        std::cerr<<"[pxftool] --out required\n";
        return 2;
    }
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    pxf::RenderOptions ro;
    if(a.scale>0) ro.scale = a.scale;
    ro.background = a.bg;
    ro.merge_runs = a.merge;
    if(!write_text(a.out, pxf::render_svg(f, ro)))
    {
        std::cerr<<"[pxftool] SVG write failed: "<<a.out<<"\n";
        return 1;
    }
    std::cout<<"svg -> "<<a.out<<"\n";
    return 0;
}

static int cmd_png(const Args& a)
{
    if(a.out.empty())
    {
        std::cerr<<"[pxftool] --out required\n";
        return 2;
    }
    if(!check_scale(a, pxf::kMaxScale)) return 2;
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    std::string err;
    if(!PxfIO::save_frame_png(a.out, f, a.scale>0? a.scale : 1, &err))
    {
        std::cerr<<"[pxftool] "<<err<<"\n";
        return 1;
    }
    std::cout<<"png -> "<<a.out<<"\n";
    return 0;
}

static int cmd_tiff(const Args& a)
{
    if(a.out.empty())
    {
        std::cerr<<"[pxftool] --out required\n";
        return 2;
    }
    pxf::PixelFrame f;
    std::string meta;
    if(!load(a.pos[0], f, meta)) return 1;
    std::string err;
    if(!PxfIO::save_frame_tiff(a.out, f, &err))
    {
        std::cerr<<"[pxftool] "<<err<<"\n";
        return 1;
    }
    std::cout<<"tiff -> "<<a.out<<"\n";
    return 0;
}

static int cmd_import_png(const Args& a)
{
    if(a.out.empty())
    {
        std::cerr<<"[pxftool] --out required\n";
        return 2;
    }
    pxf::PixelFrame f;
    std::string err;
    if(!PxfIO::load_frame_png(a.pos[0], a.scale>0? a.scale : 1, f, &err))
    {
        std::cerr<<"[pxftool] "<<err<<"\n";
        return 1;
    }
    if(!store(a.out, f, PxfContainer::meta_make(a.title))) return 1;
    std::cout<<"imported "<<a.pos[0]<<" -> "<<a.out<<" ("<<(int)f.size()<<"x"<<(int)f.size()<<")\n";
    return 0;
}

int main(int argc, char** argv)
{
    Args A{};
    if(!parse_args(argc, argv, A))
    {
        usage();
        return 2;
    }

    if(A.cmd=="new") return cmd_new(A);
    if(A.cmd=="info") return cmd_info(A);
    if(A.cmd=="set") return cmd_set(A);
    if(A.cmd=="fill") return cmd_fill(A);
    if(A.cmd=="ascii") return cmd_ascii(A);
    if(A.cmd=="svg") return cmd_svg(A);
    if(A.cmd=="png") return cmd_png(A);
    if(A.cmd=="tiff") return cmd_tiff(A);
    if(A.cmd=="import-png") return cmd_import_png(A);

    std::cerr<<"[pxftool] unknown command: "<<A.cmd<<"\n";
    usage();
    return 2;
}
