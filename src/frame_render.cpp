// ============================================================================
//  File: src/frame_render.cpp — Vues ASCII et SVG
// ============================================================================

#include "frame_render.hpp"

#include <sstream>

namespace pxf {

std::string render_ascii(const PixelFrame& frame, const RenderOptions& opts)
{
    const int n = frame.size();
    const std::vector<uint8_t> idx = frame.all_indices();
    const bool use_glyphs = opts.glyphs.size() >= kPaletteSize;

    std::string out;
    out.reserve((size_t)n * (n + 1));
    for(int y=0; y<n; ++y)
    {
        for(int x=0; x<n; ++x)
        {
            const uint8_t v = idx[(size_t)y*n + x];
            out.push_back(use_glyphs ? opts.glyphs[v] : (char)('0' + v));
        }
        out.push_back('\n');
    }
    return out;
}

std::string render_svg(const PixelFrame& frame, const RenderOptions& opts)
{
    const int n = frame.size();
    const long long scale = opts.scale < 1 ? 1 : opts.scale;
    const long long side = (long long)n * scale;
    const bool has_bg = opts.background >= 0 && opts.background < kPaletteSize;
    const std::vector<uint8_t> idx = frame.all_indices();

    std::ostringstream os;
    os << "<svg xmlns=\"http://www.w3.org/2000/svg\""
       << " width=\"" << side << "\" height=\"" << side << "\""
       << " viewBox=\"0 0 " << n << " " << n << "\""
       << " shape-rendering=\"crispEdges\">\n";

    if(has_bg && n>0)
    {
        os << "<rect x=\"0\" y=\"0\" width=\"" << n << "\" height=\"" << n
           << "\" fill=\"" << color_to_hex(kPaletteColors[(size_t)opts.background]) << "\"/>\n";
    }

    for(int y=0; y<n; ++y)
    {
        int x = 0;
        while(x < n)
        {
            const uint8_t v = idx[(size_t)y*n + x];
            int run = 1;
            if(opts.merge_runs)
            {
                while(x+run < n && idx[(size_t)y*n + x + run]==v) ++run;
            }
            if(!(has_bg && v==(uint8_t)opts.background))
            {
                os << "<rect x=\"" << x << "\" y=\"" << y
                   << "\" width=\"" << run << "\" height=\"1\" fill=\""
                   << color_to_hex(kPaletteColors[v]) << "\"/>\n";
            }
            x += run;
        }
    }
    os << "</svg>\n";
    return os.str();
}

} // namespace pxf
