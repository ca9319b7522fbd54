// ============================================================================
//  File: include/pxf_color.hpp — Codec couleur RGB8 <-> 24 bits
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  • Color24 = 0xRRGGBB dans un uint32_t (octet haut toujours nul).
//  • pack/unpack sont totaux : unpack(pack(r,g,b)) == (r,g,b).
//  • Forme texte "#RRGGBB" (majuscules) pour le SVG et les rapports.
// ============================================================================

#pragma once
#include <cstdint>
#include <cctype>
#include <string>

namespace pxf {

using Color24 = uint32_t;

constexpr Color24 kColorMask = 0xFFFFFFu;

inline constexpr Color24 pack_color(uint8_t red, uint8_t green, uint8_t blue)
{
    return ((Color24)red << 16) | ((Color24)green << 8) | (Color24)blue;
}

inline constexpr uint8_t unpack_red(Color24 c){ return (uint8_t)((c >> 16) & 0xFFu); }
inline constexpr uint8_t unpack_green(Color24 c){ return (uint8_t)((c >> 8) & 0xFFu); }
inline constexpr uint8_t unpack_blue(Color24 c){ return (uint8_t)(c & 0xFFu); }

inline void unpack_color(Color24 c, uint8_t& red, uint8_t& green, uint8_t& blue)
{
    red   = unpack_red(c);
    green = unpack_green(c);
    blue  = unpack_blue(c);
}

inline std::string color_to_hex(Color24 c)
{
    static const char* digits = "0123456789ABCDEF";
    std::string s(7, '#');
    for(int i=0; i<6; ++i)
    {
        s[(size_t)(6-i)] = digits[(c >> (i*4)) & 0xFu];
    }
    return s;
}

// Accepte "#RRGGBB", "RRGGBB" ou "0xRRGGBB" (casse libre).
inline bool parse_color_hex(const std::string& text, Color24& out)
{
    size_t p = 0;
    if(text.size()==7 && text[0]=='#') p = 1;
    else if(text.size()==8 && text[0]=='0' && (text[1]=='x' || text[1]=='X')) p = 2;
    else if(text.size()!=6) return false;

    Color24 v = 0;
    for(; p<text.size(); ++p)
    {
        const int ch = std::tolower((unsigned char)text[p]);
        int d;
        if(ch>='0' && ch<='9') d = ch-'0';
        else if(ch>='a' && ch<='f') d = 10 + (ch-'a');
        else return false;
        v = (v << 4) | (Color24)d;
    }
    out = v;
    return true;
}

} // namespace pxf
