// ============================================================================
//  File: src/pxf_palette.cpp — Palette fixe 4 couleurs
// ============================================================================

#include "pxf_palette.hpp"

#include <cctype>

namespace pxf {

namespace {
const char* const kColorNames[kPaletteSize] = { "white", "black", "purple", "blue" };
}

Status color_index(Color24 color, uint8_t& out_idx)
{
    for(uint8_t i=0; i<kPaletteSize; ++i)
    {
        if(kPaletteColors[i]==color)
        {
            out_idx = i;
            return Status::Ok;
        }
    }
    return Status::ColorNotInPalette;
}

Status color_from_index(uint8_t idx, Color24& out_color)
{
    if(!is_valid_index(idx)) return Status::IndexOutOfRange;
    out_color = kPaletteColors[idx];
    return Status::Ok;
}

const char* color_name(uint8_t idx)
{
    return is_valid_index(idx) ? kColorNames[idx] : nullptr;
}

Status index_from_name(const std::string& name, uint8_t& out_idx)
{
    for(uint8_t i=0; i<kPaletteSize; ++i)
    {
        const std::string ref = kColorNames[i];
        if(ref.size()!=name.size()) continue;
        bool same = true;
        for(size_t k=0; k<ref.size() && same; ++k)
        {
            same = std::tolower((unsigned char)name[k])==ref[k];
        }
        if(same)
        {
            out_idx = i;
            return Status::Ok;
        }
    }
    return Status::IndexOutOfRange;
}

Status pack_indices(const std::vector<uint8_t>& indices, uint8_t& out_byte)
{
    if(indices.size() > kPixelsPerByte) return Status::TooManyIndices;
    uint8_t b = 0;
    for(size_t pos=0; pos<indices.size(); ++pos)
    {
        if(!is_valid_index(indices[pos])) return Status::IndexOutOfRange;
        b = (uint8_t)(b | (indices[pos] << (pos * kBitsPerPixel)));
    }
    out_byte = b;
    return Status::Ok;
}

Status colors_to_indices(const std::vector<Color24>& colors, std::vector<uint8_t>& out_indices)
{
    std::vector<uint8_t> tmp;
    tmp.reserve(colors.size());
    for(Color24 c : colors)
    {
        uint8_t idx = 0;
        const Status s = color_index(c, idx);
        if(!ok(s)) return s;
        tmp.push_back(idx);
    }
    out_indices.swap(tmp);
    return Status::Ok;
}

Status indices_to_colors(const std::vector<uint8_t>& indices, std::vector<Color24>& out_colors)
{
    std::vector<Color24> tmp;
    tmp.reserve(indices.size());
    for(uint8_t idx : indices)
    {
        Color24 c = 0;
        const Status s = color_from_index(idx, c);
        if(!ok(s)) return s;
        tmp.push_back(c);
    }
    out_colors.swap(tmp);
    return Status::Ok;
}

} // namespace pxf
