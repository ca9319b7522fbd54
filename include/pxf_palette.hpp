// ============================================================================
//  File: include/pxf_palette.hpp — Palette fixe 4 couleurs + codec 2 bits (DOC+)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  PALETTE
//  -------
//   index : 0=White #FFFFFF, 1=Black #000000, 2=Purple #8C1C84, 3=Blue #45A2F8
//   Bijection stricte couleur <-> index ; égalité bit à bit uniquement.
//
//  OCTET PACKÉ
//  -----------
//   4 index de 2 bits par octet, position 0 = bits 0..1 (LSB d'abord) :
//     byte = i0 | i1<<2 | i2<<4 | i3<<6
//   ex. {0,1,2,3} -> 0xE4
//
//  API
//  ---
//   Status color_index(Color24, uint8_t& idx);
//   Status color_from_index(uint8_t idx, Color24& c);
//   Status pack_indices(const std::vector<uint8_t>&, uint8_t& byte);
//   std::array<uint8_t,4> unpack_indices(uint8_t byte);
//   Status index_at_position(uint8_t byte, uint8_t pos, uint8_t& idx);
//   Status set_index_at_position(uint8_t byte, uint8_t pos, uint8_t idx, uint8_t& out);
//   Status colors_to_indices(...), indices_to_colors(...)
//
//  Les séquences s'arrêtent au premier élément invalide (ordre gauche→droite) ;
//  la sortie n'est écrite qu'en cas de succès.
// ============================================================================

#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "pxf_color.hpp"
#include "pxf_status.hpp"

namespace pxf {

constexpr uint8_t kPaletteSize     = 4;
constexpr uint8_t kBitsPerPixel    = 2;
constexpr uint8_t kPixelsPerByte   = 4;
constexpr uint8_t kIndexMask       = 0x3u;

constexpr Color24 kWhite  = 0xFFFFFFu;
constexpr Color24 kBlack  = 0x000000u;
constexpr Color24 kPurple = 0x8C1C84u;
constexpr Color24 kBlue   = 0x45A2F8u;

constexpr std::array<Color24, kPaletteSize> kPaletteColors = { kWhite, kBlack, kPurple, kBlue };

inline constexpr bool is_valid_index(uint8_t idx){ return idx < kPaletteSize; }

// -- Couleur <-> index -------------------------------------------------------
Status color_index(Color24 color, uint8_t& out_idx);
Status color_from_index(uint8_t idx, Color24& out_color);

// Nom court ("white", "black", "purple", "blue") ; nullptr si idx >= 4.
const char* color_name(uint8_t idx);
// Insensible à la casse. Nom inconnu -> IndexOutOfRange.
Status index_from_name(const std::string& name, uint8_t& out_idx);

// -- Codec d'un octet (4 x 2 bits) -------------------------------------------
Status pack_indices(const std::vector<uint8_t>& indices, uint8_t& out_byte);

inline std::array<uint8_t, 4> unpack_indices(uint8_t byte)
{
    return { (uint8_t)(byte & kIndexMask),
             (uint8_t)((byte >> 2) & kIndexMask),
             (uint8_t)((byte >> 4) & kIndexMask),
             (uint8_t)((byte >> 6) & kIndexMask) };
}

inline Status index_at_position(uint8_t byte, uint8_t position, uint8_t& out_idx)
{
    if(position >= kPixelsPerByte) return Status::PositionOutOfRange;
    out_idx = (uint8_t)((byte >> (position * kBitsPerPixel)) & kIndexMask);
    return Status::Ok;
}

inline Status set_index_at_position(uint8_t byte, uint8_t position, uint8_t idx, uint8_t& out_byte)
{
    if(position >= kPixelsPerByte) return Status::PositionOutOfRange;
    if(!is_valid_index(idx)) return Status::IndexOutOfRange;
    const unsigned shift = position * kBitsPerPixel;
    const uint8_t cleared = (uint8_t)(byte & ~(kIndexMask << shift));
    out_byte = (uint8_t)(cleared | (idx << shift));
    return Status::Ok;
}

// Octet "template" : les 4 positions à idx (utilisé par reset).
inline Status fill_byte(uint8_t idx, uint8_t& out_byte)
{
    if(!is_valid_index(idx)) return Status::IndexOutOfRange;
    out_byte = (uint8_t)(idx | (idx << 2) | (idx << 4) | (idx << 6));
    return Status::Ok;
}

// -- Séquences ----------------------------------------------------------------
Status colors_to_indices(const std::vector<Color24>& colors, std::vector<uint8_t>& out_indices);
Status indices_to_colors(const std::vector<uint8_t>& indices, std::vector<Color24>& out_colors);

} // namespace pxf
