// ============================================================================
//  File: include/io_pxf.hpp — Conteneur fichier .pxf (DOC+)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  OBJET
//  -----
//  • Persister une PixelFrame : buffer packé brut (raw_bytes) + méta JSON.
//  • Le payload est exactement la forme fil de la frame ; l'ordre des bits
//    est conservé tel quel (pas de repack).
//
//  FORMAT (PXF1)
//  -------------
//      magic[4]="PXF1", u8 ver=1, u8 size, u16 reserved=0,
//      u32 meta_len, u32 payload_len, u32 hdr_crc32,
//      meta_json[meta_len], payload[payload_len], u32 payload_crc32
//
//  • hdr_crc32 : CRC-32 (0xEDB88320) sur ver..payload_len (12 octets LE).
//  • payload_len == ceil(size²/4), sinon fichier rejeté.
//  • Little-endian pour tous les champs numériques.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "pixel_frame.hpp"

namespace PxfContainer {

constexpr uint8_t kVersion = 1;

bool pxf_write(const std::string& path,
               const pxf::PixelFrame& frame,
               const std::string& meta_json,
               std::string* err = nullptr);

bool pxf_read(const std::string& path,
              pxf::PixelFrame& out_frame,
              std::string* out_meta_json = nullptr,
              std::string* err = nullptr);

uint32_t crc32(const void* data, size_t n);

// -- JSON-lite (méta plate, naïve) -------------------------------------------
// Échappe une chaîne pour l'insérer entre guillemets JSON (", \, contrôles).
std::string json_escape(const std::string& s);
std::string meta_make(const std::string& title);
bool meta_find_str(const std::string& js, const std::string& key, std::string& out);

} // namespace PxfContainer
