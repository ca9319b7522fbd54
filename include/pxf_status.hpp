// ============================================================================
//  File: include/pxf_status.hpp — Codes d'erreur du cœur pixframe
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  • Toutes les opérations du cœur (couleur, palette, frame) renvoient un
//    Status. Les sorties (références) ne sont écrites que si Status::Ok.
//  • Aucune correction silencieuse : pas de clamp, pas de couleur "proche".
// ============================================================================

#pragma once
#include <cstdint>

namespace pxf {

enum class Status : uint8_t {
    Ok = 0,
    CoordinatesOutOfBounds, // x ou y >= taille de la frame
    ColorNotInPalette,      // couleur absente des 4 couleurs canoniques
    IndexOutOfRange,        // index palette >= 4
    PositionOutOfRange,     // sous-position dans l'octet >= 4
    ArrayLengthMismatch,    // séquences batch (ou buffer brut) de tailles incohérentes
    TooManyIndices          // plus de 4 index pour un seul octet
};

inline bool ok(Status s){ return s==Status::Ok; }

inline const char* status_name(Status s)
{
    switch(s)
    {
    case Status::Ok:
        return "Ok";
    case Status::CoordinatesOutOfBounds:
        return "CoordinatesOutOfBounds";
    case Status::ColorNotInPalette:
        return "ColorNotInPalette";
    case Status::IndexOutOfRange:
        return "IndexOutOfRange";
    case Status::PositionOutOfRange:
        return "PositionOutOfRange";
    case Status::ArrayLengthMismatch:
        return "ArrayLengthMismatch";
    case Status::TooManyIndices:
        return "TooManyIndices";
    default:
        return "Unknown";
    }
}

} // namespace pxf
