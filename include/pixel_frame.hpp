// ============================================================================
//  File: include/pixel_frame.hpp — Frame N×N packée 2 bits/pixel (DOC+)
//  Project: pixframe 2-bit Pixel-Art Frames v1
//
//  OBJET
//  -----
//  • Grille carrée size×size (0..255) d'index palette, stockée dans un buffer
//    dense de ceil(size²/4) octets (4 pixels par octet).
//  • Ordre des pixels : row-major, p = y*size + x ; octet p/4, position p%4
//    (position 0 = bits 0..1, cf. pxf_palette.hpp).
//  • Frame neuve : tous les octets à 0 => tous les pixels à l'index 0 (White).
//
//  FORMAT FIL
//  ----------
//  • raw_bytes() est la forme sérialisée canonique (persistance / transport).
//    Vue en lecture seule : copier si on la garde après une mutation.
//
//  GARDE-FOUS
//  ----------
//  • Une opération en échec ne modifie rien (batch compris : tout est validé
//    avant la première écriture).
//  • Pas de verrou interne : l'appelant sérialise les accès à une frame.
//  • Notifications (FrameEvents) émises seulement sur succès.
//  • Les observateurs appartiennent à l'objet, pas à la valeur : copie et
//    déplacement transfèrent taille + pixels uniquement. Une copie n'a aucun
//    observateur ; une affectation (from_raw, pxf_read, ...) conserve ceux
//    de la destination, sans notification.
// ============================================================================

#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "pxf_palette.hpp"
#include "pxf_status.hpp"

namespace pxf {

// Hooks d'observation (slots vides ignorés).
struct FrameEvents {
    std::function<void(int /*x*/, int /*y*/, uint8_t /*idx*/)> on_pixel;
    std::function<void(size_t /*count*/)> on_batch;
    std::function<void(uint8_t /*fill_idx*/)> on_reset;
};

class PixelFrame {
public:
    explicit PixelFrame(uint8_t size = 0);

    PixelFrame(const PixelFrame& o);
    PixelFrame(PixelFrame&& o) noexcept;
    PixelFrame& operator=(const PixelFrame& o);
    PixelFrame& operator=(PixelFrame&& o) noexcept;

    // Reconstruit une frame depuis son buffer packé (taille exacte requise).
    static Status from_raw(uint8_t size, const std::vector<uint8_t>& bytes, PixelFrame& out_frame);

    static uint32_t bytes_for(uint8_t size)
    {
        const uint32_t n = (uint32_t)size * size;
        return (n + kPixelsPerByte - 1) / kPixelsPerByte;
    }

    uint8_t  size() const { return size_; }
    uint32_t total_pixels() const { return (uint32_t)size_ * size_; }
    uint32_t total_bytes() const { return (uint32_t)buffer_.size(); }

    bool in_bounds(int x, int y) const { return x>=0 && y>=0 && x<size_ && y<size_; }

    // -- Pixel unique ----------------------------------------------------------
    Status set_pixel(int x, int y, uint8_t idx);
    Status get_pixel(int x, int y, uint8_t& out_idx) const;
    Status set_pixel_color(int x, int y, Color24 color);
    Status get_pixel_color(int x, int y, Color24& out_color) const;

    // -- Vues globales ---------------------------------------------------------
    const std::vector<uint8_t>& raw_bytes() const { return buffer_; }
    std::vector<uint8_t> all_indices() const;
    std::vector<Color24> all_colors() const;

    // -- Mutations en masse ----------------------------------------------------
    Status reset(uint8_t fill_idx);
    Status batch_set_pixels(const std::vector<int>& xs,
                            const std::vector<int>& ys,
                            const std::vector<uint8_t>& indices);
    Status batch_set_pixel_colors(const std::vector<int>& xs,
                                  const std::vector<int>& ys,
                                  const std::vector<Color24>& colors);

    void set_events(FrameEvents ev) { events_ = std::move(ev); }

    bool operator==(const PixelFrame& o) const { return size_==o.size_ && buffer_==o.buffer_; }
    bool operator!=(const PixelFrame& o) const { return !(*this==o); }

private:
    uint32_t flat(int x, int y) const { return (uint32_t)y * size_ + (uint32_t)x; }
    void write_unchecked(int x, int y, uint8_t idx);

    uint8_t size_ = 0;
    std::vector<uint8_t> buffer_;
    FrameEvents events_;
};

} // namespace pxf
