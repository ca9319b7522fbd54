// ============================================================================
//  File: src/pixel_frame.cpp — Frame N×N packée 2 bits/pixel
// ============================================================================

#include "pixel_frame.hpp"

#include <algorithm>

namespace pxf {

PixelFrame::PixelFrame(uint8_t size)
    : size_(size), buffer_(bytes_for(size), 0)
{
}

PixelFrame::PixelFrame(const PixelFrame& o)
    : size_(o.size_), buffer_(o.buffer_)
{
}

PixelFrame::PixelFrame(PixelFrame&& o) noexcept
    : size_(o.size_), buffer_(std::move(o.buffer_))
{
    o.size_ = 0;
    o.buffer_.clear();
}

// events_ de la destination conservés
PixelFrame& PixelFrame::operator=(const PixelFrame& o)
{
    if(this!=&o)
    {
        size_ = o.size_;
        buffer_ = o.buffer_;
    }
    return *this;
}

PixelFrame& PixelFrame::operator=(PixelFrame&& o) noexcept
{
    if(this!=&o)
    {
        size_ = o.size_;
        buffer_ = std::move(o.buffer_);
        o.size_ = 0;
        o.buffer_.clear();
    }
    return *this;
}

Status PixelFrame::from_raw(uint8_t size, const std::vector<uint8_t>& bytes, PixelFrame& out_frame)
{
    if(bytes.size()!=bytes_for(size)) return Status::ArrayLengthMismatch;
    PixelFrame f(size);
    f.buffer_ = bytes;
    out_frame = std::move(f);
    return Status::Ok;
}

// Pré: coordonnées et index déjà validés.
void PixelFrame::write_unchecked(int x, int y, uint8_t idx)
{
    const uint32_t p = flat(x, y);
    uint8_t& b = buffer_[p / kPixelsPerByte];
    const unsigned shift = (p % kPixelsPerByte) * kBitsPerPixel;
    b = (uint8_t)((b & ~(kIndexMask << shift)) | (idx << shift));
}

Status PixelFrame::set_pixel(int x, int y, uint8_t idx)
{
    if(!in_bounds(x, y)) return Status::CoordinatesOutOfBounds;
    const uint32_t p = flat(x, y);
    uint8_t& b = buffer_[p / kPixelsPerByte];
    uint8_t nb = 0;
    const Status s = set_index_at_position(b, (uint8_t)(p % kPixelsPerByte), idx, nb);
    if(!ok(s)) return s;
    b = nb;
    if(events_.on_pixel) events_.on_pixel(x, y, idx);
    return Status::Ok;
}

Status PixelFrame::get_pixel(int x, int y, uint8_t& out_idx) const
{
    if(!in_bounds(x, y)) return Status::CoordinatesOutOfBounds;
    const uint32_t p = flat(x, y);
    return index_at_position(buffer_[p / kPixelsPerByte], (uint8_t)(p % kPixelsPerByte), out_idx);
}

Status PixelFrame::set_pixel_color(int x, int y, Color24 color)
{
    uint8_t idx = 0;
    const Status s = color_index(color, idx);
    if(!ok(s)) return s;
    return set_pixel(x, y, idx);
}

Status PixelFrame::get_pixel_color(int x, int y, Color24& out_color) const
{
    uint8_t idx = 0;
    const Status s = get_pixel(x, y, idx);
    if(!ok(s)) return s;
    return color_from_index(idx, out_color);
}

std::vector<uint8_t> PixelFrame::all_indices() const
{
    const uint32_t n = total_pixels();
    std::vector<uint8_t> out;
    out.reserve(n);
    for(uint32_t bi=0; bi<buffer_.size(); ++bi)
    {
        const std::array<uint8_t, 4> q = unpack_indices(buffer_[bi]);
        for(uint8_t k=0; k<kPixelsPerByte && out.size()<n; ++k) out.push_back(q[k]);
    }
    return out;
}

std::vector<Color24> PixelFrame::all_colors() const
{
    const std::vector<uint8_t> idx = all_indices();
    std::vector<Color24> out(idx.size());
    // un champ de 2 bits est toujours < 4 : lecture directe de la table
    for(size_t i=0; i<idx.size(); ++i) out[i] = kPaletteColors[idx[i]];
    return out;
}

Status PixelFrame::reset(uint8_t fill_idx)
{
    uint8_t tmpl = 0;
    const Status s = fill_byte(fill_idx, tmpl);
    if(!ok(s)) return s;
    std::fill(buffer_.begin(), buffer_.end(), tmpl);
    if(events_.on_reset) events_.on_reset(fill_idx);
    return Status::Ok;
}

Status PixelFrame::batch_set_pixels(const std::vector<int>& xs,
                                    const std::vector<int>& ys,
                                    const std::vector<uint8_t>& indices)
{
    if(xs.size()!=ys.size() || xs.size()!=indices.size()) return Status::ArrayLengthMismatch;

    // Validation complète avant toute écriture (tout ou rien).
    for(size_t i=0; i<xs.size(); ++i)
    {
        if(!in_bounds(xs[i], ys[i])) return Status::CoordinatesOutOfBounds;
        if(!is_valid_index(indices[i])) return Status::IndexOutOfRange;
    }
    for(size_t i=0; i<xs.size(); ++i) write_unchecked(xs[i], ys[i], indices[i]);

    if(events_.on_batch) events_.on_batch(xs.size());
    return Status::Ok;
}

Status PixelFrame::batch_set_pixel_colors(const std::vector<int>& xs,
                                          const std::vector<int>& ys,
                                          const std::vector<Color24>& colors)
{
    if(xs.size()!=ys.size() || xs.size()!=colors.size()) return Status::ArrayLengthMismatch;
    std::vector<uint8_t> indices;
    const Status s = colors_to_indices(colors, indices);
    if(!ok(s)) return s;
    return batch_set_pixels(xs, ys, indices);
}

} // namespace pxf
