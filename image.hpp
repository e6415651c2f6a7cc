#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <cairo/cairo.h>

namespace page_pilot {

// Owned ARGB32 cairo image surface with PNG in/out.
class PngImage {
public:
    // Throws ImageError when the bytes are not a decodable PNG.
    static PngImage decode(const std::string& png_bytes);
    // Opaque canvas filled with `rgb` (0xRRGGBB).
    static PngImage blank(int width, int height, std::uint32_t rgb = 0xFFFFFF);

    int width() const;
    int height() const;

    // Copies rows [src_y, src_y + rows) of `src` onto this image starting at `dest_y`.
    void paintRows(const PngImage& src, int src_y, int rows, int dest_y);

    // 0xAARRGGBB (premultiplied, as cairo stores it).
    std::uint32_t pixel(int x, int y) const;

    std::string encode() const;

private:
    struct SurfaceDeleter {
        void operator()(cairo_surface_t* s) const { cairo_surface_destroy(s); }
    };

    explicit PngImage(cairo_surface_t* surface) : surface_(surface) {}

    std::unique_ptr<cairo_surface_t, SurfaceDeleter> surface_;
};

} // namespace page_pilot
