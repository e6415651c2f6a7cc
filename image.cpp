#include "image.hpp"
#include "errors.hpp"

#include <cstring>

namespace page_pilot {

namespace {

struct ReadCursor {
    const std::string* data;
    std::size_t offset;
};

cairo_status_t read_from_string(void* closure, unsigned char* out, unsigned int length) {
    auto* cur = static_cast<ReadCursor*>(closure);
    if (cur->offset + length > cur->data->size()) return CAIRO_STATUS_READ_ERROR;
    std::memcpy(out, cur->data->data() + cur->offset, length);
    cur->offset += length;
    return CAIRO_STATUS_SUCCESS;
}

cairo_status_t append_to_string(void* closure, const unsigned char* data, unsigned int length) {
    auto* out = static_cast<std::string*>(closure);
    out->append(reinterpret_cast<const char*>(data), length);
    return CAIRO_STATUS_SUCCESS;
}

} // namespace

PngImage PngImage::decode(const std::string& png_bytes) {
    ReadCursor cursor{&png_bytes, 0};
    cairo_surface_t* surface = cairo_image_surface_create_from_png_stream(read_from_string, &cursor);
    cairo_status_t status = cairo_surface_status(surface);
    if (status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surface);
        throw ImageError(std::string("PNG decode failed: ") + cairo_status_to_string(status));
    }
    return PngImage(surface);
}

PngImage PngImage::blank(int width, int height, std::uint32_t rgb) {
    if (width <= 0 || height <= 0) {
        throw ImageError("cannot create a " + std::to_string(width) + "x" + std::to_string(height) + " canvas");
    }
    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
    if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surface);
        throw ImageError("cairo_image_surface_create failed");
    }
    cairo_t* cr = cairo_create(surface);
    cairo_set_source_rgb(cr,
                         ((rgb >> 16) & 0xFF) / 255.0,
                         ((rgb >> 8) & 0xFF) / 255.0,
                         (rgb & 0xFF) / 255.0);
    cairo_paint(cr);
    cairo_destroy(cr);
    return PngImage(surface);
}

int PngImage::width() const { return cairo_image_surface_get_width(surface_.get()); }
int PngImage::height() const { return cairo_image_surface_get_height(surface_.get()); }

void PngImage::paintRows(const PngImage& src, int src_y, int rows, int dest_y) {
    if (rows <= 0) return;
    cairo_t* cr = cairo_create(surface_.get());
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
    cairo_rectangle(cr, 0, dest_y, src.width(), rows);
    cairo_clip(cr);
    cairo_set_source_surface(cr, src.surface_.get(), 0, dest_y - src_y);
    cairo_paint(cr);
    cairo_status_t status = cairo_status(cr);
    cairo_destroy(cr);
    if (status != CAIRO_STATUS_SUCCESS) {
        throw ImageError(std::string("paint failed: ") + cairo_status_to_string(status));
    }
}

std::uint32_t PngImage::pixel(int x, int y) const {
    cairo_surface_flush(surface_.get());
    const unsigned char* data = cairo_image_surface_get_data(surface_.get());
    const int stride = cairo_image_surface_get_stride(surface_.get());
    std::uint32_t value = 0;
    std::memcpy(&value, data + y * stride + x * 4, sizeof(value));
    return value;
}

std::string PngImage::encode() const {
    std::string out;
    cairo_status_t status = cairo_surface_write_to_png_stream(surface_.get(), append_to_string, &out);
    if (status != CAIRO_STATUS_SUCCESS) {
        throw ImageError(std::string("PNG encode failed: ") + cairo_status_to_string(status));
    }
    return out;
}

} // namespace page_pilot
