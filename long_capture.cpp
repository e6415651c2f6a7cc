#include "long_capture.hpp"
#include "errors.hpp"
#include "image.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace page_pilot {

std::vector<TileCrop> plan_tile_crops(const std::vector<int>& tile_heights, const CaptureGeometry& geometry) {
    std::vector<TileCrop> plan;
    const int step = geometry.visible_px - geometry.overlap_px;
    int composed = 0;

    for (std::size_t i = 0; i < tile_heights.size(); ++i) {
        const bool first = (i == 0);
        const bool last = (i + 1 == tile_heights.size());
        const int tile_h = tile_heights[i];

        int crop_y;
        int crop_h;
        if (first && last) {
            crop_y = 0;
            crop_h = std::min(geometry.total_px, tile_h);
        } else if (first) {
            crop_y = 0;
            crop_h = step;
        } else if (last) {
            const int remaining = geometry.total_px - composed;
            crop_y = geometry.visible_px - remaining;
            crop_h = remaining;
        } else {
            crop_y = geometry.overlap_px;
            crop_h = step;
        }

        if (crop_y < 0) crop_y = 0;
        if (crop_y + crop_h > tile_h) crop_h = tile_h - crop_y;
        if (crop_h <= 0) continue;

        plan.push_back(TileCrop{i, crop_y, crop_h, composed});
        composed += crop_h;
    }
    return plan;
}

std::string LongCapture::composite(const std::vector<std::string>& tiles, const CaptureGeometry& geometry) {
    if (tiles.empty()) {
        throw CompositingError("no tiles were captured");
    }

    std::vector<PngImage> images;
    std::vector<int> heights;
    images.reserve(tiles.size());
    for (const auto& bytes : tiles) {
        images.push_back(PngImage::decode(bytes));
        heights.push_back(images.back().height());
    }

    const std::vector<TileCrop> plan = plan_tile_crops(heights, geometry);
    if (plan.empty()) {
        throw CompositingError("every tile crop was empty");
    }

    const TileCrop& tail = plan.back();
    const int canvas_h = tail.dest_y + tail.height;
    PngImage canvas = PngImage::blank(images.front().width(), canvas_h);
    for (const auto& crop : plan) {
        canvas.paintRows(images[crop.tile], crop.src_y, crop.height, crop.dest_y);
    }

    std::cout << "[Compositor] Stitched " << plan.size() << "/" << tiles.size()
              << " tiles into " << images.front().width() << "x" << canvas_h << std::endl;
    return canvas.encode();
}

void LongCapture::collectTiles(Page& page, const std::string& selector, CaptureState& state) const {
    while (true) {
        state.tiles.push_back(page.captureElement(selector));
        const double before = page.scrollMetrics(selector).scroll_top;

        if (state.tiles.size() >= options_.max_tiles) {
            std::cerr << "[Compositor] Tile cap of " << options_.max_tiles << " reached; stitching what we have" << std::endl;
            return;
        }

        const ScrollMetrics live = page.scrollMetrics(selector);
        page.scrollBy(selector, std::max(1.0, live.client_height - options_.overlap));

        if (!page.waitForNetworkIdle(options_.network_idle, options_.network_idle_timeout)) {
            std::cerr << "[Compositor] Network did not settle after scrolling; continuing" << std::endl;
        }

        state.scroll_top = page.scrollMetrics(selector).scroll_top;
        if (state.scroll_top == before) {
            std::cout << "[Compositor] Bottom reached after " << state.tiles.size() << " tiles" << std::endl;
            return;
        }
    }
}

std::string LongCapture::capture(Page& page, const std::string& selector) const {
    page.waitForVisible(selector, options_.selector_timeout);

    const ScrollMetrics initial = page.scrollMetrics(selector);
    if (initial.scroll_height <= initial.client_height) {
        std::cout << "[Compositor] " << selector << " does not scroll; direct capture" << std::endl;
        return page.captureElement(selector);
    }

    // Tiles are laid out from offset 0, so start from the top.
    if (initial.scroll_top > 0) {
        page.scrollBy(selector, -initial.scroll_top);
        if (!page.waitForNetworkIdle(options_.network_idle, options_.network_idle_timeout)) {
            std::cerr << "[Compositor] Network did not settle after rewinding " << selector << "; continuing" << std::endl;
        }
    }

    CaptureState state;
    state.viewport_height = initial.client_height;
    state.scroll_top = page.scrollMetrics(selector).scroll_top;
    collectTiles(page, selector, state);

    state.content_height = page.scrollMetrics(selector).scroll_height;
    state.device_pixel_ratio = page.devicePixelRatio();

    CaptureGeometry geometry;
    geometry.visible_px = static_cast<int>(std::lround(state.viewport_height * state.device_pixel_ratio));
    geometry.overlap_px = static_cast<int>(std::lround(options_.overlap * state.device_pixel_ratio));
    geometry.total_px = static_cast<int>(std::lround(state.content_height * state.device_pixel_ratio));

    std::cout << "[Compositor] " << state.tiles.size() << " tiles, dpr " << state.device_pixel_ratio
              << ", visible " << geometry.visible_px << "px, total " << geometry.total_px << "px" << std::endl;
    return composite(state.tiles, geometry);
}

} // namespace page_pilot
