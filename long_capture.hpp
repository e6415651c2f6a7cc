#pragma once

#include "page.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace page_pilot {

// Device-pixel geometry of one stitched capture.
struct CaptureGeometry {
    int visible_px = 0;  // element's visible height
    int overlap_px = 0;
    int total_px = 0;    // element's final scroll height
};

// Rows [src_y, src_y + height) of tile `tile` land at `dest_y` in the output.
struct TileCrop {
    std::size_t tile = 0;
    int src_y = 0;
    int height = 0;
    int dest_y = 0;
};

// Per-screenshot working state; discarded once the image is composited.
struct CaptureState {
    std::vector<std::string> tiles;  // PNG bytes, top to bottom
    double scroll_top = 0.0;
    double device_pixel_ratio = 1.0;
    double content_height = 0.0;
    double viewport_height = 0.0;
};

// Crop plan for tiles taken `visible_px - overlap_px` apart.
//
// The first tile gives its top `step` rows, middle tiles give `step` rows
// starting at `overlap_px`, and the last tile gives exactly the rows still
// missing to reach `total_px`, taken from its bottom. Each crop is clamped to
// the tile's real height and skipped when nothing is left. A lone tile gives
// min(total_px, its height) rows from the top.
std::vector<TileCrop> plan_tile_crops(const std::vector<int>& tile_heights, const CaptureGeometry& geometry);

struct LongCaptureOptions {
    double overlap = 50.0;                   // logical px
    Millis network_idle = Millis(500);
    Millis network_idle_timeout = Millis(10000);
    std::size_t max_tiles = 200;
    Millis selector_timeout = Millis(15000);
};

// Screenshot of a scrollable element taller than its viewport.
class LongCapture {
public:
    explicit LongCapture(LongCaptureOptions options = LongCaptureOptions())
        : options_(options) {}

    // Returns PNG bytes. An element that does not scroll is captured directly.
    // Throws TimeoutError when the element never shows, CompositingError when
    // the tiles produce no image.
    std::string capture(Page& page, const std::string& selector) const;

    // Stitches PNG tiles per plan_tile_crops onto a white canvas as wide as the first tile.
    static std::string composite(const std::vector<std::string>& tiles, const CaptureGeometry& geometry);

private:
    void collectTiles(Page& page, const std::string& selector, CaptureState& state) const;

    LongCaptureOptions options_;
};

} // namespace page_pilot
