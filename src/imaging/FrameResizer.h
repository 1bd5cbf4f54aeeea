#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace deskpool::imaging {

struct ImageSize {
    std::size_t width = 0;
    std::size_t height = 0;
};

// Reads the PNG header only. nullopt when `png` is not a PNG.
std::optional<ImageSize> png_size(const std::string& png);

// Bounds captured frames before they are cached or sent to clients.
class FrameResizer {
public:
    explicit FrameResizer(std::size_t max_width = 1200) : max_width_(max_width) {}

    // PNG no wider than max_width, aspect ratio kept (bilinear). Frames that
    // already fit come back untouched, as do bytes that fail to decode.
    std::string normalize(const std::string& png) const;

    std::size_t max_width() const { return max_width_; }

private:
    std::size_t max_width_;
};

} // namespace deskpool::imaging
