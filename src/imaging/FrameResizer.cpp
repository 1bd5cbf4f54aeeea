#include "imaging/FrameResizer.h"

#include "logging/Log.h"

#include <boost/gil.hpp>
#include <boost/gil/extension/io/png.hpp>
#include <boost/gil/extension/numeric/resample.hpp>
#include <boost/gil/extension/numeric/sampler.hpp>

#include <algorithm>
#include <exception>
#include <sstream>

namespace deskpool::imaging {

namespace gil = boost::gil;

std::optional<ImageSize> png_size(const std::string& png) {
    try {
        std::istringstream in(png, std::ios::binary);
        const auto backend = gil::read_image_info(in, gil::png_tag());
        return ImageSize{static_cast<std::size_t>(backend._info._width),
                         static_cast<std::size_t>(backend._info._height)};
    } catch (const std::exception& e) {
        logging::debug("Frame") << "not a PNG: " << e.what();
        return std::nullopt;
    }
}

std::string FrameResizer::normalize(const std::string& png) const {
    if (png.empty() || max_width_ == 0) return png;

    const std::optional<ImageSize> size = png_size(png);
    if (!size || size->width == 0 || size->width <= max_width_) return png;

    try {
        gil::rgba8_image_t source;
        std::istringstream in(png, std::ios::binary);
        gil::read_and_convert_image(in, source, gil::png_tag());

        const auto width = static_cast<std::ptrdiff_t>(max_width_);
        const auto height = std::max<std::ptrdiff_t>(
            1, static_cast<std::ptrdiff_t>(size->height * max_width_ / size->width));

        gil::rgba8_image_t scaled(width, height);
        gil::resize_view(gil::const_view(source), gil::view(scaled), gil::bilinear_sampler());

        std::ostringstream out(std::ios::binary);
        gil::write_view(out, gil::const_view(scaled), gil::png_tag());
        logging::debug("Frame") << "resized " << size->width << "x" << size->height << " to "
                                << width << "x" << height;
        return out.str();
    } catch (const std::exception& e) {
        logging::warn("Frame") << "resize failed, keeping original: " << e.what();
        return png;
    }
}

} // namespace deskpool::imaging
