#include <catch2/catch.hpp>

#include "imaging/FrameResizer.h"

#include <boost/gil.hpp>
#include <boost/gil/extension/io/png.hpp>

#include <sstream>

using namespace deskpool::imaging;

namespace gil = boost::gil;

namespace {

std::string solid_png(std::ptrdiff_t width, std::ptrdiff_t height) {
    gil::rgb8_image_t img(width, height);
    gil::fill_pixels(gil::view(img), gil::rgb8_pixel_t(30, 120, 200));
    std::ostringstream out(std::ios::binary);
    gil::write_view(out, gil::const_view(img), gil::png_tag());
    return out.str();
}

} // namespace

TEST_CASE("Wide frames are scaled down to the width cap", "[frame]") {
    const std::string wide = solid_png(2400, 600);
    REQUIRE(png_size(wide)->width == 2400);

    const std::string scaled = FrameResizer(1200).normalize(wide);
    const auto size = png_size(scaled);
    REQUIRE(size);
    REQUIRE(size->width == 1200);
    REQUIRE(size->height == 300);
}

TEST_CASE("Frames within the cap are returned untouched", "[frame]") {
    const std::string small = solid_png(320, 200);
    REQUIRE(FrameResizer(1200).normalize(small) == small);
    REQUIRE(FrameResizer(320).normalize(small) == small);
}

TEST_CASE("Bytes that are not a PNG pass through", "[frame]") {
    const std::string garbage = "definitely not an image";
    REQUIRE_FALSE(png_size(garbage));
    REQUIRE(FrameResizer(10).normalize(garbage) == garbage);
    REQUIRE(FrameResizer(10).normalize("").empty());
}
