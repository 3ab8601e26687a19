#include "map_style.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <boost/format.hpp>

namespace fetchmap {

namespace {

const char default_style_name[] = "default";
const char stamen_style_name[] = "stamen";

// grey level of a pixel, as ITU-R 601-2 luma.
inline double luma(double r, double g, double b) {
  return (r * 299.0 + g * 587.0 + b * 114.0) / 1000.0;
}

inline std::uint32_t to_channel(double v) {
  return std::uint32_t(std::max(0.0, std::min(255.0, std::floor(v + 0.5))));
}

// calls f(r, g, b) for each pixel, f changes the channels in place.
template <typename F>
void for_each_pixel(mapnik::image_rgba8 &image, F f) {
  for (std::size_t y = 0; y < image.height(); ++y) {
    mapnik::image_rgba8::pixel_type *row = image.get_row(y);
    for (std::size_t x = 0; x < image.width(); ++x) {
      const std::uint32_t p = row[x];
      double r = p & 0xff, g = (p >> 8) & 0xff, b = (p >> 16) & 0xff;
      f(r, g, b);
      row[x] = to_channel(r) | (to_channel(g) << 8) | (to_channel(b) << 16) | (p & 0xff000000);
    }
  }
}

double mean_grey(const mapnik::image_rgba8 &image) {
  const std::size_t count = image.width() * image.height();
  if (count == 0) { return 0.0; }

  double total = 0.0;
  for (std::size_t y = 0; y < image.height(); ++y) {
    const mapnik::image_rgba8::pixel_type *row = image.get_row(y);
    for (std::size_t x = 0; x < image.width(); ++x) {
      const std::uint32_t p = row[x];
      total += luma(p & 0xff, (p >> 8) & 0xff, (p >> 16) & 0xff);
    }
  }
  return std::floor(total / count + 0.5);
}

} // anonymous namespace

colour_adjustment::colour_adjustment()
  : saturation(1.0), contrast(1.0), brightness(1.0) {
}

colour_adjustment::colour_adjustment(double saturation_, double contrast_, double brightness_)
  : saturation(saturation_), contrast(contrast_), brightness(brightness_) {
}

map_style::map_style()
  : name(default_style_name)
  , track_colour("#FF5500")
  , track_width(6.0)
  , track_outline_width(0.0)
  , track_outline(255, 255, 255)
  , waypoint_colour("#C00000")
  , waypoint_outline(255, 255, 255)
  , waypoint_size(16.0)
  , adjust() {
}

map_style named_style(const std::string &name) {
  map_style style;

  if (name == default_style_name) {
    return style;

  } else if (name == stamen_style_name) {
    // washed out tiles, and a red outline around the track.
    style.name = stamen_style_name;
    style.track_width = 7.0;
    style.track_outline_width = 1.0;
    style.track_outline = mapnik::color(255, 0, 0);
    style.adjust = colour_adjustment(1.0, 0.4, 1.15);
    return style;
  }

  throw invalid_request_error((boost::format("Unknown map style \"%1%\".") % name).str());
}

std::vector<std::string> style_names() {
  std::vector<std::string> names;
  names.push_back(default_style_name);
  names.push_back(stamen_style_name);
  return names;
}

void adjust_colours(mapnik::image_rgba8 &image, const colour_adjustment &adjust) {
  if (adjust.saturation != 1.0) {
    const double f = adjust.saturation;
    for_each_pixel(image, [f](double &r, double &g, double &b) {
        const double grey = luma(r, g, b);
        r = grey + f * (r - grey);
        g = grey + f * (g - grey);
        b = grey + f * (b - grey);
      });
  }

  if (adjust.contrast != 1.0) {
    const double f = adjust.contrast;
    const double mean = mean_grey(image);
    for_each_pixel(image, [f, mean](double &r, double &g, double &b) {
        r = mean + f * (r - mean);
        g = mean + f * (g - mean);
        b = mean + f * (b - mean);
      });
  }

  if (adjust.brightness != 1.0) {
    const double f = adjust.brightness;
    for_each_pixel(image, [f](double &r, double &g, double &b) {
        r *= f;
        g *= f;
        b *= f;
      });
  }
}

} // namespace fetchmap
