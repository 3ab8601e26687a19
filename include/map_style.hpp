#ifndef FETCHMAP_MAP_STYLE_HPP
#define FETCHMAP_MAP_STYLE_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>

#include <mapnik/color.hpp>
#include <mapnik/image.hpp>

namespace fetchmap {

/* Enhancement factors for the base map. 1.0 leaves the image as
 * it is, 0.0 gives grey (saturation), flat grey (contrast) or
 * black (brightness).
 */
struct colour_adjustment {
  colour_adjustment();
  colour_adjustment(double saturation_, double contrast_, double brightness_);

  double saturation, contrast, brightness;
};

/* How overlays are drawn over the tiles of a source, and how the
 * tiles themselves are toned down to keep the overlays readable.
 */
struct map_style {
  map_style();

  std::string name;

  mapnik::color track_colour;
  double track_width;
  // drawn underneath the track, this much wider on each side. no
  // outline if zero.
  double track_outline_width;
  mapnik::color track_outline;

  mapnik::color waypoint_colour;
  mapnik::color waypoint_outline;
  // marker diameter in pixels.
  double waypoint_size;

  // applied to the mosaic before overlays are drawn.
  boost::optional<colour_adjustment> adjust;
};

// style by name, throws invalid_request_error if not known.
map_style named_style(const std::string &name);

// all known style names, sorted.
std::vector<std::string> style_names();

/* Applies saturation, then contrast, then brightness to every
 * pixel. Contrast is scaled about the mean grey level of the
 * whole image. Alpha is unchanged.
 */
void adjust_colours(mapnik::image_rgba8 &image, const colour_adjustment &adjust);

} // namespace fetchmap

#endif /* FETCHMAP_MAP_STYLE_HPP */
