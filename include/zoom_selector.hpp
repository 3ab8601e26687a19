#ifndef FETCHMAP_ZOOM_SELECTOR_HPP
#define FETCHMAP_ZOOM_SELECTOR_HPP

#include "geo.hpp"
#include "paper.hpp"
#include "projection.hpp"

#include <boost/optional.hpp>

namespace fetchmap {

// highest zoom offered by most public tile servers.
const int default_max_zoom = 18;

// rectangle in absolute world pixels at some zoom level.
struct pixel_bbox {
  pixel_bbox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
  pixel_bbox(double min_x_, double min_y_, double max_x_, double max_y_)
    : min_x(min_x_), min_y(min_y_), max_x(max_x_), max_y(max_y_) {}

  inline double width() const { return max_x - min_x; }
  inline double height() const { return max_y - min_y; }

  double min_x, min_y, max_x, max_y;
};

// exact (not tile-aligned) pixel extent of the box at a zoom.
pixel_bbox pixel_extent(const geo_bbox &bbox, int zoom,
                        unsigned int tile_size = projection::default_tile_size);

struct zoom_selection {
  zoom_selection() : zoom(0) {}
  zoom_selection(int zoom_, const pixel_bbox &extent_) : zoom(zoom_), extent(extent_) {}

  int zoom;
  // pixel extent of the bounding box at the selected zoom.
  pixel_bbox extent;
};

/* Pick the largest zoom level in [0, max_zoom] at which the box's
 * pixel extent fits within target_width x target_height. If no
 * zoom fits, zoom 0 is returned.
 *
 * An explicit zoom override wins unconditionally, as long as it
 * is a valid zoom level; otherwise invalid_request_error.
 *
 * The box is validated first, see validate().
 */
zoom_selection select_zoom(const geo_bbox &bbox,
                           unsigned int target_width, unsigned int target_height,
                           boost::optional<int> zoom_override = boost::none,
                           unsigned int tile_size = projection::default_tile_size,
                           int max_zoom = default_max_zoom);

enum class orientation { automatic, portrait, landscape };

struct page_fit {
  page_fit() : landscape(false) {}

  zoom_selection selection;
  bool landscape;
  // target size in the chosen orientation.
  page_size page;
};

/* Choose zoom and orientation for a page given in portrait
 * orientation. With orientation::automatic both orientations are
 * tried and the one giving the larger zoom wins, portrait on ties.
 * With a zoom override, automatic orientation means portrait.
 */
page_fit fit_to_page(const geo_bbox &bbox, const page_size &portrait,
                     orientation orient,
                     boost::optional<int> zoom_override = boost::none,
                     unsigned int tile_size = projection::default_tile_size,
                     int max_zoom = default_max_zoom);

} // namespace fetchmap

#endif /* FETCHMAP_ZOOM_SELECTOR_HPP */
