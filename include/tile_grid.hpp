#ifndef FETCHMAP_TILE_GRID_HPP
#define FETCHMAP_TILE_GRID_HPP

#include "geo.hpp"
#include "projection.hpp"
#include "transform.hpp"
#include "zoom_selector.hpp"

#include <vector>

namespace fetchmap {

// inclusive rectangle of tile indices at one zoom level.
struct tile_range {
  tile_range() : zoom(0), min_x(0), min_y(0), max_x(0), max_y(0) {}
  tile_range(int zoom_, int min_x_, int min_y_, int max_x_, int max_y_)
    : zoom(zoom_), min_x(min_x_), min_y(min_y_), max_x(max_x_), max_y(max_y_) {}

  inline int count_x() const { return max_x - min_x + 1; }
  inline int count_y() const { return max_y - min_y + 1; }
  inline int count() const { return count_x() * count_y(); }

  int zoom, min_x, min_y, max_x, max_y;
};

// where one tile goes on the canvas.
struct tile_placement {
  tile_placement() : x(0), y(0) {}
  tile_placement(const tile_index &index_, unsigned int x_, unsigned int y_)
    : index(index_), x(x_), y(y_) {}

  tile_index index;
  // pixel offset of the tile's top-left corner on the canvas.
  unsigned int x, y;
};

/* Everything needed to assemble one mosaic. Tiles are ordered
 * row by row from the north-west corner; their destination
 * regions are disjoint and together cover the whole canvas.
 */
struct mosaic_plan {
  mosaic_plan() : tile_size(0), width(0), height(0) {}

  // transform for overlays, anchored at the north-west tile.
  geo_pixel_transform transform() const;

  tile_range range;
  unsigned int tile_size;
  // canvas size in pixels.
  unsigned int width, height;
  std::vector<tile_placement> tiles;
  // the requested bounding box, in canvas pixels.
  pixel_bbox requested;
};

/* Range of tiles covering the box at the given zoom. An edge lying
 * exactly on a tile boundary does not pull in the next tile. The
 * box is validated first, see validate().
 */
tile_range covering_tiles(const geo_bbox &bbox, int zoom,
                          unsigned int tile_size = projection::default_tile_size);

// plans the mosaic for the box at the given zoom.
mosaic_plan plan_mosaic(const geo_bbox &bbox, int zoom,
                        unsigned int tile_size = projection::default_tile_size);

} // namespace fetchmap

#endif /* FETCHMAP_TILE_GRID_HPP */
