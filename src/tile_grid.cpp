#include "tile_grid.hpp"
#include "errors.hpp"

#include <cmath>
#include <algorithm>
#include <boost/format.hpp>

namespace fetchmap {

namespace {

// refuse to plan canvases larger than this on either side, which
// is far beyond any paper size but keeps image allocation sane.
const unsigned long long max_canvas_dimension = 65536;

int first_tile(double px, unsigned int tile_size) {
  return static_cast<int>(std::floor(px / tile_size));
}

// an edge exactly on a boundary belongs to the tile before it.
int last_tile(double px, unsigned int tile_size) {
  return static_cast<int>(std::ceil(px / tile_size)) - 1;
}

} // anonymous namespace

geo_pixel_transform mosaic_plan::transform() const {
  return geo_pixel_transform(range.zoom, range.min_x, range.min_y, tile_size);
}

tile_range covering_tiles(const geo_bbox &bbox, int zoom, unsigned int tile_size) {
  validate(bbox);

  const pixel_bbox extent = pixel_extent(bbox, zoom, tile_size);
  const int last = static_cast<int>((1LL << zoom) - 1);

  tile_range range(zoom,
                   first_tile(extent.min_x, tile_size),
                   first_tile(extent.min_y, tile_size),
                   last_tile(extent.max_x, tile_size),
                   last_tile(extent.max_y, tile_size));

  // a box narrower than floating point resolution can end up with
  // its far edge "before" its near one.
  range.max_x = std::max(range.max_x, range.min_x);
  range.max_y = std::max(range.max_y, range.min_y);

  // the far edge of the world (east = 180 or south at the limit)
  // would otherwise yield an index of 2^zoom.
  range.min_x = std::min(std::max(range.min_x, 0), last);
  range.min_y = std::min(std::max(range.min_y, 0), last);
  range.max_x = std::min(std::max(range.max_x, 0), last);
  range.max_y = std::min(std::max(range.max_y, 0), last);

  return range;
}

mosaic_plan plan_mosaic(const geo_bbox &bbox, int zoom, unsigned int tile_size) {
  mosaic_plan plan;
  plan.range = covering_tiles(bbox, zoom, tile_size);
  plan.tile_size = tile_size;

  const unsigned long long width = (unsigned long long)(plan.range.count_x()) * tile_size;
  const unsigned long long height = (unsigned long long)(plan.range.count_y()) * tile_size;
  if ((width > max_canvas_dimension) || (height > max_canvas_dimension)) {
    throw invalid_request_error((boost::format("Mosaic of %1%x%2% pixels at zoom %3% is too large; "
                                               "the limit is %4% pixels on each side.")
                                 % width % height % zoom % max_canvas_dimension).str());
  }
  plan.width = static_cast<unsigned int>(width);
  plan.height = static_cast<unsigned int>(height);

  plan.tiles.reserve(plan.range.count());
  for (int ty = plan.range.min_y; ty <= plan.range.max_y; ++ty) {
    for (int tx = plan.range.min_x; tx <= plan.range.max_x; ++tx) {
      plan.tiles.push_back(tile_placement(tile_index(zoom, tx, ty),
                                          (tx - plan.range.min_x) * tile_size,
                                          (ty - plan.range.min_y) * tile_size));
    }
  }

  const pixel_bbox extent = pixel_extent(bbox, zoom, tile_size);
  const double origin_x = double(plan.range.min_x) * tile_size;
  const double origin_y = double(plan.range.min_y) * tile_size;
  plan.requested = pixel_bbox(extent.min_x - origin_x, extent.min_y - origin_y,
                              extent.max_x - origin_x, extent.max_y - origin_y);

  return plan;
}

} // namespace fetchmap
