#ifndef FETCHMAP_TRANSFORM_HPP
#define FETCHMAP_TRANSFORM_HPP

#include "geo.hpp"
#include "projection.hpp"

namespace fetchmap {

/* Maps geographic coordinates onto the pixels of a mosaic canvas
 * and back. The canvas origin is the north-west corner of the
 * tile at (origin_tile_x, origin_tile_y), so this is the world
 * projection at a fixed zoom shifted by a whole number of tiles.
 *
 * Immutable once constructed.
 */
class geo_pixel_transform {
public:
  geo_pixel_transform(int zoom, int origin_tile_x, int origin_tile_y,
                      unsigned int tile_size = projection::default_tile_size);

  // geographic coordinate -> canvas pixel. throws out_of_range_error
  // for coordinates outside the projection's valid range.
  pixel_point forward(double lon, double lat) const;

  // canvas pixel -> geographic coordinate.
  geo_point backward(double px, double py) const;

  inline int zoom() const { return m_zoom; }
  inline int origin_tile_x() const { return m_origin_tile_x; }
  inline int origin_tile_y() const { return m_origin_tile_y; }
  inline unsigned int tile_size() const { return m_tile_size; }

  // absolute world pixel position of the canvas origin.
  inline double origin_x() const { return double(m_origin_tile_x) * m_tile_size; }
  inline double origin_y() const { return double(m_origin_tile_y) * m_tile_size; }

private:
  int m_zoom;
  int m_origin_tile_x, m_origin_tile_y;
  unsigned int m_tile_size;
};

} // namespace fetchmap

#endif /* FETCHMAP_TRANSFORM_HPP */
