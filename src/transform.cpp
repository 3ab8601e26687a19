#include "transform.hpp"

namespace fetchmap {

geo_pixel_transform::geo_pixel_transform(int zoom, int origin_tile_x, int origin_tile_y,
                                         unsigned int tile_size)
  : m_zoom(zoom)
  , m_origin_tile_x(origin_tile_x)
  , m_origin_tile_y(origin_tile_y)
  , m_tile_size(tile_size) {
  // validates the zoom and tile size.
  projection::world_size(zoom, tile_size);
}

pixel_point geo_pixel_transform::forward(double lon, double lat) const {
  pixel_point p = projection::geo_to_pixel(lon, lat, m_zoom, m_tile_size);
  return pixel_point(p.x - origin_x(), p.y - origin_y());
}

geo_point geo_pixel_transform::backward(double px, double py) const {
  return projection::pixel_to_geo(px + origin_x(), py + origin_y(), m_zoom, m_tile_size);
}

} // namespace fetchmap
