#ifndef FETCHMAP_OVERLAY_HPP
#define FETCHMAP_OVERLAY_HPP

#include "geo.hpp"
#include "transform.hpp"

#include <string>

#include <mapnik/image.hpp>
#include <mapnik/map.hpp>
#include <mapnik/layer.hpp>
#include <mapnik/geometry.hpp>

namespace fetchmap {

/* The only way overlays are allowed to place geometry on the
 * mosaic. Bound to the mosaic's zoom and canvas origin, so all
 * overlays line up with the tiles and with each other.
 */
class overlay_projector {
public:
  explicit overlay_projector(const geo_pixel_transform &transform);

  // canvas pixel of a geographic point. coordinates beyond the
  // projection's range are clamped to it.
  pixel_point project(double lon, double lat) const;
  inline pixel_point project(const geo_point &p) const { return project(p.lon, p.lat); }

  inline int zoom() const { return m_transform.zoom(); }

private:
  const geo_pixel_transform m_transform;
};

/* What an overlay gets to draw on: the pixels, which it may
 * change, and the projector, which it may not.
 *
 * Overlays draw with mapnik. make_map() gives an empty map whose
 * coordinates are canvas pixels, to which the overlay adds its
 * styles and layers of features, built with map_point() from the
 * projector's output. render() then draws the map's layers over
 * the image.
 */
struct overlay_canvas {
  overlay_canvas(mapnik::image_rgba8 &image_, const geo_pixel_transform &transform);

  mapnik::Map make_map() const;
  // a layer in the same coordinates, with no datasource or style.
  mapnik::layer make_layer(const std::string &name) const;

  // a canvas pixel in the coordinates of make_map()'s maps.
  mapnik::geometry::point<double> map_point(const pixel_point &p) const;

  void render(const mapnik::Map &map);

  mapnik::image_rgba8 &image;
  const overlay_projector projector;
};

struct overlay {
  virtual ~overlay();
  virtual void render(overlay_canvas &canvas) = 0;
};

} // namespace fetchmap

#endif /* FETCHMAP_OVERLAY_HPP */
