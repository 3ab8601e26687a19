#include "overlay.hpp"
#include "projection.hpp"

#include <mapnik/agg_renderer.hpp>
#include <mapnik/attribute.hpp>
#include <mapnik/box2d.hpp>
#include <mapnik/image_util.hpp>
#include <mapnik/request.hpp>
#include <mapnik/well_known_srs.hpp>

namespace fetchmap {

overlay_projector::overlay_projector(const geo_pixel_transform &transform)
  : m_transform(transform) {
}

pixel_point overlay_projector::project(double lon, double lat) const {
  const geo_point p = projection::clamp(geo_point(lon, lat));
  return m_transform.forward(p.lon, p.lat);
}

overlay_canvas::overlay_canvas(mapnik::image_rgba8 &image_, const geo_pixel_transform &transform)
  : image(image_), projector(transform) {
}

// maps and layers share an srs, so mapnik never reprojects the
// pixel coordinates. x runs east and y north, with the origin at
// the bottom-left corner of the image.
mapnik::Map overlay_canvas::make_map() const {
  mapnik::Map map(int(image.width()), int(image.height()), mapnik::MAPNIK_GMERC_PROJ);
  map.zoom_to_box(mapnik::box2d<double>(0.0, 0.0, double(image.width()), double(image.height())));
  return map;
}

mapnik::layer overlay_canvas::make_layer(const std::string &name) const {
  return mapnik::layer(name, mapnik::MAPNIK_GMERC_PROJ);
}

mapnik::geometry::point<double> overlay_canvas::map_point(const pixel_point &p) const {
  return mapnik::geometry::point<double>(p.x, double(image.height()) - p.y);
}

void overlay_canvas::render(const mapnik::Map &map) {
  typedef mapnik::agg_renderer<mapnik::image_rgba8> renderer_type;

  mapnik::attributes variables;
  mapnik::request request(map.width(), map.height(), map.get_current_extent());

  // the renderer blends onto premultiplied pixels, and leaves them
  // demultiplied again when it finishes.
  mapnik::premultiply_alpha(image);
  renderer_type renderer(map, request, variables, image, 1.0);
  renderer.apply();
  mapnik::demultiply_alpha(image);
}

overlay::~overlay() {
}

} // namespace fetchmap
