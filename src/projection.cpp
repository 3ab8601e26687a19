#include "projection.hpp"
#include "errors.hpp"

#include <cmath>
#include <boost/format.hpp>

namespace fetchmap { namespace projection {

namespace {

const double pi = 3.14159265358979323846;

inline double to_radians(double deg) { return deg * pi / 180.0; }
inline double to_degrees(double rad) { return rad * 180.0 / pi; }

} // anonymous namespace

double world_size(int zoom, unsigned int tile_size) {
  if ((zoom < 0) || (zoom > max_zoom_level)) {
    throw invalid_request_error((boost::format("Zoom level %1% is outside the range 0 to %2%.")
                                 % zoom % max_zoom_level).str());
  }
  if (tile_size == 0) {
    throw invalid_request_error("Tile size must be greater than zero.");
  }
  return double(tile_size) * std::ldexp(1.0, zoom);
}

pixel_point geo_to_world(double lon, double lat) {
  if (!(std::abs(lon) <= 180.0)) {
    throw out_of_range_error((boost::format("Longitude %1% is outside the range -180 to 180.") % lon).str());
  }
  if (!(std::abs(lat) <= max_latitude)) {
    throw out_of_range_error((boost::format("Latitude %1% is outside the projection's range of +/-%2%.")
                              % lat % max_latitude).str());
  }

  const double wx = (lon + 180.0) / 360.0;
  const double wy = (1.0 - std::asinh(std::tan(to_radians(lat))) / pi) / 2.0;
  return pixel_point(wx, wy);
}

geo_point world_to_geo(double wx, double wy) {
  const double lon = wx * 360.0 - 180.0;
  const double lat = to_degrees(std::atan(std::sinh(pi * (1.0 - 2.0 * wy))));
  return geo_point(lon, lat);
}

pixel_point geo_to_pixel(double lon, double lat, int zoom, unsigned int tile_size) {
  const double size = world_size(zoom, tile_size);
  pixel_point w = geo_to_world(lon, lat);
  return pixel_point(w.x * size, w.y * size);
}

geo_point pixel_to_geo(double px, double py, int zoom, unsigned int tile_size) {
  const double size = world_size(zoom, tile_size);
  return world_to_geo(px / size, py / size);
}

geo_point clamp(const geo_point &p) {
  geo_point c(p);
  if (c.lon < -180.0) { c.lon = -180.0; }
  if (c.lon > 180.0)  { c.lon = 180.0; }
  if (c.lat < -max_latitude) { c.lat = -max_latitude; }
  if (c.lat > max_latitude)  { c.lat = max_latitude; }
  return c;
}

} } // namespace fetchmap::projection
