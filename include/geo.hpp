#ifndef FETCHMAP_GEO_HPP
#define FETCHMAP_GEO_HPP

#include <ostream>

namespace fetchmap {

// a point in degrees of longitude and latitude.
struct geo_point {
  geo_point() : lon(0.0), lat(0.0) {}
  geo_point(double lon_, double lat_) : lon(lon_), lat(lat_) {}

  double lon, lat;
};

// a point in pixel space, either absolute in the world at some
// zoom level, or relative to a canvas origin.
struct pixel_point {
  pixel_point() : x(0.0), y(0.0) {}
  pixel_point(double x_, double y_) : x(x_), y(y_) {}

  double x, y;
};

/* Geographic bounding box in degrees. A box with west > east
 * would cross the antimeridian, which is rejected by validate().
 */
struct geo_bbox {
  geo_bbox();
  geo_bbox(double west_, double south_, double east_, double north_);

  inline bool crosses_antimeridian() const { return west > east; }

  double west, south, east, north;
};

/* Check that the box is usable for planning a map. Throws
 *
 *   invalid_request_error
 *     for non-finite values, south >= north or west == east.
 *
 *   out_of_range_error
 *     for longitudes outside [-180, 180] or latitudes outside
 *     the valid range of the projection (this includes boxes
 *     covering a pole).
 *
 *   unsupported_region_error
 *     for boxes crossing the antimeridian.
 */
void validate(const geo_bbox &bbox);

/* Location of a single tile in the pyramid. x = 0 is the
 * west-most column and increases heading east, y = 0 is the
 * north-most row and increases heading south. Both range from
 * 0 to 2^z - 1.
 */
struct tile_index {
  tile_index() : z(0), x(0), y(0) {}
  tile_index(int z_, int x_, int y_) : z(z_), x(x_), y(y_) {}

  int z, x, y;
};

bool operator==(const tile_index &a, const tile_index &b);
bool operator!=(const tile_index &a, const tile_index &b);
// ordering by (z, y, x), i.e: row-major within a zoom level.
bool operator<(const tile_index &a, const tile_index &b);

// true if x and y are within range for the zoom level.
bool is_valid(const tile_index &idx);

std::ostream &operator<<(std::ostream &out, const tile_index &idx);
std::ostream &operator<<(std::ostream &out, const geo_bbox &bbox);

} // namespace fetchmap

#endif /* FETCHMAP_GEO_HPP */
