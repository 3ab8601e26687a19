#ifndef FETCHMAP_PROJECTION_HPP
#define FETCHMAP_PROJECTION_HPP

#include "geo.hpp"

namespace fetchmap { namespace projection {

// latitude at which the spherical mercator world becomes square,
// i.e: atan(sinh(pi)) in degrees.
const double max_latitude = 85.0511287798066;

// tile size used by practically every tile server.
const unsigned int default_tile_size = 256;

// highest zoom level the projection accepts. 2^30 tiles of 256
// pixels still fit comfortably in a double.
const int max_zoom_level = 30;

/* Number of pixels across the whole world at the given zoom,
 * i.e: tile_size * 2^zoom. Throws invalid_request_error if the
 * zoom is out of range or the tile size is zero.
 */
double world_size(int zoom, unsigned int tile_size = default_tile_size);

/* Normalised world coordinates in [0, 1], with (0, 0) at the
 * north-west corner of the world. Throws out_of_range_error if
 * the longitude is outside [-180, 180] or the latitude outside
 * [-max_latitude, max_latitude]. Callers with arbitrary input
 * should clamp() first.
 */
pixel_point geo_to_world(double lon, double lat);

// exact inverse of geo_to_world.
geo_point world_to_geo(double wx, double wy);

// absolute pixel position within the world at the given zoom.
pixel_point geo_to_pixel(double lon, double lat, int zoom,
                         unsigned int tile_size = default_tile_size);

// exact inverse of geo_to_pixel.
geo_point pixel_to_geo(double px, double py, int zoom,
                       unsigned int tile_size = default_tile_size);

// clamp latitude into the valid range and longitude into
// [-180, 180].
geo_point clamp(const geo_point &p);

} } // namespace fetchmap::projection

#endif /* FETCHMAP_PROJECTION_HPP */
