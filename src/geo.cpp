#include "geo.hpp"
#include "errors.hpp"
#include "projection.hpp"

#include <cmath>
#include <initializer_list>
#include <boost/format.hpp>

namespace fetchmap {

geo_bbox::geo_bbox()
  : west(0.0), south(0.0), east(0.0), north(0.0) {
}

geo_bbox::geo_bbox(double west_, double south_, double east_, double north_)
  : west(west_), south(south_), east(east_), north(north_) {
}

void validate(const geo_bbox &bbox) {
  for (double v : {bbox.west, bbox.south, bbox.east, bbox.north}) {
    if (!std::isfinite(v)) {
      throw invalid_request_error((boost::format("Bounding box %1% has a non-finite coordinate.") % bbox).str());
    }
  }

  for (double lon : {bbox.west, bbox.east}) {
    if (std::abs(lon) > 180.0) {
      throw out_of_range_error((boost::format("Longitude %1% in bounding box %2% is outside the "
                                              "range -180 to 180.") % lon % bbox).str());
    }
  }

  for (double lat : {bbox.south, bbox.north}) {
    if (std::abs(lat) > projection::max_latitude) {
      throw out_of_range_error((boost::format("Latitude %1% in bounding box %2% is outside the "
                                              "projection's range of +/-%3%.")
                                % lat % bbox % projection::max_latitude).str());
    }
  }

  if (bbox.south >= bbox.north) {
    throw invalid_request_error((boost::format("Bounding box %1% has south >= north.") % bbox).str());
  }

  if (bbox.west == bbox.east) {
    throw invalid_request_error((boost::format("Bounding box %1% has zero width.") % bbox).str());
  }

  if (bbox.crosses_antimeridian()) {
    throw unsupported_region_error((boost::format("Bounding box %1% crosses the antimeridian, "
                                                  "which is not supported.") % bbox).str());
  }
}

bool operator==(const tile_index &a, const tile_index &b) {
  return (a.z == b.z) && (a.x == b.x) && (a.y == b.y);
}

bool operator!=(const tile_index &a, const tile_index &b) {
  return !(a == b);
}

bool operator<(const tile_index &a, const tile_index &b) {
  if (a.z != b.z) { return a.z < b.z; }
  if (a.y != b.y) { return a.y < b.y; }
  return a.x < b.x;
}

bool is_valid(const tile_index &idx) {
  if ((idx.z < 0) || (idx.z > projection::max_zoom_level)) {
    return false;
  }
  const long long dim = 1LL << idx.z;
  return (idx.x >= 0) && (idx.x < dim) && (idx.y >= 0) && (idx.y < dim);
}

std::ostream &operator<<(std::ostream &out, const tile_index &idx) {
  out << idx.z << "/" << idx.x << "/" << idx.y;
  return out;
}

std::ostream &operator<<(std::ostream &out, const geo_bbox &bbox) {
  out << "(west=" << bbox.west << ", south=" << bbox.south
      << ", east=" << bbox.east << ", north=" << bbox.north << ")";
  return out;
}

} // namespace fetchmap
