#ifndef FETCHMAP_OVERLAY_GPX_HPP
#define FETCHMAP_OVERLAY_GPX_HPP

#include "map_style.hpp"
#include "overlay.hpp"

#include <istream>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace fetchmap { namespace overlays {

// which parts of a GPX file get drawn.
enum class gpx_features { tracks, waypoints, any };

struct waypoint {
  geo_point position;
  std::string name, description;
};

// one track segment as a polyline.
typedef std::vector<geo_point> track_segment;

struct gpx_document {
  std::string description;
  std::vector<track_segment> segments;
  std::vector<waypoint> waypoints;
};

/* Parse GPX 1.0 or 1.1. Tracks (trk/trkseg/trkpt), routes
 * (rte/rtept) and waypoints (wpt) are read; everything else is
 * ignored. Throws std::runtime_error for malformed XML or points
 * without a usable lat/lon.
 */
gpx_document parse_gpx(std::istream &in);
gpx_document read_gpx(const boost::filesystem::path &file);

/* Parse a command line GPX argument of the form
 * "[(trk|wpt|any),]file.gpx". Without a recognised prefix the
 * whole argument is the file name and all features are drawn.
 */
struct gpx_argument {
  gpx_features features;
  std::string file;
};

gpx_argument parse_gpx_argument(const std::string &arg);

/* Draws the tracks and waypoints of a GPX document in the colours
 * of the map style. Tracks are drawn as lines, on top of their
 * outline if the style has one, then waypoints as round markers
 * so they stay visible. Segments of a single point aren't drawn.
 */
class gpx_overlay : public overlay {
public:
  gpx_overlay(const gpx_document &doc, gpx_features features,
              const map_style &style = map_style());
  virtual ~gpx_overlay();

  void render(overlay_canvas &canvas);

private:
  const gpx_document m_doc;
  const gpx_features m_features;
  const map_style m_style;
};

} } // namespace fetchmap::overlays

#endif /* FETCHMAP_OVERLAY_GPX_HPP */
