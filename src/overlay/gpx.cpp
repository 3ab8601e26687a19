#include "overlay/gpx.hpp"
#include "logging/logger.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

#include <mapnik/feature.hpp>
#include <mapnik/feature_factory.hpp>
#include <mapnik/feature_type_style.hpp>
#include <mapnik/memory_datasource.hpp>
#include <mapnik/params.hpp>
#include <mapnik/rule.hpp>
#include <mapnik/symbolizer.hpp>
#include <mapnik/symbolizer_enumerations.hpp>

namespace pt = boost::property_tree;

namespace fetchmap { namespace overlays {

namespace {

geo_point read_point(const pt::ptree &node, const char *element) {
  boost::optional<double> lat = node.get_optional<double>("<xmlattr>.lat");
  boost::optional<double> lon = node.get_optional<double>("<xmlattr>.lon");
  if (!lat || !lon) {
    throw std::runtime_error((boost::format("GPX <%1%> element without valid lat and lon attributes.") % element).str());
  }
  return geo_point(*lon, *lat);
}

waypoint read_waypoint(const pt::ptree &node) {
  waypoint wpt;
  wpt.position = read_point(node, "wpt");
  wpt.name = node.get<std::string>("name", "");
  wpt.description = node.get<std::string>("desc", "");
  return wpt;
}

// appends all children called "name" of the node as one segment.
void read_segment(const pt::ptree &node, const char *name, std::vector<track_segment> &segments) {
  track_segment seg;
  for (const auto &child : node) {
    if (child.first == name) {
      seg.push_back(read_point(child.second, name));
    }
  }
  if (!seg.empty()) {
    segments.push_back(seg);
  }
}

const char track_layer[] = "gpx-tracks";
const char track_style[] = "gpx-track";
const char outline_style[] = "gpx-track-outline";
const char waypoint_layer[] = "gpx-waypoints";
const char waypoint_style[] = "gpx-waypoint";

std::shared_ptr<mapnik::memory_datasource> make_datasource() {
  mapnik::parameters params;
  params["type"] = "memory";
  return std::make_shared<mapnik::memory_datasource>(params);
}

mapnik::feature_type_style line_style(const mapnik::color &colour, double width) {
  mapnik::line_symbolizer line;
  mapnik::put(line, mapnik::keys::stroke, colour);
  mapnik::put(line, mapnik::keys::stroke_width, width);
  mapnik::put(line, mapnik::keys::stroke_linecap, mapnik::line_cap_enum::ROUND_CAP);
  mapnik::put(line, mapnik::keys::stroke_linejoin, mapnik::line_join_enum::ROUND_JOIN);

  mapnik::rule r;
  r.append(std::move(line));
  mapnik::feature_type_style style;
  style.add_rule(std::move(r));
  return style;
}

mapnik::feature_type_style marker_style(const map_style &s) {
  mapnik::markers_symbolizer marker;
  mapnik::put(marker, mapnik::keys::fill, s.waypoint_colour);
  mapnik::put(marker, mapnik::keys::stroke, s.waypoint_outline);
  mapnik::put(marker, mapnik::keys::stroke_width, 3.0);
  mapnik::put(marker, mapnik::keys::width, s.waypoint_size);
  mapnik::put(marker, mapnik::keys::height, s.waypoint_size);
  mapnik::put(marker, mapnik::keys::allow_overlap, true);
  mapnik::put(marker, mapnik::keys::ignore_placement, true);

  mapnik::rule r;
  r.append(std::move(marker));
  mapnik::feature_type_style style;
  style.add_rule(std::move(r));
  return style;
}

} // anonymous namespace

gpx_document parse_gpx(std::istream &in) {
  pt::ptree tree;
  try {
    pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);

  } catch (const pt::xml_parser_error &e) {
    throw std::runtime_error((boost::format("Unable to parse GPX: %1%") % e.what()).str());
  }

  boost::optional<const pt::ptree &> root = tree.get_child_optional("gpx");
  if (!root) {
    throw std::runtime_error("Not a GPX document: no <gpx> root element.");
  }

  gpx_document doc;
  // GPX 1.1 keeps the description in metadata, 1.0 at the top level.
  doc.description = root->get<std::string>("metadata.desc", root->get<std::string>("desc", ""));

  for (const auto &child : *root) {
    if (child.first == "wpt") {
      doc.waypoints.push_back(read_waypoint(child.second));

    } else if (child.first == "trk") {
      for (const auto &seg : child.second) {
        if (seg.first == "trkseg") {
          read_segment(seg.second, "trkpt", doc.segments);
        }
      }

    } else if (child.first == "rte") {
      read_segment(child.second, "rtept", doc.segments);
    }
  }

  LOG_DEBUG(boost::format("Read GPX with %1% track segments and %2% waypoints.")
            % doc.segments.size() % doc.waypoints.size());

  return doc;
}

gpx_document read_gpx(const boost::filesystem::path &file) {
  boost::filesystem::ifstream in(file);
  if (!in) {
    throw std::runtime_error((boost::format("Unable to open GPX file %1%.") % file).str());
  }
  return parse_gpx(in);
}

gpx_argument parse_gpx_argument(const std::string &arg) {
  gpx_argument result;
  result.features = gpx_features::any;
  result.file = arg;

  const std::string::size_type comma = arg.find(',');
  if (comma != std::string::npos) {
    const std::string prefix = arg.substr(0, comma);
    bool known = true;
    if      (prefix == "trk") { result.features = gpx_features::tracks; }
    else if (prefix == "wpt") { result.features = gpx_features::waypoints; }
    else if (prefix == "any") { result.features = gpx_features::any; }
    else { known = false; }

    if (known) {
      result.file = arg.substr(comma + 1);
    }
  }

  if (result.file.empty()) {
    throw std::runtime_error((boost::format("GPX argument \"%1%\" has no file name.") % arg).str());
  }

  return result;
}

gpx_overlay::gpx_overlay(const gpx_document &doc, gpx_features features, const map_style &style)
  : m_doc(doc), m_features(features), m_style(style) {
}

gpx_overlay::~gpx_overlay() {
}

void gpx_overlay::render(overlay_canvas &canvas) {
  mapnik::Map map = canvas.make_map();
  mapnik::context_ptr ctx = std::make_shared<mapnik::context_type>();
  mapnik::value_integer feature_id = 1;

  if (m_features != gpx_features::waypoints) {
    std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();
    for (const auto &seg : m_doc.segments) {
      if (seg.size() < 2) { continue; }

      mapnik::geometry::line_string<double> line;
      for (const auto &p : seg) {
        line.push_back(canvas.map_point(canvas.projector.project(p)));
      }
      mapnik::feature_ptr feature(mapnik::feature_factory::create(ctx, feature_id++));
      feature->set_geometry(std::move(line));
      ds->push(feature);
    }

    mapnik::layer layer = canvas.make_layer(track_layer);
    layer.set_datasource(ds);
    // each style is a pass over all the tracks, so outlines never
    // cover another track.
    if (m_style.track_outline_width > 0.0) {
      map.insert_style(outline_style, line_style(m_style.track_outline,
                                                 m_style.track_width + 2.0 * m_style.track_outline_width));
      layer.add_style(outline_style);
    }
    map.insert_style(track_style, line_style(m_style.track_colour, m_style.track_width));
    layer.add_style(track_style);
    map.add_layer(layer);
  }

  if (m_features != gpx_features::tracks) {
    std::shared_ptr<mapnik::memory_datasource> ds = make_datasource();
    for (const auto &wpt : m_doc.waypoints) {
      mapnik::feature_ptr feature(mapnik::feature_factory::create(ctx, feature_id++));
      feature->set_geometry(canvas.map_point(canvas.projector.project(wpt.position)));
      ds->push(feature);
    }

    mapnik::layer layer = canvas.make_layer(waypoint_layer);
    layer.set_datasource(ds);
    map.insert_style(waypoint_style, marker_style(m_style));
    layer.add_style(waypoint_style);
    map.add_layer(layer);
  }

  canvas.render(map);
}

} } // namespace fetchmap::overlays
