#include "tile_source.hpp"
#include "errors.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <boost/format.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/xpressive/xpressive.hpp>

namespace fetchmap {

namespace {

struct provider_entry {
  provider p;
  const char *name;
  const char *url;
  const char *attribution;
  const char *style;
};

const char esri_attribution[] = "Tiles \xc2\xa9 Esri";
const char stamen_attribution[] = "Map tiles by Stamen Design, under CC BY 3.0. Data by OpenStreetMap, under ODbL.";
const char wikimedia_attribution[] = "Wikimedia maps | Map data \xc2\xa9 OpenStreetMap contributors";

const provider_entry providers[] = {
  { provider::natgeo, "natgeo",
    "https://services.arcgisonline.com/ArcGIS/rest/services/NatGeo_World_Map/MapServer/tile/{z}/{y}/{x}.jpg",
    esri_attribution,
    "default" },
  { provider::natgeo_us_topo, "natgeo-us-topo",
    "https://services.arcgisonline.com/arcgis/rest/services/USA_Topo_Maps/MapServer/tile/{z}/{y}/{x}.jpg",
    esri_attribution,
    "default" },
  { provider::esri_terrain, "esri-terrain",
    "https://services.arcgisonline.com/arcgis/rest/services/World_Terrain_Base/MapServer/tile/{z}/{y}/{x}.jpg",
    esri_attribution,
    "default" },
  { provider::esri_topo, "esri-topo",
    "https://services.arcgisonline.com/arcgis/rest/services/World_Topo_Map/MapServer/tile/{z}/{y}/{x}.jpg",
    esri_attribution,
    "default" },
  { provider::usgs_relief, "usgs-relief",
    "https://basemap.nationalmap.gov/arcgis/rest/services/USGSShadedReliefOnly/MapServer/tile/{z}/{y}/{x}",
    "USGS The National Map",
    "default" },
  { provider::stamen_terrain, "stamen-terrain",
    "http://b.tile.stamen.com/terrain/{z}/{x}/{y}.png",
    stamen_attribution,
    "stamen" },
  { provider::stamen_terrain_background, "stamen-terrain-background",
    "http://b.tile.stamen.com/terrain-background/{z}/{x}/{y}.png",
    stamen_attribution,
    "stamen" },
  { provider::stamen_toner, "stamen-toner",
    "http://b.tile.stamen.com/toner/{z}/{x}/{y}.png",
    stamen_attribution,
    "stamen" },
  { provider::korona_roads, "korona-roads",
    "https://korona.geog.uni-heidelberg.de/tiles/roads/x={x}&y={y}&z={z}",
    "GIScience Research Group @ University of Heidelberg | Map data \xc2\xa9 OpenStreetMap contributors",
    "default" },
  { provider::wikimedia_labels, "wikimedia-labels",
    "https://maps.wikimedia.org/osm-intl/{z}/{x}/{y}.png",
    wikimedia_attribution,
    "default" },
  { provider::wikimedia, "wikimedia",
    "https://maps.wikimedia.org/osm/{z}/{x}/{y}.png",
    wikimedia_attribution,
    "default" },
};

const provider_entry &entry_for(provider p) {
  for (const provider_entry &e : providers) {
    if (e.p == p) {
      return e;
    }
  }
  throw std::logic_error("provider missing from the registry table");
}

struct formatter {
  const tile_index &idx;

  explicit formatter(const tile_index &idx_) : idx(idx_) {}

  template<typename Out>
  Out operator()(boost::xpressive::smatch const &what, Out out) const {
    int val = 0;

    char c = what[1].str()[0];
    if      (c == 'z') { val = idx.z; }
    else if (c == 'x') { val = idx.x; }
    else if (c == 'y') { val = idx.y; }
    else { throw std::runtime_error("match failed"); }

    std::string sub = (boost::format("%1%") % val).str();
    out = std::copy(sub.begin(), sub.end(), out);

    return out;
  }
};

// matches the {z}, {x} and {y} placeholders.
const boost::xpressive::sregex &placeholder_regex() {
  using namespace boost::xpressive;
  static const sregex var = "{" >> (s1 = range('x','z')) >> "}";
  return var;
}

std::string normalise_template(const std::string &url_template) {
  return boost::algorithm::replace_all_copy(url_template, "${", "{");
}

} // anonymous namespace

tile_source::tile_source(const std::string &id_, const std::string &url_template_,
                         unsigned int tile_size_, const std::string &attribution_,
                         const map_style &style_)
  : id(id_)
  , url_template(normalise_template(url_template_))
  , tile_size(tile_size_)
  , attribution(attribution_)
  , style(style_) {

  if (id.empty() || (id == ".") || (id == "..") || (id.find_first_of("/\\") != std::string::npos)) {
    throw invalid_request_error((boost::format("Tile source id \"%1%\" can't be used as a cache directory name.")
                                 % id).str());
  }

  for (const char *placeholder : {"{z}", "{x}", "{y}"}) {
    if (url_template.find(placeholder) == std::string::npos) {
      throw invalid_request_error((boost::format("URL template \"%1%\" is missing the %2% placeholder.")
                                   % url_template_ % placeholder).str());
    }
  }

  if (tile_size == 0) {
    throw invalid_request_error("Tile size must be greater than zero.");
  }
}

std::string tile_source::url_for(const tile_index &idx) const {
  return boost::xpressive::regex_replace(url_template, placeholder_regex(), formatter(idx));
}

tile_source named_source(provider p) {
  const provider_entry &e = entry_for(p);
  return tile_source(e.name, e.url, projection::default_tile_size, e.attribution,
                     named_style(e.style));
}

tile_source custom_source(const std::string &url_template, unsigned int tile_size) {
  return tile_source(custom_source_id, url_template, tile_size, "");
}

std::string provider_name(provider p) {
  return entry_for(p).name;
}

boost::optional<provider> provider_from_name(const std::string &name) {
  for (const provider_entry &e : providers) {
    if (name == e.name) {
      return e.p;
    }
  }
  return boost::none;
}

std::vector<std::string> provider_names() {
  std::vector<std::string> names;
  for (const provider_entry &e : providers) {
    names.push_back(e.name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace fetchmap
