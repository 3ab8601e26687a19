#ifndef FETCHMAP_TILE_SOURCE_HPP
#define FETCHMAP_TILE_SOURCE_HPP

#include "geo.hpp"
#include "map_style.hpp"
#include "projection.hpp"

#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace fetchmap {

// the tile servers known by name.
enum class provider {
  natgeo,
  natgeo_us_topo,
  esri_terrain,
  esri_topo,
  usgs_relief,
  stamen_terrain,
  stamen_terrain_background,
  stamen_toner,
  korona_roads,
  wikimedia_labels,
  wikimedia
};

const provider default_provider = provider::wikimedia;

// identifier used for tile sources built from a user's template.
const char custom_source_id[] = "user";

/* Description of a tile server: where tiles come from, how big
 * they are and how overlays are styled on them. The id also names
 * the source's cache directory.
 */
class tile_source {
public:
  /* Templates contain {z}, {x} and {y} placeholders; the ${z}
   * form is also accepted. Throws invalid_request_error if any
   * placeholder is missing, or if the id is empty or not usable
   * as a directory name, or the tile size is zero.
   */
  tile_source(const std::string &id, const std::string &url_template,
              unsigned int tile_size, const std::string &attribution,
              const map_style &style = map_style());

  // URL of a single tile.
  std::string url_for(const tile_index &idx) const;

  const std::string id;
  const std::string url_template;
  const unsigned int tile_size;
  const std::string attribution;
  const map_style style;
};

tile_source named_source(provider p);

// a source for a user-supplied URL template.
tile_source custom_source(const std::string &url_template,
                          unsigned int tile_size = projection::default_tile_size);

// short name of a provider, e.g: "esri-topo".
std::string provider_name(provider p);

// lookup by short name, boost::none if not known.
boost::optional<provider> provider_from_name(const std::string &name);

// all known short names, sorted.
std::vector<std::string> provider_names();

} // namespace fetchmap

#endif /* FETCHMAP_TILE_SOURCE_HPP */
