#ifndef FETCHMAP_HPP
#define FETCHMAP_HPP

#include "fetcher.hpp"
#include "fetch/caching.hpp"
#include "mosaic.hpp"
#include "options.hpp"
#include "overlay.hpp"
#include "paper.hpp"
#include "tile_grid.hpp"
#include "tile_source.hpp"
#include "zoom_selector.hpp"

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace fetchmap {

/* Everything which determines the geometry of a map, as opposed
 * to where its tiles come from.
 */
struct map_request {
  map_request();

  geo_bbox bbox;
  // if set, used instead of fitting the box to the page.
  boost::optional<int> zoom;
  // usable page area in portrait orientation.
  page_size page;
  orientation orient;
  int max_zoom;
};

struct map_layout {
  page_fit fit;
  mosaic_plan plan;
};

/**
 * layout_map works out zoom, orientation and tile plan for a
 * request, without fetching anything.
 *
 * Arguments:
 *
 *   request
 *     The bounding box and page to fit it to. If the request has
 *     an explicit zoom, it is used regardless of the page size.
 *
 *   tile_size
 *     Pixel size of the tiles of the source which will be used.
 *
 * Throws out_of_range_error, unsupported_region_error or
 * invalid_request_error if the request can't be turned into a
 * map. All of these are detected here, before any tile is
 * requested.
 */
map_layout layout_map(const map_request &request, unsigned int tile_size);

/**
 * build_mosaic lays out the request and composes the resulting
 * plan using tiles from the fetcher.
 *
 * Tiles which fail to fetch don't abort the map, they are listed
 * in the returned mosaic's failures instead. See compose().
 */
mosaic build_mosaic(const map_request &request, unsigned int tile_size,
                    fetcher &fetch, const compose_options &options = compose_options());

// the usual fetcher stack: HTTP, behind the tile cache.
std::unique_ptr<fetch::caching> make_fetcher(const tile_source &source, const fetch_options &opts);

// draw overlays onto the mosaic in order.
void render_overlays(mosaic &m, const std::vector<std::shared_ptr<overlay> > &overlays);

// encode the mosaic image to a file, the format is chosen from the
// file's extension (e.g: .png, .jpg).
void save_mosaic(const mosaic &m, const std::string &file);

} // namespace fetchmap

#endif /* FETCHMAP_HPP */
