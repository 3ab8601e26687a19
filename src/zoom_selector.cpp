#include "zoom_selector.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

namespace fetchmap {

pixel_bbox pixel_extent(const geo_bbox &bbox, int zoom, unsigned int tile_size) {
  // north-west is the minimum in pixel space, as y grows southwards.
  pixel_point nw = projection::geo_to_pixel(bbox.west, bbox.north, zoom, tile_size);
  pixel_point se = projection::geo_to_pixel(bbox.east, bbox.south, zoom, tile_size);
  return pixel_bbox(nw.x, nw.y, se.x, se.y);
}

zoom_selection select_zoom(const geo_bbox &bbox,
                           unsigned int target_width, unsigned int target_height,
                           boost::optional<int> zoom_override,
                           unsigned int tile_size, int max_zoom) {
  validate(bbox);

  if (zoom_override) {
    const int z = *zoom_override;
    if ((z < 0) || (z > projection::max_zoom_level)) {
      throw invalid_request_error((boost::format("Zoom level %1% is outside the range 0 to %2%.")
                                   % z % projection::max_zoom_level).str());
    }
    return zoom_selection(z, pixel_extent(bbox, z, tile_size));
  }

  if ((max_zoom < 0) || (max_zoom > projection::max_zoom_level)) {
    throw invalid_request_error((boost::format("Maximum zoom %1% is outside the range 0 to %2%.")
                                 % max_zoom % projection::max_zoom_level).str());
  }

  // extents double with each zoom level, so the first one which
  // doesn't fit ends the search.
  boost::optional<zoom_selection> best;
  for (int z = 0; z <= max_zoom; ++z) {
    pixel_bbox extent = pixel_extent(bbox, z, tile_size);
    if ((extent.width() <= double(target_width)) && (extent.height() <= double(target_height))) {
      best = zoom_selection(z, extent);
    } else {
      break;
    }
  }

  if (!best) {
    LOG_WARNING(boost::format("Bounding box %1% does not fit %2%x%3% pixels at any zoom, using zoom 0.")
                % bbox % target_width % target_height);
    return zoom_selection(0, pixel_extent(bbox, 0, tile_size));
  }

  return *best;
}

page_fit fit_to_page(const geo_bbox &bbox, const page_size &portrait,
                     orientation orient, boost::optional<int> zoom_override,
                     unsigned int tile_size, int max_zoom) {
  const page_size landscape(portrait.height, portrait.width);

  page_fit fit;

  if ((orient == orientation::automatic) && !zoom_override) {
    zoom_selection upright = select_zoom(bbox, portrait.width, portrait.height, zoom_override, tile_size, max_zoom);
    zoom_selection sideways = select_zoom(bbox, landscape.width, landscape.height, zoom_override, tile_size, max_zoom);

    fit.landscape = sideways.zoom > upright.zoom;
    fit.page = fit.landscape ? landscape : portrait;
    fit.selection = fit.landscape ? sideways : upright;
    return fit;
  }

  fit.landscape = (orient == orientation::landscape);
  fit.page = fit.landscape ? landscape : portrait;
  fit.selection = select_zoom(bbox, fit.page.width, fit.page.height, zoom_override, tile_size, max_zoom);
  return fit;
}

} // namespace fetchmap
