#include "fetchmap.hpp"
#include "errors.hpp"
#include "fetch/http.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

#include <mapnik/image_util.hpp>

namespace fetchmap {

map_request::map_request()
  : bbox()
  , zoom()
  , page()
  , orient(orientation::automatic)
  , max_zoom(default_max_zoom) {
}

map_layout layout_map(const map_request &request, unsigned int tile_size) {
  validate(request.bbox);

  if (!request.zoom && ((request.page.width == 0) || (request.page.height == 0))) {
    throw invalid_request_error("A page size or an explicit zoom level is needed to lay out a map.");
  }

  map_layout layout;
  layout.fit = fit_to_page(request.bbox, request.page, request.orient,
                           request.zoom, tile_size, request.max_zoom);
  layout.plan = plan_mosaic(request.bbox, layout.fit.selection.zoom, tile_size);

  const tile_range &r = layout.plan.range;
  LOG_INFO(boost::format("Zoom %1% (%2%), tiles x %3%..%4% y %5%..%6%, canvas %7%x%8%")
           % r.zoom % (layout.fit.landscape ? "landscape" : "portrait")
           % r.min_x % r.max_x % r.min_y % r.max_y
           % layout.plan.width % layout.plan.height);

  return layout;
}

mosaic build_mosaic(const map_request &request, unsigned int tile_size,
                    fetcher &fetch, const compose_options &options) {
  map_layout layout = layout_map(request, tile_size);
  return compose(layout.plan, fetch, options);
}

std::unique_ptr<fetch::caching> make_fetcher(const tile_source &source, const fetch_options &opts) {
  fetch::http_options http_opts;
  http_opts.timeout_ms = opts.timeout_ms;
  http_opts.max_concurrent = opts.concurrency;
  http_opts.user_agent = opts.user_agent;

  std::unique_ptr<fetcher> upstream(new fetch::http(source, http_opts));
  std::shared_ptr<tile_cache> cache = std::make_shared<tile_cache>(opts.cache_dir);

  return std::unique_ptr<fetch::caching>(
    new fetch::caching(std::move(upstream), source.id, cache, opts.dry_run));
}

void render_overlays(mosaic &m, const std::vector<std::shared_ptr<overlay> > &overlays) {
  overlay_canvas canvas(m.image, m.transform);
  for (const auto &o : overlays) {
    o->render(canvas);
  }
}

void save_mosaic(const mosaic &m, const std::string &file) {
  mapnik::save_to_file(m.image, file);
  LOG_INFO(boost::format("Wrote %1%x%2% map to %3%") % m.image.width() % m.image.height() % file);
}

} // namespace fetchmap
