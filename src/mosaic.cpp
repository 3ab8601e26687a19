#include "mosaic.hpp"
#include "errors.hpp"
#include "fetcher_io.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <utility>

#include <mapnik/image_reader.hpp>
#include <mapnik/image_util.hpp>

namespace fetchmap {

namespace {

typedef std::pair<const tile_placement *, std::future<fetch_response> > outstanding_fetch;

void paint(mosaic &result, const tile_placement &slot, fetch_response &&resp,
           const std::string &source_id) {
  if (resp.is_right()) {
    const fetch_error &err = resp.right();
    LOG_WARNING(boost::format("Unable to fetch tile: %1%") % err);
    result.failures.push_back(err);
    return;
  }

  const tile_ptr &tile = resp.left();
  if (tile->is_placeholder) {
    ++result.placeholders;
    return;
  }

  try {
    mapnik::image_rgba8 img = decode_tile(tile->bytes);
    paste(result.image, img, slot.x, slot.y, result.plan.tile_size, result.plan.tile_size);

  } catch (const std::exception &e) {
    fetch_error err(fetch_status::bad_data, source_id, slot.index, e.what());
    LOG_WARNING(boost::format("Unable to decode tile %1%: %2%") % slot.index % e.what());
    result.failures.push_back(err);
  }
}

} // anonymous namespace

compose_options::compose_options()
  : placeholder(224, 224, 224)
  , cancel(nullptr)
  , max_outstanding(16)
  , source_id()
  , adjust() {
}

mosaic::mosaic(const mosaic_plan &plan_)
  : plan(plan_)
  , image(plan_.width, plan_.height)
  , transform(plan_.transform())
  , placeholders(0) {
}

mapnik::image_rgba8 decode_tile(const std::string &bytes) {
  if (bytes.empty()) {
    throw std::runtime_error("Tile is empty.");
  }

  std::unique_ptr<mapnik::image_reader> reader(mapnik::get_image_reader(bytes.data(), bytes.size()));
  if (!reader) {
    throw std::runtime_error("Tile is not in a recognised image format.");
  }

  mapnik::image_rgba8 img(reader->width(), reader->height());
  reader->read(0, 0, img);
  return img;
}

void paste(mapnik::image_rgba8 &dst, const mapnik::image_rgba8 &src,
           unsigned int x, unsigned int y, unsigned int width, unsigned int height) {
  if ((x >= dst.width()) || (y >= dst.height())) { return; }

  const unsigned int w = std::min(std::min(width, static_cast<unsigned int>(src.width())),
                                  static_cast<unsigned int>(dst.width()) - x);
  const unsigned int h = std::min(std::min(height, static_cast<unsigned int>(src.height())),
                                  static_cast<unsigned int>(dst.height()) - y);

  for (unsigned int row = 0; row < h; ++row) {
    const mapnik::image_rgba8::pixel_type *from = src.get_row(row);
    mapnik::image_rgba8::pixel_type *to = dst.get_row(y + row) + x;
    std::memcpy(to, from, w * sizeof(mapnik::image_rgba8::pixel_type));
  }
}

mosaic compose(const mosaic_plan &plan, fetcher &fetch, const compose_options &options) {
  mosaic result(plan);
  mapnik::fill(result.image, options.placeholder);

  const std::size_t window = std::max<std::size_t>(options.max_outstanding, 1);
  std::deque<outstanding_fetch> outstanding;
  bool cancelled = false;

  auto is_cancelled = [&options]() -> bool {
    return (options.cancel != nullptr) && options.cancel->cancelled();
  };

  // tiles are consumed in plan order, so the output doesn't depend
  // on the order in which fetches complete.
  auto itr = plan.tiles.begin();
  while ((itr != plan.tiles.end()) || !outstanding.empty()) {
    if (is_cancelled()) { cancelled = true; break; }

    while ((itr != plan.tiles.end()) && (outstanding.size() < window)) {
      outstanding.push_back(outstanding_fetch(&(*itr), fetch(itr->index)));
      ++itr;
    }

    outstanding_fetch next(std::move(outstanding.front()));
    outstanding.pop_front();
    paint(result, *next.first, next.second.get(), options.source_id);
  }

  if (cancelled) {
    // wait for fetches already started, so nothing is left writing
    // to the cache after we return.
    for (auto &f : outstanding) {
      f.second.wait();
    }
    throw cancelled_error((boost::format("Mosaic cancelled with %1% of %2% tiles painted.")
                           % (std::size_t(itr - plan.tiles.begin()) - outstanding.size())
                           % plan.tiles.size()).str());
  }

  if (options.adjust) {
    adjust_colours(result.image, *options.adjust);
  }

  LOG_INFO(boost::format("Composed %1%x%2% mosaic from %3% tiles, %4% failed.")
           % plan.width % plan.height % plan.tiles.size() % result.failures.size());

  return result;
}

} // namespace fetchmap
