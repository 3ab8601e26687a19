#include "common.hpp"
#include "fetchmap.hpp"
#include "fetcher_io.hpp"
#include "errors.hpp"

#include <iostream>

#include <mapnik/image_util.hpp>

using fetchmap::geo_bbox;
using fetchmap::tile_index;
using fetchmap::mosaic;

namespace {

// covers tiles x 3..4, y 4..5 at zoom 4.
const geo_bbox small_box(-100.0, 50.0, -80.0, 60.0);

fetchmap::map_request zoom_request(const geo_bbox &bbox, int zoom) {
  fetchmap::map_request req;
  req.bbox = bbox;
  req.zoom = zoom;
  return req;
}

std::uint32_t pixel(const mapnik::image_rgba8 &img, unsigned int x, unsigned int y) {
  return img(x, y);
}

// checks a few pixels in the slot of each tile in the plan.
void assert_tiles_painted(const mosaic &m, const std::set<tile_index> &skip, std::uint32_t skip_colour) {
  const unsigned int ts = m.plan.tile_size;
  for (const auto &t : m.plan.tiles) {
    const std::uint32_t expected = (skip.count(t.index) > 0) ? skip_colour : test::packed(test::tile_colour(t.index));
    const unsigned int offsets[] = { 0, ts / 2, ts - 1 };
    for (unsigned int dx : offsets) {
      for (unsigned int dy : offsets) {
        test::assert_equal<std::uint32_t>(pixel(m.image, t.x + dx, t.y + dy), expected,
                                          (boost::format("tile %1% at +(%2%, %3%)") % t.index % dx % dy).str());
      }
    }
  }
}

bool same_image(const mapnik::image_rgba8 &a, const mapnik::image_rgba8 &b) {
  if ((a.width() != b.width()) || (a.height() != b.height())) { return false; }
  for (unsigned int y = 0; y < a.height(); ++y) {
    for (unsigned int x = 0; x < a.width(); ++x) {
      if (a(x, y) != b(x, y)) { return false; }
    }
  }
  return true;
}

void test_layout() {
  fetchmap::map_request req;
  req.bbox = geo_bbox(-112.23, 34.85, -104.58, 40.67);
  req.page = fetchmap::paper_size_px("A4", false, 300, 5);

  fetchmap::map_layout layout = fetchmap::layout_map(req, 256);
  test::assert_equal<int>(layout.fit.selection.zoom, 8, "zoom");
  test::assert_equal<int>(layout.plan.range.min_x, 48, "min x");
  test::assert_equal<int>(layout.plan.range.max_y, 101, "max y");
  test::assert_equal<unsigned int>(layout.plan.width, 1536, "canvas width");
}

void test_layout_needs_page_or_zoom() {
  fetchmap::map_request req;
  req.bbox = small_box;
  test::assert_throws<fetchmap::invalid_request_error>([&]() { fetchmap::layout_map(req, 256); }, "no page, no zoom");

  // an explicit zoom is enough.
  req.zoom = 4;
  test::assert_equal<int>(fetchmap::layout_map(req, 256).plan.range.count(), 4, "four tiles");
}

void test_layout_rejects_before_fetching() {
  test::stub_fetcher stub;
  fetchmap::map_request req = zoom_request(geo_bbox(170.0, 0.0, -170.0, 10.0), 4);
  test::assert_throws<fetchmap::unsupported_region_error>([&]() { fetchmap::build_mosaic(req, 256, stub); }, "antimeridian");
  test::assert_equal<std::size_t>(stub.calls(), 0, "nothing fetched");
}

void test_compose_all() {
  test::stub_fetcher stub;
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub);

  test::assert_equal<unsigned int>(m.image.width(), 512, "width");
  test::assert_equal<unsigned int>(m.image.height(), 512, "height");
  test::assert_equal<bool>(m.complete(), true, "complete");
  test::assert_equal<std::size_t>(stub.calls(), 4, "one fetch per tile");
  assert_tiles_painted(m, std::set<tile_index>(), 0);
}

void test_partial_failure() {
  test::stub_fetcher stub;
  stub.fail(tile_index(4, 3, 5));

  fetchmap::compose_options options;
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options);

  test::assert_equal<std::size_t>(m.failures.size(), 1, "one failure");
  test::assert_equal<tile_index>(m.failures[0].index, tile_index(4, 3, 5), "failed tile");
  test::assert_equal<fetchmap::fetch_status>(m.failures[0].status, fetchmap::fetch_status::not_found, "status");
  test::assert_equal<bool>(m.complete(), false, "incomplete");

  std::set<tile_index> failed;
  failed.insert(tile_index(4, 3, 5));
  assert_tiles_painted(m, failed, test::packed(options.placeholder));

  // the failed slot is the bottom-left one.
  test::assert_equal<std::uint32_t>(pixel(m.image, 10, 300), test::packed(options.placeholder), "placeholder");
}

void test_colour_adjustment() {
  test::stub_fetcher stub;
  stub.fail(tile_index(4, 3, 5));

  fetchmap::compose_options options;
  options.adjust = fetchmap::colour_adjustment(1.0, 1.0, 0.5);
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options);

  // tiles and placeholders alike are darkened.
  const mapnik::color tile = test::tile_colour(tile_index(4, 3, 4));
  const std::uint32_t p = pixel(m.image, 10, 10);
  test::assert_near(p & 0xff, tile.red() * 0.5, 1.0, "tile red");
  test::assert_near((p >> 8) & 0xff, tile.green() * 0.5, 1.0, "tile green");
  test::assert_near((p >> 16) & 0xff, tile.blue() * 0.5, 1.0, "tile blue");
  test::assert_near(pixel(m.image, 10, 300) & 0xff, options.placeholder.red() * 0.5, 1.0, "placeholder");
  test::assert_equal<std::size_t>(m.failures.size(), 1, "failure still reported");
}

void test_placeholder_colour() {
  test::stub_fetcher stub;
  stub.fail(tile_index(4, 4, 4));

  fetchmap::compose_options options;
  options.placeholder = mapnik::color(255, 0, 255);
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options);
  test::assert_equal<std::uint32_t>(pixel(m.image, 300, 10), test::packed(mapnik::color(255, 0, 255)), "custom colour");
}

void test_deterministic() {
  test::stub_fetcher a, b;
  fetchmap::compose_options narrow;
  narrow.max_outstanding = 1;

  mosaic ma = fetchmap::build_mosaic(zoom_request(small_box, 5), 256, a);
  mosaic mb = fetchmap::build_mosaic(zoom_request(small_box, 5), 256, b, narrow);
  test::assert_equal<bool>(same_image(ma.image, mb.image), true, "identical images");

  // and requested in plan order.
  std::vector<tile_index> requested = b.requested();
  test::assert_equal<std::size_t>(requested.size(), mb.plan.tiles.size(), "all requested");
  for (std::size_t i = 0; i < requested.size(); ++i) {
    test::assert_equal<tile_index>(requested[i], mb.plan.tiles[i].index, "plan order");
  }
}

void test_corrupt_tile() {
  test::stub_fetcher stub;
  stub.corrupt(tile_index(4, 4, 5));

  fetchmap::compose_options options;
  options.source_id = "stub";
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options);

  test::assert_equal<std::size_t>(m.failures.size(), 1, "one failure");
  test::assert_equal<fetchmap::fetch_status>(m.failures[0].status, fetchmap::fetch_status::bad_data, "bad data");
  test::assert_equal<std::string>(m.failures[0].source, "stub", "source");
  test::assert_equal<std::uint32_t>(pixel(m.image, 300, 300), test::packed(options.placeholder), "slot left alone");
}

void test_small_tiles() {
  // 128 pixel tiles in 256 pixel slots fill only the top-left quarter.
  test::stub_fetcher stub(128);
  fetchmap::compose_options options;
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options);

  test::assert_equal<std::uint32_t>(pixel(m.image, 10, 10), test::packed(test::tile_colour(tile_index(4, 3, 4))), "tile");
  test::assert_equal<std::uint32_t>(pixel(m.image, 200, 200), test::packed(options.placeholder), "rest of slot");
}

void test_large_tiles_clipped() {
  // 512 pixel tiles in 256 pixel slots don't spill into neighbours.
  test::stub_fetcher stub(512);
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub);
  assert_tiles_painted(m, std::set<tile_index>(), 0);
}

void test_paste_clips() {
  mapnik::image_rgba8 dst(512, 512), src(300, 300);
  mapnik::fill(dst, mapnik::color(0, 0, 0));
  mapnik::fill(src, mapnik::color(10, 200, 30));

  fetchmap::paste(dst, src, 400, 400, 256, 256);
  test::assert_equal<std::uint32_t>(pixel(dst, 511, 511), test::packed(mapnik::color(10, 200, 30)), "inside");
  test::assert_equal<std::uint32_t>(pixel(dst, 399, 450), test::packed(mapnik::color(0, 0, 0)), "left of paste");

  // entirely outside is a no-op.
  fetchmap::paste(dst, src, 600, 0, 256, 256);
  test::assert_equal<std::uint32_t>(pixel(dst, 0, 0), test::packed(mapnik::color(0, 0, 0)), "untouched");
}

void test_decode_errors() {
  test::assert_throws<std::runtime_error>([]() { fetchmap::decode_tile(""); }, "empty");
  test::assert_throws<std::exception>([]() { fetchmap::decode_tile("GIF89a but not really"); }, "garbage");
}

// cancels the token after a number of fetches.
struct cancelling_fetcher : public fetchmap::fetcher {
  cancelling_fetcher(fetchmap::cancel_token &token, std::size_t after)
    : m_token(token), m_after(after) {}

  std::future<fetchmap::fetch_response> operator()(const tile_index &idx) {
    if (m_stub.calls() + 1 >= m_after) { m_token.cancel(); }
    return m_stub(idx);
  }

  test::stub_fetcher m_stub;
  fetchmap::cancel_token &m_token;
  const std::size_t m_after;
};

void test_cancel() {
  fetchmap::cancel_token token;
  cancelling_fetcher fetch(token, 3);

  fetchmap::compose_options options;
  options.cancel = &token;
  options.max_outstanding = 1;

  test::assert_throws<fetchmap::cancelled_error>([&]() {
      fetchmap::build_mosaic(zoom_request(small_box, 6), 256, fetch, options); }, "cancelled");
  test::assert_equal<std::size_t>(fetch.m_stub.calls(), 3, "stopped fetching");
}

void test_cancel_before_start() {
  fetchmap::cancel_token token;
  token.cancel();
  test::stub_fetcher stub;

  fetchmap::compose_options options;
  options.cancel = &token;
  test::assert_throws<fetchmap::cancelled_error>([&]() {
      fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub, options); }, "cancelled");
  test::assert_equal<std::size_t>(stub.calls(), 0, "nothing fetched");
}

void test_cached_rerun() {
  test::temp_dir tmp;
  std::shared_ptr<fetchmap::tile_cache> cache = std::make_shared<fetchmap::tile_cache>(tmp.path());
  const fetchmap::map_request req = zoom_request(small_box, 4);

  test::stub_fetcher *first_stub = new test::stub_fetcher;
  fetchmap::fetch::caching first(std::unique_ptr<fetchmap::fetcher>(first_stub), "stub", cache);
  mosaic m1 = fetchmap::build_mosaic(req, 256, first);
  test::assert_equal<std::size_t>(first_stub->calls(), 4, "first run fetches");

  test::stub_fetcher *second_stub = new test::stub_fetcher;
  fetchmap::fetch::caching second(std::unique_ptr<fetchmap::fetcher>(second_stub), "stub", cache);
  mosaic m2 = fetchmap::build_mosaic(req, 256, second);
  test::assert_equal<std::size_t>(second_stub->calls(), 0, "second run is all cache");
  test::assert_equal<std::size_t>(second.stats().cache_hits, 4, "cache hits");

  test::assert_equal<bool>(same_image(m1.image, m2.image), true, "identical output");
  test::assert_equal<std::string>(mapnik::save_to_string(m1.image, "png"), mapnik::save_to_string(m2.image, "png"),
                                  "identical encoding");
}

void test_dry_run_placeholders() {
  test::temp_dir tmp;
  test::stub_fetcher *stub = new test::stub_fetcher;
  fetchmap::fetch::caching fetch(std::unique_ptr<fetchmap::fetcher>(stub), "stub",
                                 std::make_shared<fetchmap::tile_cache>(tmp.path()), true);

  fetchmap::compose_options options;
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, fetch, options);
  test::assert_equal<std::size_t>(stub->calls(), 0, "nothing fetched");
  test::assert_equal<std::size_t>(m.placeholders, 4, "all placeholders");
  test::assert_equal<bool>(m.failures.empty(), true, "placeholders aren't failures");
  test::assert_equal<bool>(m.complete(), false, "not complete");
  test::assert_equal<std::uint32_t>(pixel(m.image, 256, 256), test::packed(options.placeholder), "placeholder colour");
}

void test_transform_matches_plan() {
  test::stub_fetcher stub;
  mosaic m = fetchmap::build_mosaic(zoom_request(small_box, 4), 256, stub);
  test::assert_equal<int>(m.transform.origin_tile_x(), 3, "origin x");
  test::assert_equal<int>(m.transform.origin_tile_y(), 4, "origin y");

  fetchmap::pixel_point nw = m.transform.forward(small_box.west, small_box.north);
  test::assert_near(nw.x, m.plan.requested.min_x, 1e-9, "north-west x");
  test::assert_near(nw.y, m.plan.requested.min_y, 1e-9, "north-west y");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing mosaic composition ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }
  RUN_TEST(test_layout);
  RUN_TEST(test_layout_needs_page_or_zoom);
  RUN_TEST(test_layout_rejects_before_fetching);
  RUN_TEST(test_compose_all);
  RUN_TEST(test_partial_failure);
  RUN_TEST(test_colour_adjustment);
  RUN_TEST(test_placeholder_colour);
  RUN_TEST(test_deterministic);
  RUN_TEST(test_corrupt_tile);
  RUN_TEST(test_small_tiles);
  RUN_TEST(test_large_tiles_clipped);
  RUN_TEST(test_paste_clips);
  RUN_TEST(test_decode_errors);
  RUN_TEST(test_cancel);
  RUN_TEST(test_cancel_before_start);
  RUN_TEST(test_cached_rerun);
  RUN_TEST(test_dry_run_placeholders);
  RUN_TEST(test_transform_matches_plan);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
