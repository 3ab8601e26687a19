#ifndef FETCHMAP_MOSAIC_HPP
#define FETCHMAP_MOSAIC_HPP

#include "fetcher.hpp"
#include "map_style.hpp"
#include "tile_grid.hpp"
#include "transform.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include <mapnik/color.hpp>
#include <mapnik/image.hpp>

namespace fetchmap {

/* Flag which can be set from another thread (or a signal
 * handler) to abandon a mosaic between tile fetches.
 */
class cancel_token {
public:
  cancel_token() : m_cancelled(false) {}

  inline void cancel() { m_cancelled.store(true); }
  inline bool cancelled() const { return m_cancelled.load(); }

private:
  std::atomic<bool> m_cancelled;
};

struct compose_options {
  compose_options();

  // painted into slots whose tile could not be fetched or decoded.
  mapnik::color placeholder;
  // checked between tile fetches. may be null.
  const cancel_token *cancel;
  // number of fetches in flight at once. the fetcher may limit
  // this further.
  std::size_t max_outstanding;
  // reported in failures of tiles which arrived but didn't decode.
  std::string source_id;
  // applied to the whole canvas once every tile is painted.
  boost::optional<colour_adjustment> adjust;
};

/* Result of composing a mosaic plan. The transform is the one
 * overlays must use to draw onto the image.
 */
struct mosaic {
  explicit mosaic(const mosaic_plan &plan_);

  // true if every tile was painted from real tile data.
  inline bool complete() const { return failures.empty() && (placeholders == 0); }

  const mosaic_plan plan;
  mapnik::image_rgba8 image;
  const geo_pixel_transform transform;
  // tiles which failed to fetch or decode, in plan order.
  std::vector<fetch_error> failures;
  // slots filled with the placeholder colour on purpose (dry run).
  std::size_t placeholders;
};

/* Fetch every tile in the plan and paste it at its planned offset
 * on a canvas of the planned size. Tiles which fail are reported
 * in the failures list and their slot keeps the placeholder
 * colour.
 *
 * Tiles larger than the planned tile size are clipped to their
 * slot, smaller ones leave the rest of the slot as placeholder.
 *
 * If the cancel token is set, waits for fetches already started
 * and then throws cancelled_error.
 */
mosaic compose(const mosaic_plan &plan, fetcher &fetch,
               const compose_options &options = compose_options());

// decode tile bytes into an image, throwing std::runtime_error
// if they aren't in a format mapnik can read.
mapnik::image_rgba8 decode_tile(const std::string &bytes);

// copy src onto dst with its top-left corner at (x, y), clipped to
// the given width and height and to dst.
void paste(mapnik::image_rgba8 &dst, const mapnik::image_rgba8 &src,
           unsigned int x, unsigned int y, unsigned int width, unsigned int height);

} // namespace fetchmap

#endif /* FETCHMAP_MOSAIC_HPP */
