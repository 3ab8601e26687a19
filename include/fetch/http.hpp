#ifndef FETCHMAP_FETCH_HTTP_HPP
#define FETCHMAP_FETCH_HTTP_HPP

#include "fetcher.hpp"
#include "tile_source.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace fetchmap { namespace fetch {

struct http_options {
  http_options();

  // limit on the whole transfer, after which the tile fails with
  // fetch_status::timeout.
  long timeout_ms;
  long connect_timeout_ms;
  // maximum number of transfers in flight at once. further
  // requests queue until a slot frees up.
  std::size_t max_concurrent;
  std::string user_agent;
};

/* Fetcher which GETs tiles from the URLs of a tile source. Each
 * request is tried exactly once. All transfers run on a single
 * worker thread using a cURL multi handle.
 *
 * file:// URLs are accepted, which is handy for tiles already on
 * disk and for testing.
 */
struct http : public fetcher {
  explicit http(const tile_source &source,
                const http_options &options = http_options());

  virtual ~http();

  std::future<fetch_response> operator()(const tile_index &idx);

  // number of requests handed to the transfer thread so far.
  std::size_t requests_issued() const;

private:
  struct impl;
  std::unique_ptr<impl> m_impl;
};

} } // namespace fetchmap::fetch

#endif /* FETCHMAP_FETCH_HTTP_HPP */
