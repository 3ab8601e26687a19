#ifndef FETCHMAP_FETCH_CACHING_HPP
#define FETCHMAP_FETCH_CACHING_HPP

#include "fetcher.hpp"
#include "tile_cache.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace fetchmap { namespace fetch {

struct caching_stats {
  caching_stats() : cache_hits(0), network_requests(0), coalesced(0), placeholders(0) {}

  std::size_t cache_hits;
  // requests passed on to the upstream fetcher.
  std::size_t network_requests;
  // requests which piggy-backed on one already in flight.
  std::size_t coalesced;
  std::size_t placeholders;
};

/* Fetcher which consults a tile cache before going upstream, and
 * stores successful upstream responses in the cache.
 *
 * Concurrent requests for the same tile are coalesced, so that
 * only one upstream request is made and every caller gets the
 * same response. Only requests for the same tile wait for each
 * other. Cache errors are logged and the request falls back to
 * the upstream fetcher.
 *
 * The upstream response is stored when the first future for the
 * tile is waited on. If every future for a tile is dropped, the
 * tile stays in flight, and the next request for it gets the
 * same response.
 *
 * In dry-run mode, tiles missing from the cache are not fetched
 * and a placeholder tile is returned instead.
 */
struct caching : public fetcher {
  caching(std::unique_ptr<fetcher> &&upstream, const std::string &source_id,
          std::shared_ptr<tile_cache> cache, bool dry_run = false);
  virtual ~caching();

  std::future<fetch_response> operator()(const tile_index &idx);

  caching_stats stats() const;

private:
  struct impl;
  std::shared_ptr<impl> m_impl;
};

} } // namespace fetchmap::fetch

#endif /* FETCHMAP_FETCH_CACHING_HPP */
