#include "fetch/caching.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

#include <exception>
#include <map>
#include <mutex>

namespace fetchmap { namespace fetch {

struct caching::impl : public std::enable_shared_from_this<caching::impl> {
  impl(std::unique_ptr<fetcher> &&upstream, const std::string &source_id,
       std::shared_ptr<tile_cache> cache, bool dry_run)
    : m_upstream(std::move(upstream))
    , m_source_id(source_id)
    , m_cache(cache)
    , m_dry_run(dry_run) {
    if (!m_upstream) {
      throw invalid_request_error("Caching fetcher needs an upstream fetcher.");
    }
  }

  boost::optional<std::string> try_lookup(const tile_index &idx);
  void try_store(const tile_index &idx, const std::string &bytes);
  void finished(const tile_index &idx);
  std::shared_future<fetch_response> resolve(const tile_index &idx, bool &in_flight);

  std::unique_ptr<fetcher> m_upstream;
  const std::string m_source_id;
  std::shared_ptr<tile_cache> m_cache;
  const bool m_dry_run;

  // tiles being resolved. the outer future is ready once the
  // cache has been checked, the inner one once the tile is
  // available. only the outer is needed to wait for a tile.
  mutable std::mutex m_mutex;
  std::map<tile_index, std::shared_future<std::shared_future<fetch_response> > > m_in_flight;
  caching_stats m_stats;
};

namespace {

std::future<fetch_response> follow(std::shared_future<std::shared_future<fetch_response> > pending) {
  return std::async(std::launch::deferred, [pending]() -> fetch_response { return pending.get().get(); });
}

std::shared_future<fetch_response> ready(const fetch_response &resp) {
  return make_ready_response(fetch_response(resp)).share();
}

} // anonymous namespace

boost::optional<std::string> caching::impl::try_lookup(const tile_index &idx) {
  if (!m_cache) { return boost::none; }

  try {
    return m_cache->lookup(m_source_id, idx);

  } catch (const cache_error &e) {
    LOG_WARNING(boost::format("Cache lookup for %1% %2% failed, fetching instead: %3%")
                % m_source_id % idx % e.what());
  }
  return boost::none;
}

void caching::impl::try_store(const tile_index &idx, const std::string &bytes) {
  if (!m_cache) { return; }

  try {
    m_cache->store(m_source_id, idx, bytes);

  } catch (const cache_error &e) {
    LOG_WARNING(boost::format("Unable to cache %1% %2%: %3%") % m_source_id % idx % e.what());
  }
}

void caching::impl::finished(const tile_index &idx) {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_in_flight.erase(idx);
}

/* Checks the cache and, on a miss, goes upstream. Called without
 * the lock held. Sets in_flight if the tile stays claimed until
 * the upstream response is consumed.
 */
std::shared_future<fetch_response> caching::impl::resolve(const tile_index &idx, bool &in_flight) {
  in_flight = false;

  boost::optional<std::string> cached = try_lookup(idx);
  if (cached) {
    { std::unique_lock<std::mutex> lock(m_mutex); ++m_stats.cache_hits; }
    LOG_DEBUG(boost::format("Cache hit for %1% %2%") % m_source_id % idx);
    tile_ptr tile(new tile_data(idx, std::move(*cached)));
    return ready(fetch_response(tile));
  }

  if (m_dry_run) {
    { std::unique_lock<std::mutex> lock(m_mutex); ++m_stats.placeholders; }
    LOG_DEBUG(boost::format("Dry run, not fetching %1% %2%") % m_source_id % idx);
    return ready(fetch_response(tile_data::placeholder(idx)));
  }

  { std::unique_lock<std::mutex> lock(m_mutex); ++m_stats.network_requests; }
  LOG_DEBUG(boost::format("Cache miss for %1% %2%") % m_source_id % idx);

  std::shared_ptr<std::future<fetch_response> > upstream(
    new std::future<fetch_response>((*m_upstream)(idx)));
  in_flight = true;

  // the in-flight map holds this function, so it must not hold
  // the impl. if the fetcher is gone, nothing is cached.
  std::weak_ptr<impl> weak_self = shared_from_this();
  return std::async(std::launch::deferred,
    [weak_self, upstream, idx]() -> fetch_response {
      fetch_response resp(upstream->get());
      std::shared_ptr<impl> self = weak_self.lock();
      if (self) {
        if (resp.is_left() && !resp.left()->is_placeholder) {
          self->try_store(idx, resp.left()->bytes);
        }
        self->finished(idx);
      }
      return resp;
    }).share();
}

caching::caching(std::unique_ptr<fetcher> &&upstream, const std::string &source_id,
                 std::shared_ptr<tile_cache> cache, bool dry_run)
  : m_impl(std::make_shared<impl>(std::move(upstream), source_id, cache, dry_run)) {
}

caching::~caching() {
}

std::future<fetch_response> caching::operator()(const tile_index &idx) {
  std::promise<std::shared_future<fetch_response> > resolved;
  {
    std::unique_lock<std::mutex> lock(m_impl->m_mutex);

    auto itr = m_impl->m_in_flight.find(idx);
    if (itr != m_impl->m_in_flight.end()) {
      ++m_impl->m_stats.coalesced;
      return follow(itr->second);
    }

    // claim the tile, so that requests for it which arrive while
    // the cache is read wait for this one instead of going
    // upstream themselves.
    m_impl->m_in_flight.insert(std::make_pair(idx, resolved.get_future().share()));
  }

  std::shared_future<fetch_response> result;
  bool in_flight = false;
  try {
    result = m_impl->resolve(idx, in_flight);

  } catch (...) {
    resolved.set_exception(std::current_exception());
    m_impl->finished(idx);
    throw;
  }

  resolved.set_value(result);
  if (!in_flight) {
    m_impl->finished(idx);
  }

  return std::async(std::launch::deferred, [result]() -> fetch_response { return result.get(); });
}

caching_stats caching::stats() const {
  std::unique_lock<std::mutex> lock(m_impl->m_mutex);
  return m_impl->m_stats;
}

} } // namespace fetchmap::fetch
