#ifndef FETCHMAP_FETCHER_HPP
#define FETCHMAP_FETCHER_HPP

#include "geo.hpp"
#include "either.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace fetchmap {

/* Status codes for failed fetches. Because they're an easy
 * short-hand, we model them on HTTP status codes. This means it
 * should be pretty easy to figure out at a glance what the status
 * is when debugging.
 */
enum class fetch_status : std::uint16_t {
  /* the request was malformed in some way, e.g: x or y out of
   * range for the given z. */
  bad_request = 400,
  /* requested tile could not be found, possibly it does not exist. */
  not_found = 404,
  /* no complete response arrived within the timeout. */
  timeout = 408,
  /* the tile arrived, but the bytes could not be decoded as an
   * image. */
  bad_data = 422,
  /* an unspecified and unexpected kind of error occurred. it may, or
   * may not, be temporary. */
  server_error = 500,
  /* something along the way didn't implement something that was
   * required to complete the request. */
  not_implemented = 501,
  /* the fetcher was shut down before the request completed. */
  unavailable = 503,
};

/* Describes why a single tile could not be fetched. These are
 * collected into the partial-failure report of a mosaic rather
 * than aborting it.
 */
struct fetch_error {
  fetch_error();
  fetch_error(fetch_status status_, const std::string &source_,
              const tile_index &index_, const std::string &cause_);

  fetch_status status;
  // id of the tile source the request went to.
  std::string source;
  tile_index index;
  // human-readable detail, e.g: the cURL error message.
  std::string cause;
};

/* Tile contents exactly as served by the tile source, usually a
 * compressed raster image. Never modified once created.
 */
struct tile_data {
  tile_data(const tile_index &index_, std::string &&bytes_);

  // a stand-in with no bytes, for when the real tile was not
  // fetched on purpose (dry run).
  static std::shared_ptr<const tile_data> placeholder(const tile_index &index);

  const tile_index index;
  const std::string bytes;
  const bool is_placeholder;

private:
  explicit tile_data(const tile_index &index_);
};

typedef std::shared_ptr<const tile_data> tile_ptr;

typedef either<tile_ptr, fetch_error> fetch_response;

/* Interface for objects which fetch tiles from a source. Each
 * fetcher is bound to a single tile source.
 *
 * Implementations must accept calls from several threads and
 * must outlive any future they return.
 */
struct fetcher {
  virtual ~fetcher();

  // fetches a tile from the source, returning either the tile's
  // bytes or an error.
  virtual std::future<fetch_response> operator()(const tile_index &idx) = 0;
};

// a future which is already satisfied with the response.
std::future<fetch_response> make_ready_response(fetch_response &&response);

} // namespace fetchmap

#endif /* FETCHMAP_FETCHER_HPP */
