#ifndef FETCHMAP_ERRORS_HPP
#define FETCHMAP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace fetchmap {

/* Base for errors which abort a whole map request. Failures of
 * individual tiles are not exceptions; see fetch_error in
 * fetcher.hpp.
 */
struct error : public std::runtime_error {
  explicit error(const std::string &msg) : std::runtime_error(msg) {}
};

// geographic input outside the range the projection can represent.
struct out_of_range_error : public error {
  explicit out_of_range_error(const std::string &msg) : error(msg) {}
};

// the region needs wraparound handling which isn't implemented,
// e.g: a bounding box crossing the antimeridian.
struct unsupported_region_error : public error {
  explicit unsupported_region_error(const std::string &msg) : error(msg) {}
};

// malformed request parameters: inverted boxes, negative zoom
// levels, unknown paper formats, bad URL templates and so on.
struct invalid_request_error : public error {
  explicit invalid_request_error(const std::string &msg) : error(msg) {}
};

// the local tile cache could not be read or written. callers
// are expected to recover by going to the network instead.
struct cache_error : public error {
  explicit cache_error(const std::string &msg) : error(msg) {}
};

// the mosaic was abandoned before all tiles were painted.
struct cancelled_error : public error {
  explicit cancelled_error(const std::string &msg) : error(msg) {}
};

} // namespace fetchmap

#endif /* FETCHMAP_ERRORS_HPP */
