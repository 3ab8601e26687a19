#ifndef FETCHMAP_FETCHER_IO_HPP
#define FETCHMAP_FETCHER_IO_HPP

#include "fetcher.hpp"

#include <ostream>

namespace fetchmap {

std::ostream &operator<<(std::ostream &out, fetch_status status);

// e.g: "wikimedia 4/3/5: Not Found (HTTP 404)"
std::ostream &operator<<(std::ostream &out, const fetch_error &err);

} // namespace fetchmap

#endif /* FETCHMAP_FETCHER_IO_HPP */
