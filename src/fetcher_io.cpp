#include "fetcher_io.hpp"

namespace fetchmap {

std::ostream &operator<<(std::ostream &out, fetch_status status) {
  switch (status) {
  case fetch_status::bad_request:     out << "Bad Request";     break;
  case fetch_status::not_found:       out << "Not Found";       break;
  case fetch_status::timeout:         out << "Timeout";         break;
  case fetch_status::bad_data:        out << "Bad Data";        break;
  case fetch_status::server_error:    out << "Server Error";    break;
  case fetch_status::not_implemented: out << "Not Implemented"; break;
  case fetch_status::unavailable:     out << "Unavailable";     break;
  default:
    out << "*** Unknown status ***";
  }
  return out;
}

std::ostream &operator<<(std::ostream &out, const fetch_error &err) {
  out << err.source << " " << err.index << ": " << err.status;
  if (!err.cause.empty()) {
    out << " (" << err.cause << ")";
  }
  return out;
}

} // namespace fetchmap
