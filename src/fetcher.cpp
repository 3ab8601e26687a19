#include "fetcher.hpp"

namespace fetchmap {

fetch_error::fetch_error()
  : status(fetch_status::server_error) {
}

fetch_error::fetch_error(fetch_status status_, const std::string &source_,
                         const tile_index &index_, const std::string &cause_)
  : status(status_), source(source_), index(index_), cause(cause_) {
}

tile_data::tile_data(const tile_index &index_, std::string &&bytes_)
  : index(index_), bytes(std::move(bytes_)), is_placeholder(false) {
}

tile_data::tile_data(const tile_index &index_)
  : index(index_), bytes(), is_placeholder(true) {
}

tile_ptr tile_data::placeholder(const tile_index &index) {
  return tile_ptr(new tile_data(index));
}

fetcher::~fetcher() {
}

std::future<fetch_response> make_ready_response(fetch_response &&response) {
  std::promise<fetch_response> promise;
  promise.set_value(std::move(response));
  return promise.get_future();
}

} // namespace fetchmap
