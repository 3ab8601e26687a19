#ifndef FETCHMAP_TILE_CACHE_HPP
#define FETCHMAP_TILE_CACHE_HPP

#include "geo.hpp"

#include <string>
#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

namespace fetchmap {

/* Persistent store of tile bytes on the local filesystem, laid
 * out as <root>/<source-id>/<z>/<x>/<y>.png.
 *
 * Entries are written to a temporary file and hard linked into
 * place, so a reader never sees a partly written tile. The link
 * fails if the entry already exists, so when several threads or
 * processes store the same key at once exactly one of them wins
 * and the entry is never overwritten. The cache directory must
 * be on a filesystem with hard links. There is no expiry or
 * eviction.
 *
 * I/O problems are reported by throwing cache_error.
 */
class tile_cache {
public:
  explicit tile_cache(const boost::filesystem::path &root);

  // where the entry for the key lives, whether or not it exists.
  boost::filesystem::path path_for(const std::string &source_id, const tile_index &idx) const;

  // the stored bytes, or boost::none if there is no entry.
  boost::optional<std::string> lookup(const std::string &source_id, const tile_index &idx) const;

  // store the bytes. returns false, and leaves the existing entry
  // alone, if the key was already present or another writer
  // stored it first. safe to call concurrently.
  bool store(const std::string &source_id, const tile_index &idx, const std::string &bytes) const;

  inline const boost::filesystem::path &root() const { return m_root; }

private:
  const boost::filesystem::path m_root;
};

} // namespace fetchmap

#endif /* FETCHMAP_TILE_CACHE_HPP */
