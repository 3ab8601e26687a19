#include "tile_cache.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/system/error_code.hpp>

#include <iterator>

namespace bfs = boost::filesystem;

namespace fetchmap {

namespace {

void check_key(const std::string &source_id, const tile_index &idx) {
  if (source_id.empty() || (source_id.find('/') != std::string::npos) ||
      (source_id == ".") || (source_id == "..")) {
    throw cache_error((boost::format("Source id \"%1%\" cannot be used as a cache directory.") % source_id).str());
  }
  if (!is_valid(idx)) {
    throw cache_error((boost::format("Tile %1%/%2%/%3% is outside the tile pyramid.")
                       % idx.z % idx.x % idx.y).str());
  }
}

} // anonymous namespace

tile_cache::tile_cache(const bfs::path &root)
  : m_root(root) {
}

bfs::path tile_cache::path_for(const std::string &source_id, const tile_index &idx) const {
  check_key(source_id, idx);
  return m_root / source_id / std::to_string(idx.z) / std::to_string(idx.x)
    / (boost::format("%1%.png") % idx.y).str();
}

boost::optional<std::string> tile_cache::lookup(const std::string &source_id, const tile_index &idx) const {
  const bfs::path file = path_for(source_id, idx);

  boost::system::error_code ec;
  if (!bfs::is_regular_file(file, ec)) {
    return boost::none;
  }

  bfs::ifstream in(file, std::ios::in | std::ios::binary);
  if (!in) {
    throw cache_error((boost::format("Unable to open cached tile %1% for reading.") % file).str());
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw cache_error((boost::format("Error reading cached tile %1%.") % file).str());
  }

  LOG_FINER(boost::format("Read %1% bytes from %2%") % bytes.size() % file);
  return bytes;
}

bool tile_cache::store(const std::string &source_id, const tile_index &idx, const std::string &bytes) const {
  const bfs::path file = path_for(source_id, idx);
  const bfs::path dir = file.parent_path();

  boost::system::error_code ec;
  if (bfs::exists(file, ec)) {
    return false;
  }

  bfs::create_directories(dir, ec);
  if (ec) {
    throw cache_error((boost::format("Unable to create cache directory %1%: %2%") % dir % ec.message()).str());
  }

  // the temporary lives in the same directory so the link below
  // doesn't cross filesystems.
  const bfs::path temp = dir / bfs::unique_path(".%%%%-%%%%-%%%%-%%%%.tmp", ec);
  if (ec) {
    throw cache_error((boost::format("Unable to pick temporary name in %1%: %2%") % dir % ec.message()).str());
  }

  {
    bfs::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      throw cache_error((boost::format("Unable to open %1% for writing.") % temp).str());
    }
    out.write(bytes.data(), bytes.size());
    out.close();
    if (!out) {
      bfs::remove(temp, ec);
      throw cache_error((boost::format("Error writing tile to %1%.") % temp).str());
    }
  }

  // linking fails if the entry exists, where a rename would
  // replace it. the first writer's tile stays.
  bfs::create_hard_link(temp, file, ec);
  boost::system::error_code ignored;
  bfs::remove(temp, ignored);

  if (ec == boost::system::errc::file_exists) {
    LOG_FINER(boost::format("Tile at %1% was stored by another writer") % file);
    return false;

  } else if (ec) {
    throw cache_error((boost::format("Unable to move tile into place at %1%: %2%") % file % ec.message()).str());
  }

  LOG_FINER(boost::format("Stored %1% bytes at %2%") % bytes.size() % file);
  return true;
}

} // namespace fetchmap
