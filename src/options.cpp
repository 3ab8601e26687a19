#include "options.hpp"
#include "errors.hpp"
#include "projection.hpp"
#include "zoom_selector.hpp"
#include "config.h"

#include <algorithm>
#include <cstdlib>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace pt = boost::property_tree;
namespace bfs = boost::filesystem;

namespace fetchmap {

fetch_options::fetch_options()
  : cache_dir(default_cache_dir())
  , concurrency(4)
  , timeout_ms(30000)
  , user_agent(FETCHMAP_DEFAULT_USER_AGENT)
  , max_zoom(default_max_zoom)
  , dry_run(false)
  , logging() {
}

void fetch_options::load(const pt::ptree &config) {
  boost::optional<std::string> dir = config.get_optional<std::string>("cache_dir");
  if (dir) {
    cache_dir = expand_user(*dir);
  }

  boost::optional<int> conc = config.get_optional<int>("concurrency");
  if (conc) {
    if (*conc <= 0) {
      throw invalid_request_error((boost::format("Concurrency must be positive, got %1%.") % *conc).str());
    }
    concurrency = std::size_t(*conc);
  }

  boost::optional<long> timeout = config.get_optional<long>("timeout_ms");
  if (timeout) {
    if (*timeout <= 0) {
      throw invalid_request_error((boost::format("Timeout must be positive, got %1% ms.") % *timeout).str());
    }
    timeout_ms = *timeout;
  }

  boost::optional<std::string> agent = config.get_optional<std::string>("user_agent");
  if (agent) {
    user_agent = *agent;
  }

  boost::optional<int> zoom = config.get_optional<int>("max_zoom");
  if (zoom) {
    if ((*zoom < 0) || (*zoom > projection::max_zoom_level)) {
      throw invalid_request_error((boost::format("Maximum zoom must be between 0 and %1%, got %2%.")
                                   % projection::max_zoom_level % *zoom).str());
    }
    max_zoom = *zoom;
  }

  boost::optional<const pt::ptree &> log_conf = config.get_child_optional("logging");
  if (log_conf) {
    logging = *log_conf;
  }
}

void read_options_file(const bfs::path &file, fetch_options &opts) {
  pt::ptree config;
  pt::read_json(file.string(), config);
  opts.load(config);
}

bfs::path expand_user(const std::string &path) {
  if (path.empty() || (path[0] != '~')) {
    return bfs::path(path);
  }
  if ((path.size() > 1) && (path[1] != '/')) {
    // ~otheruser isn't supported.
    return bfs::path(path);
  }

  const char *home = std::getenv("HOME");
  if (home == nullptr) {
    throw invalid_request_error((boost::format("Cannot expand \"%1%\": HOME is not set.") % path).str());
  }
  return bfs::path(home) / path.substr(std::min<std::size_t>(path.size(), 2));
}

bfs::path default_cache_dir() {
  const char *xdg = std::getenv("XDG_CACHE_HOME");
  if ((xdg != nullptr) && (xdg[0] != '\0')) {
    return bfs::path(xdg) / "fetchmap";
  }
  const char *home = std::getenv("HOME");
  if (home == nullptr) {
    // nowhere sensible to put it, so use the working directory.
    return bfs::path(".fetchmap-cache");
  }
  return bfs::path(home) / ".cache" / "fetchmap";
}

} // namespace fetchmap
