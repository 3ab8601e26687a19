#ifndef FETCHMAP_OPTIONS_HPP
#define FETCHMAP_OPTIONS_HPP

#include <cstddef>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/property_tree/ptree.hpp>

namespace fetchmap {

/* Settings for the fetch side of the tool, which can come from a
 * JSON configuration file and be overridden on the command line.
 */
struct fetch_options {
  fetch_options();

  /* Overwrite settings with those present in the tree. Recognised
   * keys are:
   *
   *   cache_dir   (string, "~/" is expanded)
   *   concurrency (integer > 0)
   *   timeout_ms  (integer > 0)
   *   user_agent  (string)
   *   max_zoom    (integer in 0..30)
   *   logging     (subtree, see logging::log::configure)
   *
   * Throws invalid_request_error for out of range values and
   * boost::property_tree::ptree_error for values of the wrong type.
   */
  void load(const boost::property_tree::ptree &config);

  boost::filesystem::path cache_dir;
  std::size_t concurrency;
  long timeout_ms;
  std::string user_agent;
  int max_zoom;
  bool dry_run;
  // passed through to logging::log::configure, if not empty.
  boost::property_tree::ptree logging;
};

// read and apply a JSON configuration file.
void read_options_file(const boost::filesystem::path &file, fetch_options &opts);

// replace a leading "~" with $HOME.
boost::filesystem::path expand_user(const std::string &path);

// ~/.cache/fetchmap, or $XDG_CACHE_HOME/fetchmap if that is set.
boost::filesystem::path default_cache_dir();

} // namespace fetchmap

#endif /* FETCHMAP_OPTIONS_HPP */
