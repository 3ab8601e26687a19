#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/format.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <curl/curl.h>

#include "fetchmap.hpp"
#include "errors.hpp"
#include "fetcher_io.hpp"
#include "overlay/gpx.hpp"
#include "logging/logger.hpp"
#include "config.h"

namespace bpo = boost::program_options;
namespace pt = boost::property_tree;

namespace {

fetchmap::cancel_token g_cancel;

extern "C" void handle_interrupt(int) {
  g_cancel.cancel();
}

// curl_global_init must be paired with a cleanup, once all
// handles are gone.
struct curl_global {
  curl_global() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
      throw std::runtime_error((boost::format("Unable to initialise cURL: %1%") % curl_easy_strerror(res)).str());
    }
  }
  ~curl_global() { curl_global_cleanup(); }
};

std::string output_name(const std::string &pattern, const std::string &source_id) {
  boost::format fmt(pattern);
  // the pattern doesn't have to mention the source.
  fmt.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit);
  return (fmt % source_id).str();
}

fetchmap::tile_source select_source(const std::string &name) {
  boost::optional<fetchmap::provider> p = fetchmap::provider_from_name(name);
  if (!p) {
    throw fetchmap::invalid_request_error((boost::format("Unknown tile source \"%1%\", expected one of: %2%")
                                          % name % boost::algorithm::join(fetchmap::provider_names(), ", ")).str());
  }
  return fetchmap::named_source(*p);
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  std::string paper, output, tile_source_name, tile_server, config_file, cache_dir;
  unsigned int dpi = 0, margin = 0, concurrency = 0, max_zoom = 0;
  long timeout_ms = 0;
  int zoom = 0;
  std::vector<std::string> gpx_files;

  bpo::options_description options(
    "fetchmap " VERSION "\n"
    "\n"
    "  Usage: fetchmap [options] <west> <south> <east> <north>\n"
    "\n"
    "Builds a printable map of the bounding box from map tiles, picking the "
    "highest zoom level at which the box fits on the page. Tiles are cached "
    "locally, so running again for the same area doesn't download anything. "
    "GPX tracks and waypoints can be drawn on top."
    "\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("papersize,P", bpo::value<std::string>(&paper)->default_value("A4"),
     "Paper format, A0 to A7.")
    ("landscape,l", "Use landscape orientation.")
    ("portrait,p", "Use portrait orientation. Without either option, the "
     "orientation giving the larger zoom level is used.")
    ("dpi,d", bpo::value<unsigned int>(&dpi)->default_value(300),
     "Printer resolution in dots per inch.")
    ("margin,m", bpo::value<unsigned int>(&margin)->default_value(5),
     "Unprintable margin of the paper in mm.")
    ("zoom,z", bpo::value<int>(&zoom),
     "Use this zoom level instead of fitting the map to the paper.")
    ("dryrun,D", "Don't download anything or write the map. Tiles not in the "
     "cache are shown as placeholders.")
    ("tilesource,s", bpo::value<std::string>(&tile_source_name)->default_value(fetchmap::provider_name(fetchmap::default_provider)),
     "Named tile source, see the list below.")
    ("tileserver,t", bpo::value<std::string>(&tile_server),
     "URL template of a tile server, with {z}, {x} and {y} placeholders. "
     "Overrides --tilesource.")
    ("gpx,g", bpo::value<std::vector<std::string> >(&gpx_files)->composing(),
     "GPX file to draw, as [(trk|wpt|any),]file.gpx. May be given more than once.")
    ("out,o", bpo::value<std::string>(&output)->default_value("mapfile-%1%.jpg"),
     "Output file. %1% is replaced by the tile source name.")
    ("cache-dir", bpo::value<std::string>(&cache_dir),
     "Directory for cached tiles.")
    ("concurrency", bpo::value<unsigned int>(&concurrency),
     "Maximum number of tile downloads at once.")
    ("timeout", bpo::value<long>(&timeout_ms),
     "Time limit in milliseconds for each tile download.")
    ("max-zoom", bpo::value<unsigned int>(&max_zoom),
     "Highest zoom level to consider when fitting the map to the paper.")
    ("config-file,c", bpo::value<std::string>(&config_file),
     "JSON config file with fetch and logging settings.")
    ;

  bpo::variables_map vm;
  std::vector<std::string> free_args;

  try {
    // coordinates are collected as unrecognised tokens, as negative
    // numbers would otherwise be taken for short options.
    bpo::parsed_options parsed = bpo::command_line_parser(argc, argv)
      .options(options)
      .allow_unregistered()
      .run();
    bpo::store(parsed, vm);
    bpo::notify(vm);
    free_args = bpo::collect_unrecognized(parsed.options, bpo::include_positional);

  } catch (std::exception &e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "If this looks like a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n"
              << "Tile sources: " << boost::algorithm::join(fetchmap::provider_names(), ", ") << "\n"
              << "Paper formats: " << boost::algorithm::join(fetchmap::paper_formats(), ", ") << "\n";
    return EXIT_SUCCESS;
  }

  // argument checking and verification
  if (free_args.size() != 4) {
    std::cerr << "Expected exactly four coordinates <west> <south> <east> <north>, but got "
              << free_args.size() << " free arguments";
    if (!free_args.empty()) {
      std::cerr << ": " << boost::algorithm::join(free_args, " ");
    }
    std::cerr << "\n\n" << options << "\n";
    return EXIT_FAILURE;
  }

  double coords[4];
  for (int i = 0; i < 4; ++i) {
    try {
      coords[i] = boost::lexical_cast<double>(free_args[i]);
    } catch (const boost::bad_lexical_cast &) {
      std::cerr << "The argument \"" << free_args[i] << "\" is not a coordinate, "
                << "or is an unknown option.\n";
      return EXIT_FAILURE;
    }
  }

  if (vm.count("landscape") && vm.count("portrait")) {
    std::cerr << "Only one of --landscape and --portrait may be given.\n";
    return EXIT_FAILURE;
  }

  fetchmap::fetch_options fetch_opts;

  if (vm.count("config-file")) {
    try {
      fetchmap::read_options_file(config_file, fetch_opts);

    } catch (pt::ptree_error const& e) {
      std::cerr << "Error while parsing config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;

    } catch (std::exception const& e) {
      std::cerr << "Error while loading config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  }

  // command line wins over the config file.
  if (vm.count("cache-dir"))   { fetch_opts.cache_dir = fetchmap::expand_user(cache_dir); }
  if (vm.count("concurrency")) { fetch_opts.concurrency = concurrency; }
  if (vm.count("timeout"))     { fetch_opts.timeout_ms = timeout_ms; }
  if (vm.count("max-zoom"))    { fetch_opts.max_zoom = int(max_zoom); }
  fetch_opts.dry_run = (vm.count("dryrun") > 0);

  try {
    if (!fetch_opts.logging.empty()) {
      logging::log::configure(fetch_opts.logging);
    }

    if ((fetch_opts.concurrency == 0) || (fetch_opts.timeout_ms <= 0)) {
      throw fetchmap::invalid_request_error("Concurrency and timeout must both be positive.");
    }

    const fetchmap::tile_source source = vm.count("tileserver")
      ? fetchmap::custom_source(tile_server)
      : select_source(tile_source_name);

    fetchmap::map_request request;
    request.bbox = fetchmap::geo_bbox(coords[0], coords[1], coords[2], coords[3]);
    if (vm.count("zoom")) { request.zoom = zoom; }
    request.page = fetchmap::paper_size_px(paper, false, dpi, margin);
    request.orient = vm.count("landscape") ? fetchmap::orientation::landscape
      : (vm.count("portrait") ? fetchmap::orientation::portrait : fetchmap::orientation::automatic);
    request.max_zoom = fetch_opts.max_zoom;

    // load overlays up front, so a bad file doesn't waste a download.
    std::vector<std::shared_ptr<fetchmap::overlay> > overlays;
    for (const auto &arg : gpx_files) {
      fetchmap::overlays::gpx_argument gpx = fetchmap::overlays::parse_gpx_argument(arg);
      boost::filesystem::path file = fetchmap::expand_user(gpx.file);
      if (!boost::filesystem::exists(file)) {
        LOG_WARNING(boost::format("GPX file %1% does not exist, ignored.") % file);
        continue;
      }
      overlays.push_back(std::make_shared<fetchmap::overlays::gpx_overlay>(
                           fetchmap::overlays::read_gpx(file), gpx.features, source.style));
    }

    curl_global curl;
    std::signal(SIGINT, handle_interrupt);

    std::unique_ptr<fetchmap::fetch::caching> fetcher = fetchmap::make_fetcher(source, fetch_opts);

    fetchmap::compose_options compose_opts;
    compose_opts.cancel = &g_cancel;
    compose_opts.max_outstanding = fetch_opts.concurrency * 4;
    compose_opts.source_id = source.id;
    compose_opts.adjust = source.style.adjust;

    fetchmap::mosaic m = fetchmap::build_mosaic(request, source.tile_size, *fetcher, compose_opts);
    fetchmap::render_overlays(m, overlays);

    const fetchmap::fetch::caching_stats stats = fetcher->stats();
    std::cout << "Size of graphics: " << m.plan.width << "x" << m.plan.height
              << " at zoom " << m.transform.zoom() << "\n"
              << "Tiles: " << m.plan.tiles.size() << " (" << stats.cache_hits << " cached, "
              << stats.network_requests << " downloaded, " << stats.placeholders << " skipped)\n";
    if (!source.attribution.empty()) {
      std::cout << "Map data: " << source.attribution << "\n";
    }

    if (!m.failures.empty()) {
      std::cerr << m.failures.size() << " tile(s) could not be fetched:\n";
      for (const auto &err : m.failures) {
        std::cerr << "  " << err << "\n";
      }
    }

    if (!fetch_opts.dry_run) {
      fetchmap::save_mosaic(m, output_name(output, source.id));
    }

  } catch (const fetchmap::cancelled_error &e) {
    std::cerr << "Interrupted: " << e.what() << "\n";
    return EXIT_FAILURE;

  } catch (const fetchmap::error &e) {
    std::cerr << "Unable to make map: " << e.what() << "\n";
    return EXIT_FAILURE;

  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
