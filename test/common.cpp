#include "common.hpp"
#include "logging/logger.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <stdexcept>
#include <iomanip>
#include <iostream>
#include <mapnik/image_util.hpp>

using boost::function;
using std::runtime_error;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;
using std::vector;
namespace fs = boost::filesystem;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);

  } catch (...) {
    out << ". Caused by UNKNOWN EXCEPTION";
  }
}

} // anonymous namespace

namespace test {

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;

  } catch (...) {
    cerr << "  [FAIL: Unexpected error]" << endl;
    throw;
  }
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j) : m_type(j.m_type), m_buf(j.m_buf.str()) {}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { m_buf << "\"" << s << "\""; }
void json::quote(int i) { m_buf << i; }
void json::quote(double d) { m_buf << d; }

temp_dir::temp_dir()
   : m_path(fs::temp_directory_path() / fs::unique_path("fetchmap-test-%%%%-%%%%-%%%%-%%%%")) {
   fs::create_directories(m_path);
}

temp_dir::~temp_dir() {
   boost::system::error_code err;

   // catch all errors - we don't want to throw in the destructor
   try {
      // but loop while the path exists and the errors are
      // ignorable.
      while (fs::exists(m_path)) {
         fs::remove_all(m_path, err);

         // for any non-ignorable error, there's not much we can
         // do from the destructor except complain loudly.
         if (err && (err != boost::system::errc::no_such_file_or_directory)) {
            LOG_WARNING(boost::format("Unable to remove temporary "
                                      "directory %1%: %2%")
                        % m_path % err.message());
            break;
         }
      }

   } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Exception caught while trying to remove "
                              "temporary directory %1%: %2%")
                % m_path % e.what());
   }
}

void write_file(const fs::path &file, const std::string &content) {
   fs::create_directories(file.parent_path());
   fs::ofstream out(file, std::ios::out | std::ios::binary | std::ios::trunc);
   out.write(content.data(), content.size());
   if (!out) {
      throw runtime_error((boost::format("Unable to write test file %1%") % file).str());
   }
}

std::string solid_png(unsigned int size, const mapnik::color &c) {
   mapnik::image_rgba8 img(size, size);
   mapnik::fill(img, c);
   return mapnik::save_to_string(img, "png");
}

mapnik::color tile_colour(const fetchmap::tile_index &idx) {
   return mapnik::color((idx.x * 37 + 11) % 256, (idx.y * 59 + 23) % 256, (idx.z * 17 + 5) % 256);
}

stub_fetcher::stub_fetcher(unsigned int tile_size)
   : m_tile_size(tile_size) {
}

stub_fetcher::~stub_fetcher() {
}

std::future<fetchmap::fetch_response> stub_fetcher::operator()(const fetchmap::tile_index &idx) {
   bool failed = false, corrupt = false;
   {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_requested.push_back(idx);
      failed = (m_failures.count(idx) > 0);
      corrupt = (m_corrupt.count(idx) > 0);
   }

   if (failed) {
      return fetchmap::make_ready_response(fetchmap::fetch_response(
         fetchmap::fetch_error(fetchmap::fetch_status::not_found, "stub", idx, "HTTP 404")));
   }

   std::string bytes = corrupt ? std::string("this is not an image") : solid_png(m_tile_size, tile_colour(idx));
   fetchmap::tile_ptr tile(new fetchmap::tile_data(idx, std::move(bytes)));
   return fetchmap::make_ready_response(fetchmap::fetch_response(tile));
}

void stub_fetcher::fail(const fetchmap::tile_index &idx) {
   std::unique_lock<std::mutex> lock(m_mutex);
   m_failures.insert(idx);
}

void stub_fetcher::corrupt(const fetchmap::tile_index &idx) {
   std::unique_lock<std::mutex> lock(m_mutex);
   m_corrupt.insert(idx);
}

std::size_t stub_fetcher::calls() const {
   std::unique_lock<std::mutex> lock(m_mutex);
   return m_requested.size();
}

std::vector<fetchmap::tile_index> stub_fetcher::requested() const {
   std::unique_lock<std::mutex> lock(m_mutex);
   return m_requested;
}

} // namespace test
