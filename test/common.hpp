#ifndef FETCHMAP_TEST_COMMON_HPP
#define FETCHMAP_TEST_COMMON_HPP

#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <sstream>
#include <cmath>
#include <cstdint>
#include <boost/function.hpp>
#include <boost/format.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem.hpp>
#include <stdexcept>

#include <mapnik/color.hpp>
#include <mapnik/image.hpp>

#include "fetcher.hpp"

namespace test {

template <typename T>
void assert_equal(T actual, T expected, std::string message = std::string()) {
   if (actual != expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_not_equal(T actual, T expected, std::string message = std::string()) {
   if (actual == expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_less_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual > expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_greater_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual < expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

inline void assert_near(double actual, double expected, double tolerance, std::string message = std::string()) {
   if (!(std::abs(actual - expected) <= tolerance)) {
      throw std::runtime_error((boost::format("%1%: expected=%2% (+/- %3%), actual=%4%.")
                                % message % expected % tolerance % actual).str());
   }
}

/* runs the function and fails unless it throws an exception of
 * type E.
 */
template <typename E, typename F>
void assert_throws(F f, std::string message = std::string()) {
   try {
      f();
   } catch (const E &) {
      return;
   }
   throw std::runtime_error((boost::format("%1%: expected an exception, but none was thrown.") % message).str());
}

/* runs the test function, formats the output nicely and returns 1
 * if the test failed.
 */
int run(const std::string &name, boost::function<void ()> test);

/* a DSL to make JSON format files. this is nicer than simply
 * quoting the JSON file because C++ lacks heredoc support and
 * uses the same quote character as JSON, so the quoted strings
 * end up looking really ugly.
 */
struct json {
   enum type { type_NONE, type_DICT, type_LIST };

   json();
   json(const json &j);

   /* use operator() to add dictionary key-value entries.
    */
   template <typename T>
   json &operator()(const std::string &key, const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_DICT; }
      if (m_type != type_DICT) { throw std::runtime_error("Mixed type in JSON: expecting DICT."); }
      if (first) { m_buf << "{"; } else { m_buf << ","; }
      m_buf << "\"" << key << "\":";
      quote(t);
      return *this;
   }

   /* use operator[] to add list entries.
    */
   template <typename T>
   json &operator[](const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_LIST; }
      if (m_type != type_LIST) { throw std::runtime_error("Mixed type in JSON: expecting LIST."); }
      if (first) { m_buf << "["; } else { m_buf << ","; }
      quote(t);
      return *this;
   }

   friend std::ostream &operator<<(std::ostream &, const json &);

private:

   void quote(const json &);
   void quote(const std::string &);
   void quote(const char *);
   void quote(int);
   void quote(double);

   type m_type;
   std::ostringstream m_buf;
};

std::ostream &operator<<(std::ostream &, const json &);

/* an RAII temporary directory.
 *
 * on construction, creates a temporary directory. the path to it
 * is available via the path() accessor. upon destruction, it will
 * recursively delete the whole temporary directory tree.
 */
struct temp_dir : boost::noncopyable {
   temp_dir();
   ~temp_dir();
   inline boost::filesystem::path path() const { return m_path; }
private:
   boost::filesystem::path m_path;
};

// write a string to a file, creating parent directories.
void write_file(const boost::filesystem::path &file, const std::string &content);

// a square image filled with a single colour, encoded as PNG.
std::string solid_png(unsigned int size, const mapnik::color &c);

// distinct, deterministic colour for each tile.
mapnik::color tile_colour(const fetchmap::tile_index &idx);

// packed RGBA value of a colour, as stored in image_rgba8.
inline std::uint32_t packed(const mapnik::color &c) { return c.rgba(); }

/* fetcher which serves solid-colour PNG tiles of tile_colour(),
 * fails the tiles in its failure set with not_found, and counts
 * how often it is called.
 */
struct stub_fetcher : public fetchmap::fetcher {
   explicit stub_fetcher(unsigned int tile_size = 256);
   virtual ~stub_fetcher();

   std::future<fetchmap::fetch_response> operator()(const fetchmap::tile_index &idx);

   void fail(const fetchmap::tile_index &idx);
   // respond with bytes which are not an image.
   void corrupt(const fetchmap::tile_index &idx);
   std::size_t calls() const;
   std::vector<fetchmap::tile_index> requested() const;

private:
   const unsigned int m_tile_size;
   mutable std::mutex m_mutex;
   std::set<fetchmap::tile_index> m_failures, m_corrupt;
   std::vector<fetchmap::tile_index> m_requested;
};

} // namespace test

#endif /* FETCHMAP_TEST_COMMON_HPP */
