#include "common.hpp"
#include "tile_cache.hpp"
#include "errors.hpp"

#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/filesystem.hpp>

namespace bfs = boost::filesystem;
using fetchmap::tile_cache;
using fetchmap::tile_index;

namespace {

void test_path_layout() {
  tile_cache cache("/var/cache/maps");
  test::assert_equal<std::string>(cache.path_for("wikimedia", tile_index(8, 48, 96)).generic_string(),
                                  "/var/cache/maps/wikimedia/8/48/96.png", "path");
  test::assert_equal<std::string>(cache.root().generic_string(), "/var/cache/maps", "root");
}

void test_lookup_miss() {
  test::temp_dir tmp;
  tile_cache cache(tmp.path());
  test::assert_equal<bool>(bool(cache.lookup("src", tile_index(1, 0, 0))), false, "empty cache");
}

void test_store_then_lookup() {
  test::temp_dir tmp;
  tile_cache cache(tmp.path());

  // binary content, with an embedded NUL.
  const std::string bytes("\x89PNG\r\n\x1a\n\0tile", 13);
  test::assert_equal<bool>(cache.store("src", tile_index(3, 2, 1), bytes), true, "stored");

  boost::optional<std::string> found = cache.lookup("src", tile_index(3, 2, 1));
  test::assert_equal<bool>(bool(found), true, "found");
  test::assert_equal<std::string>(*found, bytes, "same bytes");
  test::assert_equal<bool>(bfs::is_regular_file(tmp.path() / "src" / "3" / "2" / "1.png"), true, "file on disk");

  // other keys are unaffected.
  test::assert_equal<bool>(bool(cache.lookup("other", tile_index(3, 2, 1))), false, "different source");
  test::assert_equal<bool>(bool(cache.lookup("src", tile_index(3, 1, 2))), false, "different tile");
}

void test_no_overwrite() {
  test::temp_dir tmp;
  tile_cache cache(tmp.path());

  test::assert_equal<bool>(cache.store("src", tile_index(2, 1, 1), "first"), true, "first store");
  test::assert_equal<bool>(cache.store("src", tile_index(2, 1, 1), "second"), false, "second store refused");
  test::assert_equal<std::string>(*cache.lookup("src", tile_index(2, 1, 1)), "first", "original kept");
}

void test_no_temporaries_left() {
  test::temp_dir tmp;
  tile_cache cache(tmp.path());
  cache.store("src", tile_index(4, 5, 6), "data");

  int files = 0;
  for (bfs::recursive_directory_iterator itr(tmp.path()), end; itr != end; ++itr) {
    if (bfs::is_regular_file(itr->status())) {
      ++files;
      test::assert_equal<std::string>(itr->path().extension().string(), ".png", "only tiles remain");
    }
  }
  test::assert_equal<int>(files, 1, "one file");
}

void test_shared_directory() {
  // two caches on the same root see each other's entries.
  test::temp_dir tmp;
  tile_cache a(tmp.path()), b(tmp.path());
  a.store("src", tile_index(5, 10, 11), "shared");
  test::assert_equal<std::string>(*b.lookup("src", tile_index(5, 10, 11)), "shared", "visible to other cache");
  test::assert_equal<bool>(b.store("src", tile_index(5, 10, 11), "again"), false, "already present");
}

void test_concurrent_store() {
  // writers race for the same keys with different bytes. each key
  // must be won exactly once, and keep the winner's bytes.
  test::temp_dir tmp;
  tile_cache cache(tmp.path());
  const int writers = 8, rounds = 300;

  std::mutex mutex;
  std::vector<int> wins(rounds, 0), winner(rounds, -1);
  std::string error;

  std::vector<std::thread> threads;
  for (int w = 0; w < writers; ++w) {
    threads.push_back(std::thread([&, w]() {
          const std::string payload(16384, char('a' + w));
          try {
            for (int r = 0; r < rounds; ++r) {
              if (cache.store("src", tile_index(12, r, 7), payload)) {
                std::unique_lock<std::mutex> lock(mutex);
                ++wins[r];
                winner[r] = w;
              }
            }
          } catch (const std::exception &e) {
            std::unique_lock<std::mutex> lock(mutex);
            error = e.what();
          }
        }));
  }
  for (auto &t : threads) {
    t.join();
  }

  test::assert_equal<std::string>(error, "", "no errors");
  for (int r = 0; r < rounds; ++r) {
    const std::string msg = (boost::format("round %1%") % r).str();
    test::assert_equal<int>(wins[r], 1, msg + ": one successful store");
    test::assert_equal<std::string>(*cache.lookup("src", tile_index(12, r, 7)),
                                    std::string(16384, char('a' + winner[r])), msg + ": winner's bytes");
  }

  int files = 0;
  for (bfs::recursive_directory_iterator itr(tmp.path()), end; itr != end; ++itr) {
    if (bfs::is_regular_file(itr->status())) { ++files; }
  }
  test::assert_equal<int>(files, rounds, "no temporaries left");
}

void test_bad_keys() {
  test::temp_dir tmp;
  tile_cache cache(tmp.path());
  test::assert_throws<fetchmap::cache_error>([&]() { cache.lookup("a/b", tile_index(1, 0, 0)); }, "slash in id");
  test::assert_throws<fetchmap::cache_error>([&]() { cache.store("..", tile_index(1, 0, 0), "x"); }, "dot-dot id");
  test::assert_throws<fetchmap::cache_error>([&]() { cache.store("", tile_index(1, 0, 0), "x"); }, "empty id");
  test::assert_throws<fetchmap::cache_error>([&]() { cache.lookup("src", tile_index(1, 2, 0)); }, "x out of range");
  test::assert_throws<fetchmap::cache_error>([&]() { cache.path_for("src", tile_index(-1, 0, 0)); }, "negative zoom");
}

void test_unwritable_root() {
  test::temp_dir tmp;
  // a regular file where the root directory should be.
  test::write_file(tmp.path() / "blocked", "not a directory");
  tile_cache cache(tmp.path() / "blocked");

  test::assert_throws<fetchmap::cache_error>([&]() { cache.store("src", tile_index(1, 0, 0), "x"); }, "store");
  test::assert_equal<bool>(bool(cache.lookup("src", tile_index(1, 0, 0))), false, "lookup just misses");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing tile cache ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }
  RUN_TEST(test_path_layout);
  RUN_TEST(test_lookup_miss);
  RUN_TEST(test_store_then_lookup);
  RUN_TEST(test_no_overwrite);
  RUN_TEST(test_no_temporaries_left);
  RUN_TEST(test_shared_directory);
  RUN_TEST(test_concurrent_store);
  RUN_TEST(test_bad_keys);
  RUN_TEST(test_unwritable_root);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
