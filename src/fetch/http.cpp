#include "fetch/http.hpp"
#include "fetcher_io.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include "config.h"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/optional.hpp>

#include <atomic>
#include <condition_variable>
#include <list>
#include <mutex>
#include <queue>
#include <set>
#include <sstream>
#include <thread>

#include <curl/curl.h>

// maximum number of idle handles/connections to keep alive in
// the handle pool.
#define MAX_POOL_SIZE (64)

// longest time the transfer thread blocks in curl_multi_wait
// before checking for new requests.
#define MULTI_WAIT_MS (100)

namespace fetchmap { namespace fetch {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  std::string *body = static_cast<std::string*>(userdata);
  size_t total_bytes = size * nmemb;
  body->append(ptr, total_bytes);
  return total_bytes;
}

struct request {
  request(std::promise<fetch_response> &&p_, const tile_index &idx_, std::string url_)
    : promise(std::move(p_)), index(idx_), url(std::move(url_)) {
    error_buffer[0] = '\0';
  }

  std::promise<fetch_response> promise;
  tile_index index;
  std::string url;
  std::string body;
  char error_buffer[CURL_ERROR_SIZE];
};

fetch_status status_for_curl_error(CURLcode res) {
  switch (res) {
  case CURLE_OPERATION_TIMEDOUT:
    return fetch_status::timeout;
  case CURLE_REMOTE_FILE_NOT_FOUND:
  case CURLE_FILE_COULDNT_READ_FILE:
    return fetch_status::not_found;
  case CURLE_UNSUPPORTED_PROTOCOL:
  case CURLE_URL_MALFORMAT:
    return fetch_status::bad_request;
  default:
    return fetch_status::server_error;
  }
}

fetch_status status_for_http_code(long status_code) {
  switch (status_code) {
  case 400: return fetch_status::bad_request;
  case 404: return fetch_status::not_found;
  case 408: return fetch_status::timeout;
  case 501: return fetch_status::not_implemented;
  case 504: return fetch_status::timeout;
  default:
    return fetch_status::server_error;
  }
}

} // anonymous namespace

http_options::http_options()
  : timeout_ms(30000)
  , connect_timeout_ms(10000)
  , max_concurrent(4)
  , user_agent(FETCHMAP_DEFAULT_USER_AGENT) {
}

struct http::impl {
  impl(const tile_source &source, const http_options &options);
  ~impl();

  void start_request(std::promise<fetch_response> &&promise, const tile_index &idx);

  std::atomic<std::size_t> m_requests_issued;

private:
  void thread_func();
  void perform_multi(CURLM *curl_multi);
  void handle_response(CURLcode res, CURL *curl);
  void fail_request(request *req, fetch_status status, const std::string &cause);
  void free_handle(CURL *curl);
  CURL *new_handle();
  boost::optional<std::string> new_request(CURL *curl, request *r);

  const tile_source m_source;
  const http_options m_options;
  bool m_shutdown;
  std::mutex m_mutex;
  std::condition_variable m_cond;
  std::list<std::unique_ptr<request> > m_new_requests;
  // only touched by the transfer thread.
  std::queue<CURL*> m_handle_pool;
  std::set<CURL*> m_active;
  std::thread m_thread;
};

http::impl::impl(const tile_source &source, const http_options &options)
  : m_requests_issued(0)
  , m_source(source)
  , m_options(options)
  , m_shutdown(false) {
  if (m_options.max_concurrent == 0) {
    throw invalid_request_error("HTTP fetcher needs at least one concurrent transfer.");
  }
  // thread must be started last, as it uses the members above.
  m_thread = std::thread(&impl::thread_func, this);
}

http::impl::~impl() {
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_shutdown = true;
  }
  m_cond.notify_all();
  m_thread.join();
}

void http::impl::start_request(std::promise<fetch_response> &&promise, const tile_index &idx) {
  if (!is_valid(idx)) {
    std::ostringstream cause;
    cause << "Tile " << idx << " is outside the tile pyramid.";
    promise.set_value(fetch_response(fetch_error(fetch_status::bad_request, m_source.id, idx, cause.str())));
    return;
  }

  std::unique_ptr<request> req(new request(std::move(promise), idx, m_source.url_for(idx)));
  LOG_FINER(boost::format("Queueing request for %1%") % req->url);

  {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_shutdown) {
      fail_request(req.release(), fetch_status::unavailable, "Fetcher is shutting down.");
      return;
    }
    m_new_requests.emplace_back(std::move(req));
    ++m_requests_issued;
  }
  m_cond.notify_one();
}

void http::impl::thread_func() {
  CURLM *curl_multi = curl_multi_init();

  while (true) {
    std::list<std::unique_ptr<request> > requests;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      if (m_active.empty()) {
        m_cond.wait(lock, [this]() { return m_shutdown || !m_new_requests.empty(); });
      }
      if (m_shutdown) { break; }

      // only start as many as there are free transfer slots.
      while (!m_new_requests.empty() && (m_active.size() + requests.size() < m_options.max_concurrent)) {
        requests.emplace_back(std::move(m_new_requests.front()));
        m_new_requests.pop_front();
      }
    }

    for (auto &ptr : requests) {
      request *req = ptr.release();
      CURL *curl = new_handle();
      boost::optional<std::string> err = (curl == nullptr)
        ? boost::optional<std::string>(std::string("Unable to create cURL handle."))
        : new_request(curl, req);

      if (err) {
        fail_request(req, fetch_status::server_error, *err);
        if (curl != nullptr) { free_handle(curl); }

      } else {
        CURLMcode mres = curl_multi_add_handle(curl_multi, curl);
        if (mres != CURLM_OK) {
          fail_request(req, fetch_status::server_error, curl_multi_strerror(mres));
          free_handle(curl);
        } else {
          m_active.insert(curl);
        }
      }
    }

    if (!m_active.empty()) {
      int numfds = 0;
      CURLMcode mres = curl_multi_wait(curl_multi, nullptr, 0, MULTI_WAIT_MS, &numfds);
      if (mres != CURLM_OK) {
        LOG_ERROR(boost::format("Error in curl_multi_wait: %1%") % curl_multi_strerror(mres));
      }
      perform_multi(curl_multi);
    }
  }

  // abandon anything still in flight or queued, so that no future
  // is left without a value.
  for (CURL *curl : m_active) {
    request *req = nullptr;
    curl_easy_getinfo(curl, CURLINFO_PRIVATE, &req);
    curl_multi_remove_handle(curl_multi, curl);
    curl_easy_cleanup(curl);
    if (req != nullptr) {
      fail_request(req, fetch_status::unavailable, "Fetcher shut down before the transfer completed.");
    }
  }
  m_active.clear();

  {
    std::unique_lock<std::mutex> lock(m_mutex);
    for (auto &ptr : m_new_requests) {
      fail_request(ptr.release(), fetch_status::unavailable, "Fetcher shut down before the transfer started.");
    }
    m_new_requests.clear();
  }

  while (!m_handle_pool.empty()) {
    CURL *curl = m_handle_pool.front();
    m_handle_pool.pop();
    curl_easy_cleanup(curl);
  }

  curl_multi_cleanup(curl_multi);
}

void http::impl::perform_multi(CURLM *curl_multi) {
  int running_handles = 0;
  int msgs_in_queue = 0;
  CURLMcode res = CURLM_OK;
  bool any_done = false;

  do {
    do {
      res = curl_multi_perform(curl_multi, &running_handles);
    } while (res == CURLM_CALL_MULTI_PERFORM);

    if (res != CURLM_OK) {
      LOG_ERROR(boost::format("Error in curl_multi_perform: %1%") % curl_multi_strerror(res));
    }

    CURLMsg *msg = nullptr;
    any_done = false;
    while ((msg = curl_multi_info_read(curl_multi, &msgs_in_queue)) != nullptr) {
      if (msg->msg == CURLMSG_DONE) {
        CURL *curl = msg->easy_handle;
        CURLcode result = msg->data.result;
        curl_multi_remove_handle(curl_multi, curl);
        m_active.erase(curl);
        handle_response(result, curl);
        free_handle(curl);
        any_done = true;
      }
    }
  } while (any_done);
}

void http::impl::handle_response(CURLcode res, CURL *curl) {
  request *req = nullptr;
  CURLcode res2 = curl_easy_getinfo(curl, CURLINFO_PRIVATE, &req);
  if ((res2 != CURLE_OK) || (req == nullptr)) {
    LOG_ERROR("Completed cURL transfer has no request attached.");
    return;
  }

  if (res != CURLE_OK) {
    std::string cause = (req->error_buffer[0] != '\0') ? std::string(req->error_buffer) : std::string(curl_easy_strerror(res));
    fail_request(req, status_for_curl_error(res), cause);
    return;
  }

  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  // file:// transfers don't have a status code, success is CURLE_OK.
  const bool is_file = boost::algorithm::istarts_with(req->url, "file:");

  if ((status_code == 200) || (is_file && (status_code == 0))) {
    LOG_FINER(boost::format("Fetched %1% (%2% bytes)") % req->url % req->body.size());
    tile_ptr tile(new tile_data(req->index, std::move(req->body)));
    req->promise.set_value(fetch_response(tile));
    delete req;

  } else {
    fail_request(req, status_for_http_code(status_code), (boost::format("HTTP %1%") % status_code).str());
  }
}

void http::impl::fail_request(request *req, fetch_status status, const std::string &cause) {
  fetch_error err(status, m_source.id, req->index, cause);
  LOG_DEBUG(boost::format("Request for %1% failed: %2%") % req->url % err);
  req->promise.set_value(fetch_response(err));
  delete req;
}

void http::impl::free_handle(CURL *curl) {
  if (m_handle_pool.size() > MAX_POOL_SIZE) {
    curl_easy_cleanup(curl);

  } else {
    m_handle_pool.push(curl);
  }
}

CURL *http::impl::new_handle() {
  CURL *handle = nullptr;

  if (m_handle_pool.empty()) {
    handle = curl_easy_init();

  } else {
    handle = m_handle_pool.front();
    m_handle_pool.pop();
    // forget options from the previous request, but keep the
    // connection alive.
    curl_easy_reset(handle);
  }

  return handle;
}

boost::optional<std::string> http::impl::new_request(CURL *curl, request *r) {
#define SETOPT(opt, val) do { \
    CURLcode res = curl_easy_setopt(curl, opt, val); \
    if (res != CURLE_OK) { \
      return std::string((boost::format("Unable to set " #opt ": %1%") % curl_easy_strerror(res)).str()); \
    } \
  } while (false)

  SETOPT(CURLOPT_URL, r->url.c_str());
  SETOPT(CURLOPT_WRITEFUNCTION, write_callback);
  SETOPT(CURLOPT_WRITEDATA, &r->body);
  SETOPT(CURLOPT_PRIVATE, r);
  SETOPT(CURLOPT_ERRORBUFFER, r->error_buffer);
  SETOPT(CURLOPT_TIMEOUT_MS, m_options.timeout_ms);
  SETOPT(CURLOPT_CONNECTTIMEOUT_MS, m_options.connect_timeout_ms);
  SETOPT(CURLOPT_USERAGENT, m_options.user_agent.c_str());
  SETOPT(CURLOPT_FOLLOWLOCATION, 1L);
  SETOPT(CURLOPT_NOSIGNAL, 1L);

#undef SETOPT

  return boost::none;
}

http::http(const tile_source &source, const http_options &options)
  : m_impl(new impl(source, options)) {
}

http::~http() {
}

std::future<fetch_response> http::operator()(const tile_index &idx) {
  std::promise<fetch_response> promise;
  std::future<fetch_response> future = promise.get_future();
  m_impl->start_request(std::move(promise), idx);
  return future;
}

std::size_t http::requests_issued() const {
  return m_impl->m_requests_issued.load();
}

} } // namespace fetchmap::fetch
