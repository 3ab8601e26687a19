#include "logging/logger.hpp"

#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace bpt = boost::property_tree;

namespace logging {

namespace {

const char *level_name(log_level level) {
  switch (level) {
  case log_level::finer:   return "FINER";
  case log_level::debug:   return "DEBUG";
  case log_level::info:    return "INFO";
  case log_level::warning: return "WARNING";
  case log_level::error:   return "ERROR";
  }
  return "UNKNOWN";
}

std::string timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm_now;
  gmtime_r(&now, &tm_now);
  char buf[32];
  std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_now);
  return std::string(buf, len);
}

// writes lines to a stream which it does not own.
struct stream_logger : public logger {
  explicit stream_logger(std::ostream &out) : m_out(out) {}
  virtual ~stream_logger() {}

  void write(log_level level, const std::string &msg) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_out << "[" << timestamp() << "] " << level_name(level) << ": " << msg << std::endl;
  }

private:
  std::ostream &m_out;
  std::mutex m_mutex;
};

struct file_logger : public logger {
  explicit file_logger(const std::string &location)
    : m_out(location.c_str(), std::ios::out | std::ios::app) {
    if (!m_out.is_open()) {
      throw std::runtime_error((boost::format("Unable to open log file \"%1%\"") % location).str());
    }
  }
  virtual ~file_logger() {}

  void write(log_level level, const std::string &msg) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_out << "[" << timestamp() << "] " << level_name(level) << ": " << msg << std::endl;
  }

private:
  std::ofstream m_out;
  std::mutex m_mutex;
};

struct null_logger : public logger {
  virtual ~null_logger() {}
  void write(log_level, const std::string &) {}
};

struct global_state {
  global_state()
    : sink(std::make_shared<stream_logger>(std::cerr))
    , threshold(log_level::info) {
  }

  std::mutex mutex;
  std::shared_ptr<logger> sink;
  log_level threshold;
};

global_state &state() {
  static global_state s;
  return s;
}

} // anonymous namespace

logger::~logger() {
}

log_level level_from_string(const std::string &name) {
  if      (name == "finer")   { return log_level::finer; }
  else if (name == "debug")   { return log_level::debug; }
  else if (name == "info")    { return log_level::info; }
  else if (name == "warning") { return log_level::warning; }
  else if (name == "error")   { return log_level::error; }

  throw std::runtime_error((boost::format("Unknown log level \"%1%\"") % name).str());
}

void log::configure(const bpt::ptree &conf) {
  const std::string type = conf.get<std::string>("type", "stderr");
  const log_level threshold = level_from_string(conf.get<std::string>("level", "info"));

  std::shared_ptr<logger> sink;
  if (type == "stdout") {
    sink = std::make_shared<stream_logger>(std::cout);

  } else if (type == "stderr") {
    sink = std::make_shared<stream_logger>(std::cerr);

  } else if (type == "file") {
    boost::optional<std::string> location = conf.get_optional<std::string>("location");
    if (!location) {
      throw std::runtime_error("File logger requires a \"location\".");
    }
    sink = std::make_shared<file_logger>(*location);

  } else if (type == "null") {
    sink = std::make_shared<null_logger>();

  } else {
    throw std::runtime_error((boost::format("Unknown logger type \"%1%\"") % type).str());
  }

  configure(sink, threshold);
}

void log::configure(std::shared_ptr<logger> sink, log_level threshold) {
  global_state &s = state();
  std::unique_lock<std::mutex> lock(s.mutex);
  s.sink = sink;
  s.threshold = threshold;
}

bool log::enabled(log_level level) {
  global_state &s = state();
  std::unique_lock<std::mutex> lock(s.mutex);
  return static_cast<int>(level) >= static_cast<int>(s.threshold);
}

void log::write(log_level level, const std::string &msg) {
  std::shared_ptr<logger> sink;
  {
    global_state &s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) < static_cast<int>(s.threshold)) {
      return;
    }
    sink = s.sink;
  }
  sink->write(level, msg);
}

void log::write(log_level level, const char *msg) {
  write(level, std::string(msg));
}

void log::write(log_level level, const boost::format &fmt) {
  write(level, fmt.str());
}

} // namespace logging
