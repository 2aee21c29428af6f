#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <vector>

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> log;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::once_flag g_sinks_once;
Sinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const std::string& pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

const Sinks& sinks() {
  std::call_once(g_sinks_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_sinks.log = make_sink_logger("p2pci.log",
                                   std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                   stamped, spdlog::level::warn);
    g_sinks.error = make_sink_logger("p2pci.error",
                                     std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                     stamped, spdlog::level::err);
    g_sinks.print = make_sink_logger("p2pci.print",
                                     std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                     "%v", spdlog::level::info);
    g_sinks.print_err = make_sink_logger("p2pci.print_err",
                                         std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                         "%v", spdlog::level::err);
    g_sinks.log->set_level(spdlog::level::info);
  });
  return g_sinks;
}

} // namespace

void init_logging(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.log->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.log);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.clear();
}

void Logger::emit(const char* channel,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  std::string channel_name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_name = name_.empty() ? std::string(channel) : name_ + ":" + channel;
  }
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    if(listener(channel, level, message)) {
      handled = true;
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  const auto& s = sinks();
  if(!log_passthrough()) return;

  spdlog::logger* sink = s.log.get();
  if(std::strcmp(base_channel, "print") == 0) {
    sink = s.print.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = s.print_err.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = s.error.get();
  }

  bool plain = sink == s.print.get() || sink == s.print_err.get();
  if(!plain && channel_name != base_channel) {
    sink->log(level, "[{}] {}", channel_name, message);
  } else {
    sink->log(level, "{}", message);
  }
}

} // namespace detail
