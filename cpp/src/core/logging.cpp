#include "codescope/logging.hpp"

#include <mutex>
#include <utility>

namespace codescope {
namespace {

constexpr const char* kLoggerName = "codescope";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> MakeDefaultLogger() {
  if (auto existing = spdlog::get(kLoggerName); existing != nullptr) {
    return existing;
  }
  const auto& default_sinks = spdlog::default_logger()->sinks();
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, default_sinks.begin(), default_sinks.end());
  logger->set_level(spdlog::level::info);
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger == nullptr) {
    g_logger = MakeDefaultLogger();
  }
  return g_logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = std::move(logger);
}

}  // namespace codescope
