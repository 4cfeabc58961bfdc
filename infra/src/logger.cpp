#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace ermes::infra {

namespace {

class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(const std::string &level) {
    logger_ = spdlog::get("ermes");
    if (!logger_) {
      logger_ = spdlog::stderr_color_mt("ermes");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    logger_->set_level(parsed == spdlog::level::off && level != "off"
                           ? spdlog::level::info
                           : parsed);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::shared_ptr<core::ILogger> create_console_logger(const std::string &level) {
  return std::make_shared<ConsoleLogger>(level);
}

} // namespace ermes::infra
