#pragma once

#include <string>

namespace ermes::core {

/// Logger interface used by core and infra components.
/// trace_id is the job id (or a generated transfer id) so that every line of
/// one job's lifecycle can be grepped together. The spdlog implementation
/// lives in infra.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace ermes::core
