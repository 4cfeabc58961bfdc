#pragma once

#include <memory>
#include <string>

namespace ermes::infra {

/// Per-user configuration directory, ending in `ermes_client`.
class PathService {
public:
  virtual ~PathService() = default;

  [[nodiscard]] virtual std::string config_dir() const = 0;

  /// Default configuration file: <config_dir>/config.yaml
  [[nodiscard]] std::string default_config_file() const;

  static std::unique_ptr<PathService> create();
};

} // namespace ermes::infra
