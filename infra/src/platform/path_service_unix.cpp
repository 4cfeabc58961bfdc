#include "infra/path_service.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

namespace ermes::infra {

namespace {

constexpr const char *kAppDir = "ermes_client";

std::string home_dir() {
  const char *home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return std::string(pw->pw_dir);
  }
  throw std::runtime_error("Unable to resolve HOME directory");
}

// $XDG_<name> when set, else $HOME/<fallback>.
std::string xdg_dir(const char *variable, const char *fallback) {
  const char *xdg = std::getenv(variable);
  const std::string base = xdg != nullptr && xdg[0] != '\0'
                               ? std::string(xdg)
                               : home_dir() + "/" + fallback;
  return base + "/" + kAppDir;
}

class PathServiceUnix final : public PathService {
public:
  [[nodiscard]] std::string config_dir() const override {
#ifdef __APPLE__
    return home_dir() + "/Library/Application Support/" + kAppDir;
#else
    return xdg_dir("XDG_CONFIG_HOME", ".config");
#endif
  }
};

} // namespace

std::string PathService::default_config_file() const {
  return config_dir() + "/config.yaml";
}

std::unique_ptr<PathService> PathService::create() {
  return std::make_unique<PathServiceUnix>();
}

} // namespace ermes::infra
