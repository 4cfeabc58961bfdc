#include "infra/path_service.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

TEST(PathServiceTest, ConfigDirIsAbsoluteAndNonEmpty) {
  auto service = ermes::infra::PathService::create();

  const fs::path config(service->config_dir());
  EXPECT_FALSE(config.empty());
  EXPECT_TRUE(config.is_absolute());
}

TEST(PathServiceTest, ConfigDirContainsProjectName) {
  auto service = ermes::infra::PathService::create();
  EXPECT_NE(service->config_dir().find("ermes_client"), std::string::npos);
}

TEST(PathServiceTest, DefaultConfigFileLivesInConfigDir) {
  auto service = ermes::infra::PathService::create();

  const fs::path file(service->default_config_file());
  EXPECT_EQ(file.filename(), "config.yaml");
  EXPECT_EQ(file.parent_path(), fs::path(service->config_dir()));
}

#ifndef __APPLE__
TEST(PathServiceTest, XdgConfigHomeIsHonoured) {
  const char *previous = std::getenv("XDG_CONFIG_HOME");
  const std::string saved = previous != nullptr ? previous : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/ermes_xdg", 1);

  auto service = ermes::infra::PathService::create();
  EXPECT_EQ(service->config_dir(), "/tmp/ermes_xdg/ermes_client");

  if (previous != nullptr) {
    ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    ::unsetenv("XDG_CONFIG_HOME");
  }
}
#endif
