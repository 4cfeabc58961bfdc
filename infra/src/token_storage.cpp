#include "infra/token_storage.h"

#include "infra/path_service.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace ermes::infra {

TokenStorage::TokenStorage(const PathService &path_service)
    : path_service_(path_service) {}

bool TokenStorage::save(const std::string &token,
                        std::chrono::system_clock::time_point issued_at) {
  const std::filesystem::path file_path(token_file_path());
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    return false;
  }

  const auto issued_s = std::chrono::duration_cast<std::chrono::seconds>(
                            issued_at.time_since_epoch())
                            .count();
  {
    std::ofstream ofs(file_path, std::ios::trunc);
    if (!ofs) {
      return false;
    }
    ofs << token << '\n' << issued_s << '\n';
    if (!ofs) {
      return false;
    }
  }

  std::filesystem::permissions(file_path,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  return !ec;
}

std::optional<StoredToken> TokenStorage::load() const {
  const std::filesystem::path file_path(token_file_path());
  if (!std::filesystem::exists(file_path)) {
    return std::nullopt;
  }

  std::ifstream ifs(file_path);
  std::string token;
  std::string issued_line;
  if (!std::getline(ifs, token) || !std::getline(ifs, issued_line)) {
    return std::nullopt;
  }
  if (token.empty() || issued_line.empty()) {
    return std::nullopt;
  }

  long long issued_s = 0;
  try {
    std::size_t consumed = 0;
    issued_s = std::stoll(issued_line, &consumed);
    if (consumed != issued_line.size()) {
      return std::nullopt;
    }
  } catch (const std::exception &) {
    return std::nullopt;
  }

  StoredToken stored;
  stored.token = token;
  stored.issued_at = std::chrono::system_clock::time_point(
      std::chrono::seconds(issued_s));
  return stored;
}

void TokenStorage::clear() {
  const std::filesystem::path file_path(token_file_path());
  std::error_code ec;
  std::filesystem::remove(file_path, ec);
}

std::string TokenStorage::token_file_path() const {
  const std::filesystem::path file_path =
      std::filesystem::path(path_service_.config_dir()) / "token.txt";
  return file_path.string();
}

} // namespace ermes::infra
