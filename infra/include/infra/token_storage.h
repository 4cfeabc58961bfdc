#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ermes::infra {

class PathService;

/// Token persisted between CLI runs together with its issue time, so a later
/// run can check local expiry before reusing it.
struct StoredToken {
  std::string token;
  std::chrono::system_clock::time_point issued_at;
};

class TokenStorage {
public:
  explicit TokenStorage(const PathService &path_service);

  /// Writes the token file with owner-only permissions. Returns false when the
  /// file could not be written.
  bool save(const std::string &token,
            std::chrono::system_clock::time_point issued_at);

  /// Nothing for a missing or malformed file.
  [[nodiscard]] std::optional<StoredToken> load() const;
  void clear();

  [[nodiscard]] std::string token_file_path() const;

private:
  const PathService &path_service_;
};

} // namespace ermes::infra
