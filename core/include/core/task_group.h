#pragma once

#include "core/cancel_token.h"
#include "core/job_error.h"
#include "core/result.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ermes::core {

class ILogger;

/// TaskGroup owns one thread per active job poller or transfer.
///
/// Each task gets its own CancelToken; nothing else is shared between tasks.
/// The group is joined by its owner on shutdown; the destructor cancels and
/// joins whatever is still running.
class TaskGroup {
public:
  using Work = std::function<void(const std::shared_ptr<CancelToken> &)>;

  explicit TaskGroup(std::shared_ptr<ILogger> logger = nullptr);
  ~TaskGroup();

  TaskGroup(const TaskGroup &) = delete;
  TaskGroup &operator=(const TaskGroup &) = delete;

  /// Start `work` on a new thread. Returns the task id ("<name>#<n>").
  std::string spawn(const std::string &name, Work work);

  /// Request cancellation of one task. Err if the id is unknown.
  Result<void, JobError> cancel(const std::string &task_id);

  void cancel_all();

  /// Block until every spawned task has returned, then drop their entries.
  void join_all();

  /// Number of tasks whose work has not returned yet.
  [[nodiscard]] std::size_t active_count() const;

  /// Number of tasks not yet joined.
  [[nodiscard]] std::size_t tracked_count() const;

private:
  struct Entry {
    std::shared_ptr<CancelToken> cancel_token;
    std::thread thread;
    bool finished = false;
  };

  std::shared_ptr<ILogger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> tasks_;
  unsigned long next_id_ = 0;

  void mark_finished(const std::string &task_id);
};

} // namespace ermes::core
