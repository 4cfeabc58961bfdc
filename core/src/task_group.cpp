#include "core/task_group.h"

#include "core/logger.h"

#include <exception>
#include <utility>
#include <vector>

namespace ermes::core {

TaskGroup::TaskGroup(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {}

TaskGroup::~TaskGroup() {
  cancel_all();
  join_all();
}

std::string TaskGroup::spawn(const std::string &name, Work work) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string task_id = name + "#" + std::to_string(++next_id_);

  auto &entry = tasks_[task_id];
  entry.cancel_token = CancelToken::create();

  // The worker's mark_finished() blocks on mutex_ until this entry is fully
  // constructed.
  entry.thread = std::thread(
      [this, task_id, token = entry.cancel_token, work = std::move(work)]() {
        try {
          work(token);
        } catch (const std::exception &e) {
          if (logger_) {
            logger_->error(task_id, "task_group", "task_exception", e.what());
          }
        }
        mark_finished(task_id);
      });

  if (logger_) {
    logger_->info(task_id, "task_group", "task_spawned",
                  "active=" + std::to_string(tasks_.size()));
  }
  return task_id;
}

Result<void, JobError> TaskGroup::cancel(const std::string &task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return Result<void, JobError>::Err(
        JobError::Internal("Task not found: " + task_id));
  }
  it->second.cancel_token->request_cancel();
  return Result<void, JobError>::Ok();
}

void TaskGroup::cancel_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[id, entry] : tasks_) {
    if (!entry.finished) {
      entry.cancel_token->request_cancel();
    }
  }
}

void TaskGroup::join_all() {
  while (true) {
    std::vector<std::pair<std::string, std::thread>> threads;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto &[id, entry] : tasks_) {
        if (entry.thread.joinable()) {
          threads.emplace_back(id, std::move(entry.thread));
        }
      }
    }
    if (threads.empty()) {
      return;
    }
    for (auto &[id, t] : threads) {
      t.join();
    }

    // Joined workers have returned; forget them.
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, t] : threads) {
      tasks_.erase(id);
    }
  }
}

std::size_t TaskGroup::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto &[id, entry] : tasks_) {
    if (!entry.finished) {
      ++active;
    }
  }
  return active;
}

std::size_t TaskGroup::tracked_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void TaskGroup::mark_finished(const std::string &task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it != tasks_.end()) {
    it->second.finished = true;
  }
}

} // namespace ermes::core
