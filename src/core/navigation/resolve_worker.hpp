#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "core/history/history_resolver.hpp"
#include "core/model/types.hpp"

namespace permaweb {

// Runs resolver calls off the control thread. Completions are queued and handed
// back in drain(); nothing here touches the navigation session.
class ResolveWorker {
public:
  // timeout_ms 0 disables the timeout.
  ResolveWorker(HistoryResolver& resolver, std::size_t thread_count, std::int64_t timeout_ms);
  ~ResolveWorker();

  ResolveWorker(const ResolveWorker&) = delete;
  ResolveWorker& operator=(const ResolveWorker&) = delete;

  void submit(ResolveTicket ticket);

  // Completed results plus an Unavailable completion for every ticket that has
  // been outstanding longer than the timeout.
  std::vector<ResolveCompletion> drain();

  // Blocks until a completion is queued or wait_ms elapses.
  bool wait_for_completion(std::int64_t wait_ms);

  void stop();

  [[nodiscard]] std::size_t in_flight() const;

private:
  void run_loop();

  HistoryResolver& resolver_;
  std::int64_t timeout_ms_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable done_cv_;
  std::deque<ResolveTicket> pending_;
  std::vector<ResolveCompletion> completed_;
  // request id -> submit time (steady ms)
  std::map<std::uint64_t, std::int64_t> in_flight_;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace permaweb
