#include "core/navigation/resolve_worker.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/util/canonical.hpp"

namespace permaweb {

ResolveWorker::ResolveWorker(HistoryResolver& resolver, std::size_t thread_count, std::int64_t timeout_ms)
    : resolver_(resolver), timeout_ms_(timeout_ms < 0 ? 0 : timeout_ms) {
  if (thread_count == 0) {
    thread_count = 1;
  }
  threads_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this]() { run_loop(); });
  }
}

ResolveWorker::~ResolveWorker() {
  stop();
}

void ResolveWorker::stop() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();
  done_cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void ResolveWorker::submit(ResolveTicket ticket) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      spdlog::warn("Resolve request {} submitted after shutdown; ignored", ticket.request_id);
      return;
    }
    in_flight_[ticket.request_id] = util::steady_millis_now();
    pending_.push_back(std::move(ticket));
  }
  work_cv_.notify_one();
}

void ResolveWorker::run_loop() {
  while (true) {
    ResolveTicket ticket;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
      if (stopping_) {
        return;
      }
      ticket = std::move(pending_.front());
      pending_.pop_front();
    }

    ResolveResult result = resolver_.resolve(ticket.identifier, ticket.requested_version);

    {
      std::lock_guard lock(mutex_);
      completed_.push_back({.request_id = ticket.request_id, .result = std::move(result)});
    }
    done_cv_.notify_all();
  }
}

std::vector<ResolveCompletion> ResolveWorker::drain() {
  std::lock_guard lock(mutex_);
  std::vector<ResolveCompletion> out = std::move(completed_);
  completed_.clear();

  for (const auto& completion : out) {
    in_flight_.erase(completion.request_id);
  }

  if (timeout_ms_ > 0) {
    const std::int64_t now = util::steady_millis_now();
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
      if (now - it->second < timeout_ms_) {
        ++it;
        continue;
      }
      spdlog::warn("Resolve request {} timed out after {} ms", it->first, timeout_ms_);
      out.push_back({.request_id = it->first,
                     .result = ResolveResult::failure(ResolveError::Unavailable,
                                                      "Timed out waiting for the network.")});
      it = in_flight_.erase(it);
    }
  }
  return out;
}

bool ResolveWorker::wait_for_completion(std::int64_t wait_ms) {
  std::unique_lock lock(mutex_);
  return done_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                           [this]() { return stopping_ || !completed_.empty(); }) &&
         !completed_.empty();
}

std::size_t ResolveWorker::in_flight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

}  // namespace permaweb
