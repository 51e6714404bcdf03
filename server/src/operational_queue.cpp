/*
 * 설명: 공유 캐시의 리스트/정렬 집합 연산을 단일 뮤텍스 아래에서 모사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/operational_queue_test.cpp
 */
#include "stakematch/operational_queue.hpp"

#include <algorithm>

#include "stakematch/errors.hpp"

namespace stakematch {

void InMemoryOperationalQueue::EnsureAvailable() const {
  if (!available_) {
    throw CacheUnavailableError("운영 큐 캐시에 연결할 수 없습니다");
  }
}

std::optional<std::int64_t> InMemoryOperationalQueue::PopAndStage(std::int64_t stake, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = buckets_.find(stake);
  if (it == buckets_.end() || it->second.waiting.empty()) {
    return std::nullopt;
  }
  std::int64_t id = it->second.waiting.front();
  it->second.waiting.pop_front();
  it->second.processing[id] = now;
  return id;
}

void InMemoryOperationalQueue::Push(std::int64_t stake, std::int64_t queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto& waiting = buckets_[stake].waiting;
  if (std::find(waiting.begin(), waiting.end(), queue_id) == waiting.end()) {
    waiting.push_back(queue_id);
  }
}

void InMemoryOperationalQueue::Requeue(std::int64_t stake, std::int64_t queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto& bucket = buckets_[stake];
  bucket.processing.erase(queue_id);
  if (std::find(bucket.waiting.begin(), bucket.waiting.end(), queue_id) == bucket.waiting.end()) {
    bucket.waiting.push_front(queue_id);
  }
}

bool InMemoryOperationalQueue::Remove(std::int64_t stake, std::int64_t queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = buckets_.find(stake);
  if (it == buckets_.end()) {
    return false;
  }
  auto& waiting = it->second.waiting;
  auto pos = std::find(waiting.begin(), waiting.end(), queue_id);
  if (pos == waiting.end()) {
    return false;
  }
  waiting.erase(pos);
  return true;
}

void InMemoryOperationalQueue::ClearProcessing(std::int64_t stake, std::int64_t queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = buckets_.find(stake);
  if (it != buckets_.end()) {
    it->second.processing.erase(queue_id);
  }
}

std::optional<OperationalQueue::Clock::time_point> InMemoryOperationalQueue::ProcessingSince(std::int64_t stake,
                                                                                            std::int64_t queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = buckets_.find(stake);
  if (it == buckets_.end()) {
    return std::nullopt;
  }
  auto found = it->second.processing.find(queue_id);
  if (found == it->second.processing.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<std::pair<std::int64_t, std::int64_t>> InMemoryOperationalQueue::ListStaleProcessing(
    Clock::time_point before) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  std::vector<std::pair<std::int64_t, std::int64_t>> stale;
  for (const auto& bucket : buckets_) {
    for (const auto& staged : bucket.second.processing) {
      if (staged.second < before) {
        stale.emplace_back(bucket.first, staged.first);
      }
    }
  }
  return stale;
}

bool InMemoryOperationalQueue::PushAllIfEmpty(std::int64_t stake, const std::vector<std::int64_t>& queue_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto& waiting = buckets_[stake].waiting;
  if (!waiting.empty()) {
    return false;
  }
  waiting.assign(queue_ids.begin(), queue_ids.end());
  return !queue_ids.empty();
}

std::size_t InMemoryOperationalQueue::Length(std::int64_t stake) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  auto it = buckets_.find(stake);
  return it == buckets_.end() ? 0 : it->second.waiting.size();
}

std::size_t InMemoryOperationalQueue::TotalLength() {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureAvailable();
  std::size_t total = 0;
  for (const auto& entry : buckets_) {
    total += entry.second.waiting.size();
  }
  return total;
}

void InMemoryOperationalQueue::SetAvailable(bool available) {
  std::lock_guard<std::mutex> lock(mutex_);
  available_ = available;
}

std::size_t InMemoryOperationalQueue::ProcessingCount(std::int64_t stake) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(stake);
  return it == buckets_.end() ? 0 : it->second.processing.size();
}

}  // namespace stakematch
