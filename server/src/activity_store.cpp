/*
 * 설명: 정렬 집합 기반 활동 저장소를 인메모리로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_worker_test.cpp
 */
#include "stakematch/activity_store.hpp"

namespace stakematch {

void InMemoryActivityStore::Touch(const ActivityKey& key, Clock::time_point now, std::chrono::seconds warn_after,
                                  std::chrono::seconds forfeit_after) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_active_[key] = now;
  warning_deadlines_[key] = now + warn_after;
  forfeit_deadlines_[key] = now + forfeit_after;
}

std::optional<ActivityStore::Clock::time_point> InMemoryActivityStore::LastActive(const ActivityKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_active_.find(key);
  if (it == last_active_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ActivityKey> InMemoryActivityStore::PopDue(std::map<ActivityKey, Clock::time_point>& deadlines,
                                                       Clock::time_point now) {
  std::vector<ActivityKey> due;
  for (auto it = deadlines.begin(); it != deadlines.end();) {
    if (it->second <= now) {
      due.push_back(it->first);
      it = deadlines.erase(it);
    } else {
      ++it;
    }
  }
  return due;
}

std::vector<ActivityKey> InMemoryActivityStore::PopDueWarnings(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return PopDue(warning_deadlines_, now);
}

std::vector<ActivityKey> InMemoryActivityStore::PopDueForfeits(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return PopDue(forfeit_deadlines_, now);
}

void InMemoryActivityStore::Clear(const ActivityKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_active_.erase(key);
  warning_deadlines_.erase(key);
  forfeit_deadlines_.erase(key);
}

}  // namespace stakematch
