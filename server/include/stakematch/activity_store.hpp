/*
 * 설명: 플레이어별 마지막 활동 시각과 경고/몰수 마감 시각을 시간순으로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_worker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

namespace stakematch {

struct ActivityKey {
  std::int64_t session_id;
  std::int64_t player_id;

  bool operator<(const ActivityKey& other) const {
    return std::tie(session_id, player_id) < std::tie(other.session_id, other.player_id);
  }
  bool operator==(const ActivityKey& other) const {
    return session_id == other.session_id && player_id == other.player_id;
  }
};

class ActivityStore {
 public:
  using Clock = std::chrono::system_clock;

  virtual ~ActivityStore() = default;

  virtual void Touch(const ActivityKey& key, Clock::time_point now, std::chrono::seconds warn_after,
                     std::chrono::seconds forfeit_after) = 0;
  virtual std::optional<Clock::time_point> LastActive(const ActivityKey& key) = 0;
  // 마감이 지난 항목을 꺼내며 지운다. 꺼낸 쪽만 그 항목을 처리한다.
  virtual std::vector<ActivityKey> PopDueWarnings(Clock::time_point now) = 0;
  virtual std::vector<ActivityKey> PopDueForfeits(Clock::time_point now) = 0;
  virtual void Clear(const ActivityKey& key) = 0;
};

class InMemoryActivityStore : public ActivityStore {
 public:
  void Touch(const ActivityKey& key, Clock::time_point now, std::chrono::seconds warn_after,
             std::chrono::seconds forfeit_after) override;
  std::optional<Clock::time_point> LastActive(const ActivityKey& key) override;
  std::vector<ActivityKey> PopDueWarnings(Clock::time_point now) override;
  std::vector<ActivityKey> PopDueForfeits(Clock::time_point now) override;
  void Clear(const ActivityKey& key) override;

 private:
  std::vector<ActivityKey> PopDue(std::map<ActivityKey, Clock::time_point>& deadlines, Clock::time_point now);

  std::map<ActivityKey, Clock::time_point> last_active_;
  std::map<ActivityKey, Clock::time_point> warning_deadlines_;
  std::map<ActivityKey, Clock::time_point> forfeit_deadlines_;
  std::mutex mutex_;
};

}  // namespace stakematch
