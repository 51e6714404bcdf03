/*
 * 설명: 스테이크별 FIFO 후보 목록과 processing 목록을 제공하는 공유 캐시 인터페이스와 인메모리 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/operational_queue_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace stakematch {

// 모든 메서드는 캐시를 쓸 수 없으면 CacheUnavailableError를 던진다.
class OperationalQueue {
 public:
  using Clock = std::chrono::system_clock;

  virtual ~OperationalQueue() = default;

  // 대기 목록의 가장 오래된 id를 processing 목록으로 옮기고 선점 시각을 남긴다. 단일 원자 연산이다.
  virtual std::optional<std::int64_t> PopAndStage(std::int64_t stake, Clock::time_point now) = 0;
  virtual void Push(std::int64_t stake, std::int64_t queue_id) = 0;
  // 다음 PopAndStage에서 먼저 꺼내지도록 되돌린다.
  virtual void Requeue(std::int64_t stake, std::int64_t queue_id) = 0;
  virtual bool Remove(std::int64_t stake, std::int64_t queue_id) = 0;
  virtual void ClearProcessing(std::int64_t stake, std::int64_t queue_id) = 0;
  virtual std::optional<Clock::time_point> ProcessingSince(std::int64_t stake, std::int64_t queue_id) = 0;
  // before 이전에 선점된 processing 항목을 (stake, id) 쌍으로 돌려준다.
  virtual std::vector<std::pair<std::int64_t, std::int64_t>> ListStaleProcessing(Clock::time_point before) = 0;
  // 목록이 비어 있을 때만 ids를 순서대로 채운다. 채웠으면 true.
  virtual bool PushAllIfEmpty(std::int64_t stake, const std::vector<std::int64_t>& queue_ids) = 0;
  virtual std::size_t Length(std::int64_t stake) = 0;
  virtual std::size_t TotalLength() = 0;
};

class InMemoryOperationalQueue : public OperationalQueue {
 public:
  std::optional<std::int64_t> PopAndStage(std::int64_t stake, Clock::time_point now) override;
  void Push(std::int64_t stake, std::int64_t queue_id) override;
  void Requeue(std::int64_t stake, std::int64_t queue_id) override;
  bool Remove(std::int64_t stake, std::int64_t queue_id) override;
  void ClearProcessing(std::int64_t stake, std::int64_t queue_id) override;
  std::optional<Clock::time_point> ProcessingSince(std::int64_t stake, std::int64_t queue_id) override;
  std::vector<std::pair<std::int64_t, std::int64_t>> ListStaleProcessing(Clock::time_point before) override;
  bool PushAllIfEmpty(std::int64_t stake, const std::vector<std::int64_t>& queue_ids) override;
  std::size_t Length(std::int64_t stake) override;
  std::size_t TotalLength() override;

  // 캐시 장애를 흉내 낸다. false면 이후 모든 호출이 예외를 던진다.
  void SetAvailable(bool available);
  std::size_t ProcessingCount(std::int64_t stake);

 private:
  struct Bucket {
    std::deque<std::int64_t> waiting;
    std::map<std::int64_t, Clock::time_point> processing;
  };

  void EnsureAvailable() const;

  std::map<std::int64_t, Bucket> buckets_;
  bool available_{true};
  std::mutex mutex_;
};

}  // namespace stakematch
