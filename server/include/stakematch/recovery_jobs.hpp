/*
 * 설명: 재시작 직후 재적재와 주기적 정리 작업(선점 고착, 대기열 만료)을 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/recovery_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "stakematch/notification_outbox.hpp"
#include "stakematch/observability.hpp"
#include "stakematch/operational_queue.hpp"
#include "stakematch/queue_repository.hpp"
#include "stakematch/session_lifecycle.hpp"
#include "stakematch/session_repository.hpp"

namespace stakematch {

class RecoveryJobs {
 public:
  RecoveryJobs(std::shared_ptr<QueueRepository> queue_repository, std::shared_ptr<SessionRepository> sessions,
               std::shared_ptr<OperationalQueue> operational_queue, std::shared_ptr<SessionLifecycleManager> lifecycle,
               std::shared_ptr<NotificationOutbox> outbox, std::shared_ptr<Observability> observability);

  // 스테이크별 캐시 목록이 비어 있을 때만 채운다. 반환값은 채운 항목 수.
  std::size_t RehydrateQueue();
  std::size_t RehydrateSessions();

  std::size_t SweepStuckProcessing(std::chrono::system_clock::time_point now, std::chrono::seconds visibility);
  // 만료는 환불을 만들지 않는다.
  std::size_t SweepExpiredQueue();

 private:
  std::size_t SweepOrphanedProcessing(std::chrono::system_clock::time_point now, std::chrono::seconds visibility);

  std::shared_ptr<QueueRepository> queue_repository_;
  std::shared_ptr<SessionRepository> sessions_;
  std::shared_ptr<OperationalQueue> operational_queue_;
  std::shared_ptr<SessionLifecycleManager> lifecycle_;
  std::shared_ptr<NotificationOutbox> outbox_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace stakematch
