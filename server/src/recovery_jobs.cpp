/*
 * 설명: 대기열/세션 재적재와 선점 고착 복구, 대기열 만료 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/recovery_it_test.cpp
 */
#include "stakematch/recovery_jobs.hpp"

#include <map>
#include <utility>
#include <vector>

#include "stakematch/errors.hpp"

namespace stakematch {

RecoveryJobs::RecoveryJobs(std::shared_ptr<QueueRepository> queue_repository,
                           std::shared_ptr<SessionRepository> sessions,
                           std::shared_ptr<OperationalQueue> operational_queue,
                           std::shared_ptr<SessionLifecycleManager> lifecycle,
                           std::shared_ptr<NotificationOutbox> outbox, std::shared_ptr<Observability> observability)
    : queue_repository_(std::move(queue_repository)), sessions_(std::move(sessions)),
      operational_queue_(std::move(operational_queue)), lifecycle_(std::move(lifecycle)), outbox_(std::move(outbox)),
      observability_(std::move(observability)) {}

std::size_t RecoveryJobs::RehydrateQueue() {
  std::map<std::int64_t, std::vector<std::int64_t>> by_stake;
  for (const auto& entry : queue_repository_->ListRehydratable()) {
    by_stake[entry.stake_amount].push_back(entry.id);
  }
  std::size_t pushed = 0;
  for (const auto& [stake, ids] : by_stake) {
    try {
      if (operational_queue_->PushAllIfEmpty(stake, ids)) {
        pushed += ids.size();
      }
    } catch (const CacheUnavailableError& ex) {
      observability_->Error("recovery.queue_rehydrate_failed", {{"stake", stake}, {"error", ex.what()}});
    }
  }
  observability_->Info("recovery.queue_rehydrated", {{"entries", pushed}, {"stakes", by_stake.size()}});
  return pushed;
}

std::size_t RecoveryJobs::RehydrateSessions() {
  auto active = sessions_->ListActive();
  for (const auto& record : active) {
    lifecycle_->Track(record);
  }
  observability_->Info("recovery.sessions_rehydrated", {{"sessions", active.size()}});
  return active.size();
}

std::size_t RecoveryJobs::SweepStuckProcessing(std::chrono::system_clock::time_point now,
                                               std::chrono::seconds visibility) {
  std::size_t recovered = 0;
  for (const auto& entry : queue_repository_->ListStuckMatching()) {
    try {
      std::optional<std::chrono::system_clock::time_point> since;
      try {
        since = operational_queue_->ProcessingSince(entry.stake_amount, entry.id);
      } catch (const CacheUnavailableError& ex) {
        observability_->Warn("recovery.processing_lookup_failed", {{"queueId", entry.id}, {"error", ex.what()}});
      }
      // 캐시가 선점 기록을 잃었으면 DB의 claimed_at을 기준으로 본다.
      if (!since) {
        since = entry.claimed_at;
      }
      if (since && now - *since < visibility) {
        continue;
      }
      if (!queue_repository_->ResetToQueued(entry.id)) {
        continue;
      }
      ++recovered;
      if (entry.is_private) {
        continue;
      }
      try {
        operational_queue_->ClearProcessing(entry.stake_amount, entry.id);
        operational_queue_->Requeue(entry.stake_amount, entry.id);
      } catch (const CacheUnavailableError& ex) {
        observability_->Warn("recovery.requeue_failed", {{"queueId", entry.id}, {"error", ex.what()}});
      }
      observability_->Info("recovery.stuck_reset", {{"queueId", entry.id}, {"stake", entry.stake_amount}});
    } catch (const std::exception& ex) {
      observability_->Error("recovery.stuck_item_failed", {{"queueId", entry.id}, {"error", ex.what()}});
    }
  }
  recovered += SweepOrphanedProcessing(now, visibility);
  return recovered;
}

std::size_t RecoveryJobs::SweepOrphanedProcessing(std::chrono::system_clock::time_point now,
                                                  std::chrono::seconds visibility) {
  std::vector<std::pair<std::int64_t, std::int64_t>> stale;
  try {
    stale = operational_queue_->ListStaleProcessing(now - visibility);
  } catch (const CacheUnavailableError& ex) {
    observability_->Warn("recovery.processing_scan_failed", {{"error", ex.what()}});
    return 0;
  }
  // DB 선점 없이 processing에만 남은 항목. matching 행은 위의 선점 복구가 맡는다.
  std::size_t recovered = 0;
  for (const auto& [stake, queue_id] : stale) {
    try {
      auto entry = queue_repository_->Find(queue_id);
      if (entry && entry->status == QueueStatus::kMatching) {
        continue;
      }
      if (entry && entry->status == QueueStatus::kQueued) {
        operational_queue_->Requeue(stake, queue_id);
        ++recovered;
        observability_->Info("recovery.orphan_requeued", {{"queueId", queue_id}, {"stake", stake}});
      } else {
        operational_queue_->ClearProcessing(stake, queue_id);
      }
    } catch (const std::exception& ex) {
      observability_->Error("recovery.orphan_item_failed", {{"queueId", queue_id}, {"error", ex.what()}});
    }
  }
  return recovered;
}

std::size_t RecoveryJobs::SweepExpiredQueue() {
  std::size_t expired = 0;
  for (auto queue_id : queue_repository_->ListExpiredIds()) {
    try {
      auto entry = queue_repository_->Find(queue_id);
      if (!entry || !queue_repository_->Expire(queue_id)) {
        continue;
      }
      ++expired;
      if (!entry->is_private) {
        try {
          operational_queue_->Remove(entry->stake_amount, queue_id);
        } catch (const CacheUnavailableError& ex) {
          observability_->Warn("queue.cache_remove_failed", {{"queueId", queue_id}, {"error", ex.what()}});
        }
      }
      outbox_->Enqueue(OutboundEvent{"queue_expired",
                                     {entry->player_id},
                                     {{"queueId", queue_id}, {"stake", entry->stake_amount}}});
      observability_->Info("queue.expired", {{"queueId", queue_id}, {"playerId", entry->player_id}});
    } catch (const std::exception& ex) {
      observability_->Error("queue.expire_failed", {{"queueId", queue_id}, {"error", ex.what()}});
    }
  }
  return expired;
}

}  // namespace stakematch
