/*
 * 설명: 세션 슬롯 아레나와 세션/플레이어 색인을 하나의 뮤텍스로 보호한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "stakematch/session_registry.hpp"

#include <stdexcept>

namespace stakematch {

std::string ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kWaiting:
      return "WAITING";
    case SessionStatus::kInProgress:
      return "IN_PROGRESS";
    case SessionStatus::kCompleted:
      return "COMPLETED";
    case SessionStatus::kCancelled:
      return "CANCELLED";
  }
  return "WAITING";
}

SessionStatus ParseSessionStatus(const std::string& text) {
  if (text == "WAITING") {
    return SessionStatus::kWaiting;
  }
  if (text == "IN_PROGRESS") {
    return SessionStatus::kInProgress;
  }
  if (text == "COMPLETED") {
    return SessionStatus::kCompleted;
  }
  if (text == "CANCELLED") {
    return SessionStatus::kCancelled;
  }
  throw std::invalid_argument("알 수 없는 세션 상태: " + text);
}

SessionHandle SessionRegistry::Register(LiveSession session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = by_session_.find(session.session_id);
  if (existing != by_session_.end()) {
    ReleaseSlot(existing->second);
  }

  std::uint32_t index = 0;
  if (!free_list_.empty()) {
    index = free_list_.back();
    free_list_.pop_back();
  } else {
    index = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  Slot& slot = slots_[index];
  slot.occupied = true;
  slot.session = std::move(session);
  by_session_[slot.session.session_id] = index;
  by_player_[slot.session.player1_id] = index;
  by_player_[slot.session.player2_id] = index;
  return SessionHandle{index, slot.generation};
}

bool SessionRegistry::Release(SessionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!IsLive(handle)) {
    return false;
  }
  ReleaseSlot(handle.index);
  return true;
}

void SessionRegistry::ReleaseSlot(std::uint32_t index) {
  Slot& slot = slots_[index];
  by_session_.erase(slot.session.session_id);
  for (std::int64_t player_id : {slot.session.player1_id, slot.session.player2_id}) {
    auto it = by_player_.find(player_id);
    // 같은 플레이어가 이후 세션에 다시 색인됐으면 그대로 둔다.
    if (it != by_player_.end() && it->second == index) {
      by_player_.erase(it);
    }
  }
  slot.occupied = false;
  slot.session = LiveSession{};
  ++slot.generation;
  free_list_.push_back(index);
}

bool SessionRegistry::IsLive(SessionHandle handle) const {
  return handle.index < slots_.size() && slots_[handle.index].occupied &&
         slots_[handle.index].generation == handle.generation;
}

std::optional<LiveSession> SessionRegistry::Get(SessionHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!IsLive(handle)) {
    return std::nullopt;
  }
  return slots_[handle.index].session;
}

std::optional<SessionHandle> SessionRegistry::FindBySession(std::int64_t session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_session_.find(session_id);
  if (it == by_session_.end()) {
    return std::nullopt;
  }
  return SessionHandle{it->second, slots_[it->second].generation};
}

std::optional<SessionHandle> SessionRegistry::FindByPlayer(std::int64_t player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_player_.find(player_id);
  if (it == by_player_.end()) {
    return std::nullopt;
  }
  return SessionHandle{it->second, slots_[it->second].generation};
}

bool SessionRegistry::Update(SessionHandle handle, const std::function<void(LiveSession&)>& mutate) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!IsLive(handle)) {
    return false;
  }
  mutate(slots_[handle.index].session);
  return true;
}

bool SessionRegistry::MarkDisconnected(std::int64_t player_id, std::chrono::system_clock::time_point at) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_player_.find(player_id);
  if (it == by_player_.end()) {
    return false;
  }
  // 이미 끊긴 상태면 최초 시각을 유지한다.
  slots_[it->second].session.disconnected_at.emplace(player_id, at);
  return true;
}

bool SessionRegistry::MarkConnected(std::int64_t player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_player_.find(player_id);
  if (it == by_player_.end()) {
    return false;
  }
  slots_[it->second].session.disconnected_at.erase(player_id);
  return true;
}

std::vector<DisconnectedPlayer> SessionRegistry::DisconnectedBefore(std::chrono::system_clock::time_point cutoff) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DisconnectedPlayer> result;
  for (const auto& slot : slots_) {
    if (!slot.occupied || slot.session.status != SessionStatus::kInProgress) {
      continue;
    }
    for (const auto& entry : slot.session.disconnected_at) {
      if (entry.second <= cutoff) {
        result.push_back(DisconnectedPlayer{slot.session.session_id, entry.first, entry.second});
      }
    }
  }
  return result;
}

std::size_t SessionRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& slot : slots_) {
    if (slot.occupied &&
        (slot.session.status == SessionStatus::kWaiting || slot.session.status == SessionStatus::kInProgress)) {
      ++count;
    }
  }
  return count;
}

}  // namespace stakematch
