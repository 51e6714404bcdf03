/*
 * 설명: 진행 중 세션의 휘발성 상태를 세대 검사 핸들로 관리하는 인프로세스 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stakematch {

enum class SessionStatus { kWaiting, kInProgress, kCompleted, kCancelled };

std::string ToString(SessionStatus status);
SessionStatus ParseSessionStatus(const std::string& text);

struct SessionHandle {
  std::uint32_t index{0};
  std::uint32_t generation{0};
};

struct LiveSession {
  std::int64_t session_id{0};
  std::string token;
  std::int64_t player1_id{0};
  std::int64_t player2_id{0};
  std::int64_t stake_amount{0};
  SessionStatus status{SessionStatus::kWaiting};
  std::optional<std::int64_t> current_turn_player_id;
  std::chrono::system_clock::time_point expiry_time;
  // 연결이 끊긴 플레이어와 끊긴 시각.
  std::unordered_map<std::int64_t, std::chrono::system_clock::time_point> disconnected_at;

  bool HasPlayer(std::int64_t player_id) const { return player_id == player1_id || player_id == player2_id; }
  std::int64_t OpponentOf(std::int64_t player_id) const { return player_id == player1_id ? player2_id : player1_id; }
};

struct DisconnectedPlayer {
  std::int64_t session_id;
  std::int64_t player_id;
  std::chrono::system_clock::time_point since;
};

class SessionRegistry {
 public:
  // 같은 session_id가 이미 있으면 기존 슬롯을 덮어쓴다.
  SessionHandle Register(LiveSession session);
  bool Release(SessionHandle handle);

  std::optional<LiveSession> Get(SessionHandle handle) const;
  std::optional<SessionHandle> FindBySession(std::int64_t session_id) const;
  std::optional<SessionHandle> FindByPlayer(std::int64_t player_id) const;
  bool Update(SessionHandle handle, const std::function<void(LiveSession&)>& mutate);

  bool MarkDisconnected(std::int64_t player_id, std::chrono::system_clock::time_point at);
  bool MarkConnected(std::int64_t player_id);
  std::vector<DisconnectedPlayer> DisconnectedBefore(std::chrono::system_clock::time_point cutoff) const;

  std::size_t ActiveCount() const;

 private:
  struct Slot {
    std::uint32_t generation{0};
    bool occupied{false};
    LiveSession session;
  };

  bool IsLive(SessionHandle handle) const;
  void ReleaseSlot(std::uint32_t index);

  std::vector<Slot> slots_;
  std::vector<std::uint32_t> free_list_;
  std::unordered_map<std::int64_t, std::uint32_t> by_session_;
  std::unordered_map<std::int64_t, std::uint32_t> by_player_;
  mutable std::mutex mutex_;
};

}  // namespace stakematch
