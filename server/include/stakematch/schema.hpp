/*
 * 설명: 매칭/원장/세션 테이블을 멱등하게 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#pragma once

#include <memory>

#include "stakematch/db_client.hpp"

namespace stakematch {

void EnsureSchema(const MariaDbClient& db_client);

// 통합 테스트 전용: 모든 데이터를 비운다.
void TruncateAll(const MariaDbClient& db_client);

}  // namespace stakematch
