/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "stakematch/app.hpp"

int main() {
  using namespace stakematch;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "신호 " << signal_number << " 수신, 종료를 준비합니다\n";
      app.GetContext().stop();
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
