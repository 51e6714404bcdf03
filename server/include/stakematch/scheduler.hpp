/*
 * 설명: 세션 만료, 연결 끊김, 유휴 감시, 대기열 만료, 선점 고착, 알림 전송 주기 작업을 타이머로 돌린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "stakematch/observability.hpp"

namespace stakematch {

class SweepScheduler : public std::enable_shared_from_this<SweepScheduler> {
 public:
  SweepScheduler(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability);

  // Start 이전에만 등록한다.
  void Add(std::string name, std::chrono::milliseconds interval, std::function<void()> work);
  void Start();
  void Stop();

 private:
  struct PeriodicTask {
    std::string name;
    std::chrono::milliseconds interval;
    std::function<void()> work;
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;

    PeriodicTask(boost::asio::io_context& ioc, std::string task_name, std::chrono::milliseconds every,
                 std::function<void()> fn)
        : name(std::move(task_name)), interval(every), work(std::move(fn)), strand(boost::asio::make_strand(ioc)),
          timer(ioc) {}
  };

  void Schedule(const std::shared_ptr<PeriodicTask>& task);
  void RunTask(const std::shared_ptr<PeriodicTask>& task);

  boost::asio::io_context& ioc_;
  std::shared_ptr<Observability> observability_;
  std::vector<std::shared_ptr<PeriodicTask>> tasks_;
  std::atomic<bool> running_{false};
};

}  // namespace stakematch
