/*
 * 설명: 주기 작업을 작업별 strand 위 steady_timer로 반복 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/queue_flow_test.cpp
 */
#include "stakematch/scheduler.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace stakematch {

SweepScheduler::SweepScheduler(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability)
    : ioc_(ioc), observability_(std::move(observability)) {}

void SweepScheduler::Add(std::string name, std::chrono::milliseconds interval, std::function<void()> work) {
  tasks_.push_back(std::make_shared<PeriodicTask>(ioc_, std::move(name), interval, std::move(work)));
}

void SweepScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (const auto& task : tasks_) {
    Schedule(task);
  }
}

void SweepScheduler::Stop() {
  running_ = false;
  for (const auto& task : tasks_) {
    boost::asio::post(task->strand, [task]() { task->timer.cancel(); });
  }
}

void SweepScheduler::Schedule(const std::shared_ptr<PeriodicTask>& task) {
  task->timer.expires_after(task->interval);
  auto self = shared_from_this();
  task->timer.async_wait(boost::asio::bind_executor(task->strand, [self, task](const boost::system::error_code& ec) {
    if (!ec && self->running_) {
      self->RunTask(task);
    }
  }));
}

void SweepScheduler::RunTask(const std::shared_ptr<PeriodicTask>& task) {
  try {
    task->work();
  } catch (const std::exception& ex) {
    observability_->Error("scheduler.task_failed", {{"task", task->name}, {"error", ex.what()}});
  }
  if (running_) {
    Schedule(task);
  }
}

}  // namespace stakematch
