#include "agent/message_bridge.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "agent/orchestrator.hpp"
#include "util/logging.hpp"

namespace autopay::agent {

MessageBridge::MessageBridge(Orchestrator& orchestrator, std::chrono::milliseconds timeout)
    : orchestrator_(orchestrator), timeout_(timeout) {}

MessageBridge::~MessageBridge() { Disconnect(); }

void MessageBridge::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this]() { WorkerLoop(); });
}

void MessageBridge::Disconnect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    queue_.clear();
  }
  request_cv_.notify_all();
  reply_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  outcomes_.clear();
  abandoned_.clear();
}

bool MessageBridge::Connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::optional<Reply> MessageBridge::Send(Command command, std::string* error) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!running_) {
    if (error) {
      *error = "agent disconnected";
    }
    return std::nullopt;
  }
  const std::uint64_t id = next_id_++;
  queue_.push_back(Request{id, std::move(command)});
  request_cv_.notify_one();

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  const bool done = reply_cv_.wait_until(
      lock, deadline, [&]() { return !running_ || outcomes_.count(id) != 0; });

  auto it = outcomes_.find(id);
  if (it != outcomes_.end()) {
    Outcome outcome = std::move(it->second);
    outcomes_.erase(it);
    if (!outcome.reply && error) {
      *error = outcome.error;
    }
    return std::move(outcome.reply);
  }
  if (!running_) {
    if (error) {
      *error = "agent disconnected";
    }
    return std::nullopt;
  }
  if (!done) {
    auto queued = std::find_if(queue_.begin(), queue_.end(),
                               [id](const Request& request) { return request.id == id; });
    if (queued != queue_.end()) {
      queue_.erase(queued);
    } else {
      abandoned_.insert(id);
    }
  }
  if (error) {
    *error = "agent request timed out";
  }
  return std::nullopt;
}

void MessageBridge::WorkerLoop() {
  while (true) {
    Request request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      request_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (!running_) {
        return;
      }
      request = std::move(queue_.front());
      queue_.pop_front();
    }

    Outcome outcome;
    try {
      outcome.reply = orchestrator_.Execute(request.command);
    } catch (const std::exception& ex) {
      util::LogError(std::string("agent command failed: ") + ex.what());
      outcome.error = std::string("internal error: ") + ex.what();
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (abandoned_.erase(request.id) != 0) {
        util::LogWarn("discarding reply for a request that timed out");
        continue;
      }
      outcomes_[request.id] = std::move(outcome);
    }
    reply_cv_.notify_all();
  }
}

std::optional<x402::ChallengeResolution> BridgeChallengeSink::Submit(
    const x402::ChallengeDetails& challenge, std::optional<int> tab_id) {
  std::string error;
  auto reply = bridge_.Send(SubmitChallenge{challenge, tab_id}, &error);
  if (!reply) {
    util::LogWarn("challenge " + challenge.challenge_id + " not delivered: " + error);
    return std::nullopt;
  }
  if (auto* resolution = std::get_if<x402::ChallengeResolution>(&*reply)) {
    return *resolution;
  }
  return std::nullopt;
}

std::optional<x402::ChallengeResolution> BridgeChallengeSink::PollResolution(
    const std::string& challenge_id) {
  auto reply = bridge_.Send(agent::PollResolution{challenge_id});
  if (!reply) {
    return std::nullopt;
  }
  if (auto* polled = std::get_if<ResolutionReply>(&*reply)) {
    return polled->resolution;
  }
  return std::nullopt;
}

bool BridgeChallengeSink::ReportSettlement(const x402::SettlementNotice& notice) {
  auto reply = bridge_.Send(agent::ReportSettlement{notice});
  if (!reply) {
    return false;
  }
  const auto* ack = std::get_if<AckReply>(&*reply);
  return ack && ack->ok;
}

}  // namespace autopay::agent
