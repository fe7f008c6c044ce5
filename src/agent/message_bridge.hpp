#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include "agent/commands.hpp"
#include "x402/interceptor.hpp"

namespace autopay::agent {

class Orchestrator;

constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};

// Hands commands to a single orchestration thread. Each request carries a
// correlation id; the caller waits for its own reply or gives up after the
// timeout. A request that times out before it started is withdrawn, one that
// already started runs to completion and its reply is discarded.
class MessageBridge {
 public:
  explicit MessageBridge(Orchestrator& orchestrator,
                         std::chrono::milliseconds timeout = kDefaultRequestTimeout);
  ~MessageBridge();

  MessageBridge(const MessageBridge&) = delete;
  MessageBridge& operator=(const MessageBridge&) = delete;

  void Start();
  // Stops the worker and fails every waiting caller. Queued requests are
  // dropped unexecuted.
  void Disconnect();
  bool Connected() const;

  std::optional<Reply> Send(Command command, std::string* error = nullptr);

 private:
  struct Request {
    std::uint64_t id{0};
    Command command;
  };
  struct Outcome {
    std::optional<Reply> reply;
    std::string error;
  };

  void WorkerLoop();

  Orchestrator& orchestrator_;
  std::chrono::milliseconds timeout_;
  mutable std::mutex mutex_;
  std::condition_variable request_cv_;
  std::condition_variable reply_cv_;
  std::deque<Request> queue_;
  std::map<std::uint64_t, Outcome> outcomes_;
  std::set<std::uint64_t> abandoned_;
  std::uint64_t next_id_{1};
  bool running_{false};
  std::thread worker_;
};

// ChallengeSink for an interceptor living in the same process as the agent.
class BridgeChallengeSink final : public x402::ChallengeSink {
 public:
  explicit BridgeChallengeSink(MessageBridge& bridge) : bridge_(bridge) {}

  std::optional<x402::ChallengeResolution> Submit(const x402::ChallengeDetails& challenge,
                                                  std::optional<int> tab_id) override;
  std::optional<x402::ChallengeResolution> PollResolution(
      const std::string& challenge_id) override;
  bool ReportSettlement(const x402::SettlementNotice& notice) override;

 private:
  MessageBridge& bridge_;
};

}  // namespace autopay::agent
