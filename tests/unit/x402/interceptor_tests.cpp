#include <chrono>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "x402/interceptor.hpp"

namespace {

using namespace autopay::x402;

constexpr const char* kSeller = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
constexpr const char* kUsdcPolygon = "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359";

const RequestContext kContext{"https://api.example.com", "/v1/data", "GET"};

class ScriptedSink final : public ChallengeSink {
 public:
  std::optional<ChallengeResolution> submit_reply;
  std::deque<std::optional<ChallengeResolution>> poll_replies;
  std::vector<ChallengeDetails> submitted;
  std::vector<SettlementNotice> settlements;
  int polls{0};

  std::optional<ChallengeResolution> Submit(const ChallengeDetails& challenge,
                                            std::optional<int>) override {
    submitted.push_back(challenge);
    return submit_reply;
  }
  std::optional<ChallengeResolution> PollResolution(const std::string&) override {
    ++polls;
    if (poll_replies.empty()) {
      return std::nullopt;
    }
    auto next = poll_replies.front();
    poll_replies.pop_front();
    return next;
  }
  bool ReportSettlement(const SettlementNotice& notice) override {
    settlements.push_back(notice);
    return true;
  }
};

ObservedResponse PaymentRequired(const std::string& id = "chal-1") {
  ObservedResponse response;
  response.status = 402;
  response.headers["X-Payment-Challenge"] = nlohmann::json{{"id", id},
                                                           {"amount", "10000"},
                                                           {"chainId", 137},
                                                           {"seller", kSeller},
                                                           {"tokenAddress", kUsdcPolygon}}
                                                .dump();
  response.body = "payment required";
  return response;
}

ChallengeResolution RetryWith(const std::string& id) {
  ChallengeResolution resolution;
  resolution.action = ResolutionAction::kRetry;
  resolution.challenge_id = id;
  resolution.retry_headers = {{kPaymentHeader, "c2lnbmVk"}, {kPaymentIdHeader, id}};
  return resolution;
}

InterceptorOptions FastOptions() {
  InterceptorOptions options;
  options.poll_interval = std::chrono::milliseconds(1);
  options.pending_timeout = std::chrono::milliseconds(500);
  return options;
}

}  // namespace

int main() {
  try {
    const std::string kTx = "0xabc123";
    HeaderMap sent;
    int retries = 0;
    auto retry = [&](const HeaderMap& extra) -> std::optional<ObservedResponse> {
      ++retries;
      sent = extra;
      ObservedResponse ok;
      ok.status = 200;
      ok.headers["X-PAYMENT-RESPONSE"] = nlohmann::json{{"transaction", kTx}}.dump();
      ok.body = "paid content";
      return ok;
    };

    // Non-402 responses are untouched and nothing is submitted.
    {
      ScriptedSink sink;
      Interceptor interceptor(sink, FastOptions());
      ObservedResponse ok;
      ok.status = 200;
      auto result = interceptor.Handle(kContext, ok, retry);
      if (result.outcome != InterceptOutcome::kPassThrough || !sink.submitted.empty()) {
        std::cerr << "Non-402 response was intercepted\n";
        return EXIT_FAILURE;
      }
    }

    // A 402 without a recognizable challenge passes through.
    {
      ScriptedSink sink;
      Interceptor interceptor(sink, FastOptions());
      ObservedResponse bare;
      bare.status = 402;
      bare.body = "pay up";
      auto result = interceptor.Handle(kContext, bare, retry);
      if (result.outcome != InterceptOutcome::kPassThrough || result.response.body != bare.body ||
          !sink.submitted.empty()) {
        std::cerr << "Unparseable 402 should pass through\n";
        return EXIT_FAILURE;
      }
    }

    // Upstream errors pass through without being submitted.
    {
      ScriptedSink sink;
      Interceptor interceptor(sink, FastOptions());
      auto response = PaymentRequired();
      auto doc = nlohmann::json::parse(response.headers["X-Payment-Challenge"]);
      doc["error"] = "facilitator down";
      response.headers["X-Payment-Challenge"] = doc.dump();
      auto result = interceptor.Handle(kContext, response, retry);
      if (result.outcome != InterceptOutcome::kPassThrough || !sink.submitted.empty()) {
        std::cerr << "Upstream error was submitted\n";
        return EXIT_FAILURE;
      }
    }

    // Immediate retry: headers forwarded, settlement reported.
    {
      ScriptedSink sink;
      sink.submit_reply = RetryWith("chal-1");
      Interceptor interceptor(sink, FastOptions());
      retries = 0;
      auto result = interceptor.Handle(kContext, PaymentRequired(), retry);
      if (result.outcome != InterceptOutcome::kRetried || result.response.status != 200 ||
          retries != 1) {
        std::cerr << "Retry resolution did not retry\n";
        return EXIT_FAILURE;
      }
      if (sent.at(kPaymentHeader) != "c2lnbmVk" || sent.at(kPaymentIdHeader) != "chal-1") {
        std::cerr << "Retry headers not forwarded\n";
        return EXIT_FAILURE;
      }
      if (sink.settlements.size() != 1 ||
          sink.settlements[0].payment_id != std::optional<std::string>("chal-1") ||
          sink.settlements[0].tx_hash != kTx) {
        std::cerr << "Settlement not reported after the paid retry\n";
        return EXIT_FAILURE;
      }
    }

    // Deny and error hand back the original response.
    for (auto action : {ResolutionAction::kDeny, ResolutionAction::kError}) {
      ScriptedSink sink;
      ChallengeResolution resolution;
      resolution.action = action;
      sink.submit_reply = resolution;
      Interceptor interceptor(sink, FastOptions());
      retries = 0;
      auto result = interceptor.Handle(kContext, PaymentRequired(), retry);
      if (result.outcome != InterceptOutcome::kPassThrough || result.response.status != 402 ||
          retries != 0) {
        std::cerr << "Declined challenge was retried\n";
        return EXIT_FAILURE;
      }
    }

    // A failed submit (timeout or disconnect) is not retried.
    {
      ScriptedSink sink;
      Interceptor interceptor(sink, FastOptions());
      retries = 0;
      auto result = interceptor.Handle(kContext, PaymentRequired(), retry);
      if (result.outcome != InterceptOutcome::kPassThrough || retries != 0 ||
          sink.submitted.size() != 1) {
        std::cerr << "Failed submit should pass through exactly once\n";
        return EXIT_FAILURE;
      }
    }

    // Pending: waits for the prompt decision, then retries.
    {
      ScriptedSink sink;
      ChallengeResolution pending;
      pending.action = ResolutionAction::kPending;
      pending.challenge_id = "chal-2";
      sink.submit_reply = pending;
      sink.poll_replies = {std::nullopt, pending, RetryWith("chal-2")};
      Interceptor interceptor(sink, FastOptions());
      retries = 0;
      auto result = interceptor.Handle(kContext, PaymentRequired("chal-2"), retry);
      if (result.outcome != InterceptOutcome::kRetried || retries != 1 || sink.polls != 3) {
        std::cerr << "Pending challenge not retried after approval\n";
        return EXIT_FAILURE;
      }
    }

    // Pending that is denied returns the original response.
    {
      ScriptedSink sink;
      ChallengeResolution pending;
      pending.action = ResolutionAction::kPending;
      sink.submit_reply = pending;
      ChallengeResolution deny;
      deny.action = ResolutionAction::kDeny;
      sink.poll_replies = {deny};
      Interceptor interceptor(sink, FastOptions());
      retries = 0;
      auto result = interceptor.Handle(kContext, PaymentRequired(), retry);
      if (result.outcome != InterceptOutcome::kPassThrough || retries != 0) {
        std::cerr << "Denied pending challenge was retried\n";
        return EXIT_FAILURE;
      }
    }

    // A failed paid retry reports no settlement.
    {
      ScriptedSink sink;
      sink.submit_reply = RetryWith("chal-3");
      Interceptor interceptor(sink, FastOptions());
      auto failing = [](const HeaderMap&) -> std::optional<ObservedResponse> {
        ObservedResponse response;
        response.status = 500;
        return response;
      };
      auto result = interceptor.Handle(kContext, PaymentRequired("chal-3"), failing);
      if (result.outcome != InterceptOutcome::kRetried || result.response.status != 500 ||
          !sink.settlements.empty()) {
        std::cerr << "Unsuccessful retry should not be reported as settled\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "interceptor_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
