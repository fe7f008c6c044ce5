#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "util/base64.hpp"
#include "x402/challenge_parser.hpp"

namespace {

using autopay::x402::ChallengeDetails;
using autopay::x402::HeaderMap;
using autopay::x402::RequestContext;

constexpr const char* kUsdcPolygon = "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359";
constexpr const char* kUsdcAmoy = "0x41E94Eb019C0762f9Bfcf9Fb1E58725BfB0e7582";
constexpr const char* kSeller = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
constexpr const char* kLegacySeller = "0x1111111111111111111111111111111111111111";

const RequestContext kContext{"https://api.example.com", "/v1/quote", "GET"};

bool Near(double a, double b) { return std::fabs(a - b) < 1e-9; }

nlohmann::json DedicatedChallenge() {
  return {
      {"id", "chal-json"},
      {"amount", "25000"},
      {"chainId", 137},
      {"seller", kSeller},
      {"tokenAddress", kUsdcPolygon},
      {"token", "usdc"},
      {"amountUsd", 0.025},
  };
}

HeaderMap LegacyHeaders() {
  return {
      {"X-402-Amount", "0.5"},
      {"X-402-Token", "USDC"},
      {"X-402-Address", kLegacySeller},
      {"X-402-Token-Address", kUsdcPolygon},
      {"X-402-Chain", "137"},
      {"X-402-Amount-Atomic", "500000"},
  };
}

}  // namespace

int main() {
  try {
    using namespace autopay::x402;

    // Dedicated header wins over legacy headers on the same response.
    {
      HeaderMap headers = LegacyHeaders();
      headers["X-Payment-Challenge"] = DedicatedChallenge().dump();
      auto challenge = ParseChallenge(headers, std::nullopt, kContext);
      if (!challenge) {
        std::cerr << "Dedicated header challenge not parsed\n";
        return EXIT_FAILURE;
      }
      if (challenge->challenge_id != "chal-json" || challenge->amount_atomic != "25000" ||
          challenge->seller != kSeller || !Near(challenge->amount_usd, 0.025) ||
          challenge->token_symbol != "USDC" || challenge->chain_id != 137) {
        std::cerr << "Parsed values do not come from the dedicated header\n";
        return EXIT_FAILURE;
      }
      if (challenge->origin != kContext.origin || challenge->endpoint != kContext.endpoint ||
          challenge->method != "GET") {
        std::cerr << "Request context not carried into the challenge\n";
        return EXIT_FAILURE;
      }
    }

    // Base64-wrapped dedicated header, lower-case addresses normalized.
    {
      auto doc = DedicatedChallenge();
      doc["seller"] = "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23";
      doc["network"] = "eip155:80002";
      doc.erase("chainId");
      doc["tokenAddress"] = kUsdcAmoy;
      HeaderMap headers{{"x-payment-challenge", autopay::util::Base64Encode(doc.dump())}};
      auto challenge = ParseChallenge(headers, std::nullopt, kContext);
      if (!challenge || challenge->seller != kSeller || challenge->chain_id != 80002 ||
          challenge->network != std::optional<std::string>("eip155:80002")) {
        std::cerr << "Base64 challenge header not decoded\n";
        return EXIT_FAILURE;
      }
    }

    // WWW-Authenticate with direct parameters; USD estimated from the known token.
    {
      HeaderMap headers{{"WWW-Authenticate",
                         std::string("x402 seller=\"") + kSeller + "\", tokenAddress=" +
                             kUsdcPolygon + ", amountAtomic=\"10000\", chainId=137, id=auth-1"}};
      auto challenge = ParseChallenge(headers, std::nullopt, kContext);
      if (!challenge || challenge->challenge_id != "auth-1" || challenge->amount_atomic != "10000" ||
          !Near(challenge->amount_usd, 0.01)) {
        std::cerr << "WWW-Authenticate parameters not parsed\n";
        return EXIT_FAILURE;
      }
    }

    // WWW-Authenticate carrying a nested base64 challenge.
    {
      const std::string nested = autopay::util::Base64Encode(DedicatedChallenge().dump());
      HeaderMap headers{{"www-authenticate", "X402 realm=\"api\", challenge=\"" + nested + "\""}};
      auto challenge = ParseChallenge(headers, std::nullopt, kContext);
      if (!challenge || challenge->challenge_id != "chal-json") {
        std::cerr << "Nested WWW-Authenticate challenge not parsed\n";
        return EXIT_FAILURE;
      }
    }

    // Other auth schemes are ignored.
    {
      HeaderMap headers{{"WWW-Authenticate", "Bearer realm=\"api\""}};
      if (ParseChallenge(headers, std::nullopt, kContext)) {
        std::cerr << "Bearer challenge mistaken for x402\n";
        return EXIT_FAILURE;
      }
    }

    // Legacy headers alone; the X-402-Id header supplies the id.
    {
      HeaderMap headers = LegacyHeaders();
      headers["X-402-Id"] = "legacy-7";
      auto challenge = ParseChallenge(headers, std::nullopt, kContext);
      if (!challenge || challenge->challenge_id != "legacy-7" ||
          challenge->amount_atomic != "500000" || !Near(challenge->amount_usd, 0.5) ||
          challenge->seller != kLegacySeller) {
        std::cerr << "Legacy headers not parsed\n";
        return EXIT_FAILURE;
      }
    }

    // Legacy headers without an id get a random UUID.
    {
      auto a = ParseChallenge(LegacyHeaders(), std::nullopt, kContext);
      auto b = ParseChallenge(LegacyHeaders(), std::nullopt, kContext);
      if (!a || !b || a->challenge_id.size() != 36 || a->challenge_id == b->challenge_id) {
        std::cerr << "Fallback ids should be distinct UUIDs\n";
        return EXIT_FAILURE;
      }
    }

    // JSON body with an accepts array: first exact entry, hex amount.
    {
      const nlohmann::json body = {
          {"x402Version", 1},
          {"accepts",
           {{{"scheme", "upto"}, {"network", "eip155:137"}, {"maxAmountRequired", "1"}},
            {{"scheme", "exact"},
             {"network", "eip155:80002"},
             {"maxAmountRequired", "0x2710"},
             {"asset", kUsdcAmoy},
             {"payTo", kSeller},
             {"extra", {{"name", "USDC"}, {"version", "2"}, {"decimals", 6}}}}}},
      };
      HeaderMap headers{{"Content-Type", "application/json; charset=utf-8"}};
      auto challenge = ParseChallenge(headers, body.dump(), kContext);
      if (!challenge) {
        std::cerr << "Accepts body not parsed\n";
        return EXIT_FAILURE;
      }
      if (challenge->amount_atomic != "10000" || challenge->chain_id != 80002 ||
          challenge->token_address != kUsdcAmoy || challenge->token_name != std::optional<std::string>("USDC") ||
          challenge->protocol_version != std::optional<int>(1) || !Near(challenge->amount_usd, 0.01)) {
        std::cerr << "Accepts body fields wrong\n";
        return EXIT_FAILURE;
      }
      // Same body under a non-JSON content type is not considered.
      HeaderMap text{{"Content-Type", "text/html"}};
      if (ParseChallenge(text, body.dump(), kContext)) {
        std::cerr << "Non-JSON body parsed\n";
        return EXIT_FAILURE;
      }
    }

    // Seller falls back to extra.recipientAddress.
    {
      const nlohmann::json body = {
          {"accepts",
           {{{"scheme", "exact"},
             {"amount", 42},
             {"asset", kUsdcPolygon},
             {"extra", {{"recipientAddress", kSeller}}}}}},
      };
      auto challenge =
          ParseChallenge({{"content-type", "application/json"}}, body.dump(), kContext);
      if (!challenge || challenge->seller != kSeller || challenge->chain_id != 137 ||
          challenge->amount_atomic != "42") {
        std::cerr << "recipientAddress fallback failed\n";
        return EXIT_FAILURE;
      }
    }

    // Structurally invalid records are absent.
    {
      auto doc = DedicatedChallenge();
      doc["seller"] = "";
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Empty seller accepted\n";
        return EXIT_FAILURE;
      }
      doc = DedicatedChallenge();
      doc["tokenAddress"] = "0x3C499c542cEF5E3811e1192ce70d8cC03d5c3359";  // bad checksum
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Bad checksum accepted\n";
        return EXIT_FAILURE;
      }
      doc = DedicatedChallenge();
      doc["amount"] = "12.5";
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Fractional atomic amount accepted\n";
        return EXIT_FAILURE;
      }
      if (ParseChallenge({{"x-payment-challenge", "not json at all"}}, std::nullopt, kContext)) {
        std::cerr << "Garbage header accepted\n";
        return EXIT_FAILURE;
      }
      if (ParseChallenge({}, std::string("{}"), kContext)) {
        std::cerr << "Empty response produced a challenge\n";
        return EXIT_FAILURE;
      }
    }

    // Out-of-range numbers are rejected before any integer conversion.
    {
      auto doc = DedicatedChallenge();
      doc["chainId"] = 1e30;
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Huge numeric chainId accepted\n";
        return EXIT_FAILURE;
      }
      doc["chainId"] = "1e30";
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Huge textual chainId accepted\n";
        return EXIT_FAILURE;
      }
      doc = DedicatedChallenge();
      doc["tokenDecimals"] = 1e20;
      if (ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext)) {
        std::cerr << "Huge tokenDecimals accepted\n";
        return EXIT_FAILURE;
      }

      HeaderMap legacy = LegacyHeaders();
      legacy["X-402-Chain"] = "1e30";
      auto fallback = ParseChallenge(legacy, std::nullopt, kContext);
      if (!fallback || fallback->chain_id != 137) {
        std::cerr << "Unusable legacy chain did not fall back to the default\n";
        return EXIT_FAILURE;
      }

      const nlohmann::json body = {
          {"accepts",
           {{{"scheme", "exact"},
             {"network", "eip155:137"},
             {"maxAmountRequired", "1000"},
             {"asset", kUsdcPolygon},
             {"payTo", kSeller},
             {"extra", {{"decimals", 1e20}}}}}},
      };
      if (ParseChallenge({{"content-type", "application/json"}}, body.dump(), kContext)) {
        std::cerr << "Huge body decimals accepted\n";
        return EXIT_FAILURE;
      }

      auto valid = ParseChallenge(LegacyHeaders(), std::nullopt, kContext);
      if (!valid) {
        std::cerr << "Legacy challenge not parsed\n";
        return EXIT_FAILURE;
      }
      ChallengeDetails copy;
      std::string error;
      auto as_json = ChallengeToJson(*valid);
      as_json["chain_id"] = 1e30;
      if (ChallengeFromJson(as_json, &copy, &error)) {
        std::cerr << "Floating chain_id accepted across the boundary\n";
        return EXIT_FAILURE;
      }
      as_json = ChallengeToJson(*valid);
      as_json["token_decimals"] = 1e20;
      if (ChallengeFromJson(as_json, &copy, &error)) {
        std::cerr << "Floating token_decimals accepted across the boundary\n";
        return EXIT_FAILURE;
      }
    }

    // A challenge document reporting an upstream error with no options.
    {
      auto doc = DedicatedChallenge();
      doc["error"] = "facilitator unavailable";
      auto challenge = ParseChallenge({{"x-payment-challenge", doc.dump()}}, std::nullopt, kContext);
      if (!challenge || !IsUpstreamError(*challenge)) {
        std::cerr << "Upstream error not detected\n";
        return EXIT_FAILURE;
      }
      auto clean = ParseChallenge({{"x-payment-challenge", DedicatedChallenge().dump()}},
                                  std::nullopt, kContext);
      if (!clean || IsUpstreamError(*clean)) {
        std::cerr << "Clean challenge flagged as upstream error\n";
        return EXIT_FAILURE;
      }
    }

    // Challenges survive the message boundary unchanged.
    {
      auto challenge = ParseChallenge(LegacyHeaders(), std::nullopt, kContext);
      ChallengeDetails copy;
      std::string error;
      if (!challenge || !ChallengeFromJson(ChallengeToJson(*challenge), &copy, &error) ||
          copy.challenge_id != challenge->challenge_id || copy.seller != challenge->seller ||
          copy.amount_atomic != challenge->amount_atomic) {
        std::cerr << "Challenge JSON round trip failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      auto tampered = ChallengeToJson(*challenge);
      tampered["seller"] = "0xnot-an-address";
      if (ChallengeFromJson(tampered, &copy, &error)) {
        std::cerr << "Tampered challenge accepted across the boundary\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "challenge_parser_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
