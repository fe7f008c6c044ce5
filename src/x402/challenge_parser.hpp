#pragma once

#include <optional>
#include <string>

#include "x402/challenge.hpp"

namespace autopay::x402 {

// Recognizes a 402 challenge in a response. Encodings are tried in order and
// the first structurally valid record wins:
//   1. X-Payment-Challenge header (JSON or base64 JSON)
//   2. WWW-Authenticate: x402 k=v, ...
//   3. legacy flat X-402-* / X-Payment-* headers
//   4. JSON body carrying an "accepts" array (first "exact" entry)
// Absent means "not a challenge we understand"; the caller must hand the
// original response back untouched.
std::optional<ChallengeDetails> ParseChallenge(const HeaderMap& headers,
                                               const std::optional<std::string>& body,
                                               const RequestContext& context);

std::optional<ChallengeDetails> ParseChallengeHeaders(const HeaderMap& headers,
                                                      const RequestContext& context);

std::optional<ChallengeDetails> ParseChallengeBody(const HeaderMap& headers,
                                                   const std::string& body,
                                                   const RequestContext& context);

// A challenge whose raw document reports an "error" and offers no payment
// options is an upstream failure, not something to pay for.
bool IsUpstreamError(const ChallengeDetails& challenge);

}  // namespace autopay::x402
