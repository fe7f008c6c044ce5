#pragma once

#include <nlohmann/json.hpp>

#include "agent/commands.hpp"

namespace autopay::agent {

// Wire form of every reply, as returned in the JSON-RPC "result" member.
// Optional fields are omitted when unset, except the primary payload of a
// lookup (`entry`, `resolution`, `token`, `wallet`), which is null.
nlohmann::json ReplyToJson(const Reply& reply);

nlohmann::json DecisionReplyToJson(const DecisionReply& reply);
nlohmann::json WalletReplyToJson(const WalletReply& reply);

}  // namespace autopay::agent
