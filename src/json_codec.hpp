#pragma once

#include <nlohmann/json.hpp>

#include "events.hpp"
#include "types.hpp"

// JSON renderings of the ledger objects, as printed by the command
// line tool. Identifiers and addresses are written in their string
// form, opaque bytes in hex.

void to_json(nlohmann::json& j, const Address& a);
void to_json(nlohmann::json& j, const ObjectID& id);
void to_json(nlohmann::json& j, const Profile& p);
void to_json(nlohmann::json& j, const Suit& s);
void to_json(nlohmann::json& j, const Reaction& r);
void to_json(nlohmann::json& j, const Comment& c);
void to_json(nlohmann::json& j, const Coin& c);
void to_json(nlohmann::json& j, const TipBalance& b);
void to_json(nlohmann::json& j, const Chat& c);
void to_json(nlohmann::json& j, const Message& m);
void to_json(nlohmann::json& j, const Event& e);
