#include "json_codec.hpp"

#include "utils.hpp"

void to_json(nlohmann::json& j, const Address& a)
{
    j = a.str();
}

void to_json(nlohmann::json& j, const ObjectID& id)
{
    j = id.str();
}

void to_json(nlohmann::json& j, const Profile& p)
{
    j = nlohmann::json{
        {"id", p.id},
        {"owner", p.owner},
        {"username", p.username},
        {"bio", p.bio},
        {"pfp_url", p.pfp_url},
        {"created_at", p.created_at},
        {"followers_count", p.followers_count},
        {"following_count", p.following_count},
    };
}

void to_json(nlohmann::json& j, const Suit& s)
{
    j = nlohmann::json{
        {"id", s.id},
        {"creator", s.creator},
        {"content", s.content},
        {"media_urls", s.media_urls},
        {"created_at", s.created_at},
        {"like_count", s.like_count},
        {"comment_count", s.comment_count},
        {"retweet_count", s.retweet_count},
        {"tip_total", s.tip_total},
    };
}

void to_json(nlohmann::json& j, const Reaction& r)
{
    j = nlohmann::json{
        {"id", r.id},
        {"kind", r.kind == Reaction::LIKE ? "like" : "retweet"},
        {"suit_id", r.suit_id},
        {"actor", r.actor},
        {"created_at", r.created_at},
    };
}

void to_json(nlohmann::json& j, const Comment& c)
{
    j = nlohmann::json{
        {"id", c.id},
        {"suit_id", c.suit_id},
        {"commenter", c.commenter},
        {"content", c.content},
        {"created_at", c.created_at},
    };
}

void to_json(nlohmann::json& j, const Coin& c)
{
    j = nlohmann::json{{"id", c.id}, {"owner", c.owner}, {"value", c.value}};
}

void to_json(nlohmann::json& j, const TipBalance& b)
{
    j = nlohmann::json{
        {"id", b.id},
        {"owner", b.owner},
        {"balance", b.balance},
        {"total_received", b.total_received},
        {"total_withdrawn", b.total_withdrawn},
    };
}

void to_json(nlohmann::json& j, const Chat& c)
{
    j = nlohmann::json{
        {"id", c.id},
        {"participant_1", c.participant_1},
        {"participant_2", c.participant_2},
        {"created_at", c.created_at},
    };
}

void to_json(nlohmann::json& j, const Message& m)
{
    j = nlohmann::json{
        {"sender", m.sender},
        {"encrypted_content", hexEncode(m.encrypted_content)},
        {"content_hash", hexEncode(m.content_hash)},
        {"timestamp", m.timestamp},
        {"is_read", m.is_read},
    };
}

void to_json(nlohmann::json& j, const Event& e)
{
    j = nlohmann::json{
        {"type", std::string(Event::typeName(e.type))},
        {"data", e.data},
        {"created_at", e.created_at},
    };
    if(e.seq.has_value())
    {
        j["seq"] = *e.seq;
    }
}
