#include "database.hpp"

#include <format>

#include <mw/error.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace {

template<typename Id>
mw::E<Id> idFromColumn(const std::string& s)
{
    auto id = Id::fromStr(s);
    if(!id.has_value())
    {
        return std::unexpected(mw::runtimeError(
            std::format("Corrupted identifier in database: {}", s)));
    }
    return *id;
}

mw::E<Bytes> bytesFromColumn(const std::string& s)
{
    auto bytes = hexDecode(s);
    if(!bytes.has_value())
    {
        return std::unexpected(mw::runtimeError(
            "Corrupted byte string in database"));
    }
    return *std::move(bytes);
}

using ProfileTuple = std::tuple<std::string, std::string, std::string,
                                std::string, std::string, int64_t, int64_t,
                                int64_t>;

mw::E<Profile> rowToProfile(const ProfileTuple& row)
{
    Profile p;
    ASSIGN_OR_RETURN(p.id, idFromColumn<ObjectID>(std::get<0>(row)));
    ASSIGN_OR_RETURN(p.owner, idFromColumn<Address>(std::get<1>(row)));
    p.username = std::get<2>(row);
    p.bio = std::get<3>(row);
    p.pfp_url = std::get<4>(row);
    p.created_at = std::get<5>(row);
    p.followers_count = std::get<6>(row);
    p.following_count = std::get<7>(row);
    return p;
}

using SuitTuple = std::tuple<std::string, std::string, std::string, int64_t,
                             int64_t, int64_t, int64_t, int64_t>;

mw::E<Suit> rowToSuit(const SuitTuple& row)
{
    Suit s;
    ASSIGN_OR_RETURN(s.id, idFromColumn<ObjectID>(std::get<0>(row)));
    ASSIGN_OR_RETURN(s.creator, idFromColumn<Address>(std::get<1>(row)));
    s.content = std::get<2>(row);
    s.created_at = std::get<3>(row);
    s.like_count = std::get<4>(row);
    s.comment_count = std::get<5>(row);
    s.retweet_count = std::get<6>(row);
    s.tip_total = std::get<7>(row);
    return s;
}

using CoinTuple = std::tuple<std::string, std::string, int64_t>;

mw::E<Coin> rowToCoin(const CoinTuple& row)
{
    Coin c;
    ASSIGN_OR_RETURN(c.id, idFromColumn<ObjectID>(std::get<0>(row)));
    ASSIGN_OR_RETURN(c.owner, idFromColumn<Address>(std::get<1>(row)));
    c.value = std::get<2>(row);
    return c;
}

using MessageTuple =
    std::tuple<std::string, std::string, std::string, int64_t, int>;

mw::E<Message> rowToMessage(const MessageTuple& row)
{
    Message m;
    ASSIGN_OR_RETURN(m.sender, idFromColumn<Address>(std::get<0>(row)));
    ASSIGN_OR_RETURN(m.encrypted_content, bytesFromColumn(std::get<1>(row)));
    ASSIGN_OR_RETURN(m.content_hash, bytesFromColumn(std::get<2>(row)));
    m.timestamp = std::get<3>(row);
    m.is_read = std::get<4>(row) != 0;
    return m;
}

} // namespace

Database::Database(const std::string& path) : db_path(path) {}

mw::E<void> Database::init()
{
    auto conn = mw::SQLite::connectFile(db_path);
    if(!conn)
    {
        return std::unexpected(conn.error());
    }
    db = std::move(*conn);

    DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));
    DO_OR_RETURN(db->execute("PRAGMA foreign_keys=ON;"));

    return migrate();
}

mw::E<void> Database::migrate()
{
    auto version_res = db->evalToValue<int>("PRAGMA user_version;");
    if(!version_res)
    {
        return std::unexpected(version_res.error());
    }

    int version = *version_res;

    if(version == 0)
    {
        spdlog::info("Creating database schema v1...");

        const std::vector<std::string> statements = {
            R"(CREATE TABLE IF NOT EXISTS username_registry (
                username TEXT PRIMARY KEY,
                owner TEXT NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS profiles (
                id TEXT PRIMARY KEY,
                owner TEXT NOT NULL UNIQUE,
                username TEXT NOT NULL,
                bio TEXT,
                pfp_url TEXT,
                created_at INTEGER,
                followers_count INTEGER,
                following_count INTEGER
            );)",

            R"(CREATE TABLE IF NOT EXISTS suits (
                id TEXT PRIMARY KEY,
                creator TEXT NOT NULL,
                content TEXT NOT NULL,
                created_at INTEGER,
                like_count INTEGER,
                comment_count INTEGER,
                retweet_count INTEGER,
                tip_total INTEGER
            );)",

            R"(CREATE TABLE IF NOT EXISTS suit_media (
                suit_id TEXT,
                position INTEGER,
                url TEXT,
                PRIMARY KEY(suit_id, position),
                FOREIGN KEY(suit_id) REFERENCES suits(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS suit_registry (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                suit_id TEXT NOT NULL UNIQUE,
                creator TEXT NOT NULL,
                FOREIGN KEY(suit_id) REFERENCES suits(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS interaction_registry (
                key TEXT PRIMARY KEY,
                flag INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS reactions (
                id TEXT PRIMARY KEY,
                kind INTEGER NOT NULL,
                suit_id TEXT NOT NULL,
                actor TEXT NOT NULL,
                created_at INTEGER,
                FOREIGN KEY(suit_id) REFERENCES suits(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS comments (
                id TEXT PRIMARY KEY,
                suit_id TEXT NOT NULL,
                commenter TEXT NOT NULL,
                content TEXT NOT NULL,
                created_at INTEGER,
                FOREIGN KEY(suit_id) REFERENCES suits(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS coins (
                id TEXT PRIMARY KEY,
                owner TEXT NOT NULL,
                value INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS tip_balances (
                id TEXT PRIMARY KEY,
                owner TEXT NOT NULL,
                balance INTEGER NOT NULL,
                total_received INTEGER NOT NULL,
                total_withdrawn INTEGER NOT NULL
            );)",

            R"(CREATE TABLE IF NOT EXISTS tip_balance_registry (
                owner TEXT PRIMARY KEY,
                balance_id TEXT NOT NULL,
                FOREIGN KEY(balance_id) REFERENCES tip_balances(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS chats (
                id TEXT PRIMARY KEY,
                participant_1 TEXT NOT NULL,
                participant_2 TEXT NOT NULL,
                created_at INTEGER
            );)",

            R"(CREATE TABLE IF NOT EXISTS chat_registry (
                key TEXT PRIMARY KEY,
                chat_id TEXT NOT NULL,
                FOREIGN KEY(chat_id) REFERENCES chats(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS messages (
                chat_id TEXT,
                idx INTEGER,
                sender TEXT NOT NULL,
                encrypted_content TEXT NOT NULL,
                content_hash TEXT NOT NULL,
                timestamp INTEGER,
                is_read INTEGER NOT NULL,
                PRIMARY KEY(chat_id, idx),
                FOREIGN KEY(chat_id) REFERENCES chats(id)
            );)",

            R"(CREATE TABLE IF NOT EXISTS events (
                seq INTEGER PRIMARY KEY AUTOINCREMENT,
                type TEXT NOT NULL,
                payload TEXT NOT NULL,
                created_at INTEGER
            );)",

            "PRAGMA user_version = 1;"};

        for(const auto& sql : statements)
        {
            auto res = db->execute(sql);
            if(!res)
            {
                spdlog::error("Failed to execute SQL: {}", sql);
                return std::unexpected(res.error());
            }
        }
    }

    return {};
}

mw::E<void> Database::beginTransaction()
{
    return db->execute("BEGIN IMMEDIATE;");
}

mw::E<void> Database::commitTransaction()
{
    return db->execute("COMMIT;");
}

mw::E<void> Database::rollbackTransaction()
{
    return db->execute("ROLLBACK;");
}

mw::E<std::optional<Address>>
Database::getUsernameOwner(const std::string& username)
{
    const char* sql = "SELECT owner FROM username_registry WHERE username = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(username));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return idFromColumn<Address>(std::get<0>(rows[0]));
}

mw::E<void> Database::addUsername(const std::string& username,
                                  const Address& owner)
{
    const char* sql =
        "INSERT INTO username_registry (username, owner) VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(username, owner.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::removeUsername(const std::string& username)
{
    const char* sql = "DELETE FROM username_registry WHERE username = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(username));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::createProfile(const Profile& profile)
{
    const char* sql =
        "INSERT INTO profiles (id, owner, username, bio, pfp_url, "
        "created_at, followers_count, following_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(profile.id.str(), profile.owner.str(),
                           profile.username, profile.bio, profile.pfp_url,
                           profile.created_at, profile.followers_count,
                           profile.following_count));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::updateProfile(const Profile& profile)
{
    const char* sql =
        "UPDATE profiles SET username = ?, bio = ?, pfp_url = ?, "
        "followers_count = ?, following_count = ? WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(profile.username, profile.bio, profile.pfp_url,
                           profile.followers_count, profile.following_count,
                           profile.id.str()));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Profile>> Database::getProfileById(const ObjectID& id)
{
    const char* sql =
        "SELECT id, owner, username, bio, pfp_url, created_at, "
        "followers_count, following_count FROM profiles WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, std::string,
                  std::string, int64_t, int64_t, int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToProfile(rows[0]);
}

mw::E<std::optional<Profile>> Database::getProfileByOwner(const Address& owner)
{
    const char* sql =
        "SELECT id, owner, username, bio, pfp_url, created_at, "
        "followers_count, following_count FROM profiles WHERE owner = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(owner.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, std::string,
                  std::string, int64_t, int64_t, int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToProfile(rows[0]);
}

mw::E<void> Database::createSuit(const Suit& suit)
{
    const char* sql =
        "INSERT INTO suits (id, creator, content, created_at, like_count, "
        "comment_count, retweet_count, tip_total) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(suit.id.str(), suit.creator.str(), suit.content,
                           suit.created_at, suit.like_count,
                           suit.comment_count, suit.retweet_count,
                           suit.tip_total));
    DO_OR_RETURN(db->execute(std::move(stmt)));

    for(size_t i = 0; i < suit.media_urls.size(); i++)
    {
        ASSIGN_OR_RETURN(auto media_stmt, db->statementFromStr(
            "INSERT INTO suit_media (suit_id, position, url) "
            "VALUES (?, ?, ?);"));
        DO_OR_RETURN(media_stmt.bind(suit.id.str(), static_cast<int64_t>(i),
                                     suit.media_urls[i]));
        DO_OR_RETURN(db->execute(std::move(media_stmt)));
    }
    return {};
}

mw::E<std::vector<std::string>> Database::getSuitMedia(const ObjectID& id)
{
    const char* sql =
        "SELECT url FROM suit_media WHERE suit_id = ? ORDER BY position;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    std::vector<std::string> urls;
    for(const auto& row : rows)
    {
        urls.push_back(std::get<0>(row));
    }
    return urls;
}

mw::E<std::optional<Suit>> Database::getSuitById(const ObjectID& id)
{
    const char* sql =
        "SELECT id, creator, content, created_at, like_count, "
        "comment_count, retweet_count, tip_total FROM suits WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, int64_t, int64_t,
                  int64_t, int64_t, int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    ASSIGN_OR_RETURN(Suit s, rowToSuit(rows[0]));
    ASSIGN_OR_RETURN(s.media_urls, getSuitMedia(id));
    return s;
}

mw::E<void> Database::updateSuitCounters(const Suit& suit)
{
    const char* sql =
        "UPDATE suits SET like_count = ?, comment_count = ?, "
        "retweet_count = ?, tip_total = ? WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(suit.like_count, suit.comment_count,
                           suit.retweet_count, suit.tip_total, suit.id.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::registerSuit(const ObjectID& id, const Address& creator)
{
    const char* sql =
        "INSERT INTO suit_registry (suit_id, creator) VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str(), creator.str()));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Address>> Database::getSuitCreator(const ObjectID& id)
{
    const char* sql = "SELECT creator FROM suit_registry WHERE suit_id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return idFromColumn<Address>(std::get<0>(rows[0]));
}

mw::E<int64_t> Database::countSuits()
{
    return db->evalToValue<int64_t>("SELECT COUNT(*) FROM suit_registry;");
}

mw::E<std::vector<ObjectID>> Database::getSuitIndexRange(int64_t begin,
                                                         int64_t count)
{
    const char* sql = "SELECT suit_id FROM suit_registry ORDER BY seq "
                      "LIMIT ? OFFSET ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(count, begin));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    std::vector<ObjectID> ids;
    for(const auto& row : rows)
    {
        ASSIGN_OR_RETURN(auto id, idFromColumn<ObjectID>(std::get<0>(row)));
        ids.push_back(id);
    }
    return ids;
}

mw::E<std::vector<ObjectID>> Database::getSuitsByCreator(const Address& creator)
{
    // Deliberately unindexed on creator.
    const char* sql = "SELECT suit_id FROM suit_registry WHERE creator = ? "
                      "ORDER BY seq;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(creator.str()));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    std::vector<ObjectID> ids;
    for(const auto& row : rows)
    {
        ASSIGN_OR_RETURN(auto id, idFromColumn<ObjectID>(std::get<0>(row)));
        ids.push_back(id);
    }
    return ids;
}

mw::E<bool> Database::hasInteraction(const std::string& key)
{
    const char* sql = "SELECT flag FROM interaction_registry WHERE key = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(key));
    ASSIGN_OR_RETURN(auto rows, db->eval<int>(std::move(stmt)));
    return !rows.empty() && std::get<0>(rows[0]) != 0;
}

mw::E<void> Database::addInteraction(const std::string& key)
{
    const char* sql =
        "INSERT INTO interaction_registry (key, flag) VALUES (?, 1);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(key));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::removeInteraction(const std::string& key)
{
    const char* sql = "DELETE FROM interaction_registry WHERE key = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(key));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::createReaction(const Reaction& reaction)
{
    const char* sql = "INSERT INTO reactions (id, kind, suit_id, actor, "
                      "created_at) VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(reaction.id.str(), static_cast<int>(reaction.kind),
                           reaction.suit_id.str(), reaction.actor.str(),
                           reaction.created_at));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Reaction>> Database::getReactionById(const ObjectID& id)
{
    const char* sql = "SELECT id, kind, suit_id, actor, created_at "
                      "FROM reactions WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, int, std::string, std::string, int64_t>(
            std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    Reaction r;
    ASSIGN_OR_RETURN(r.id, idFromColumn<ObjectID>(std::get<0>(rows[0])));
    r.kind = static_cast<Reaction::Kind>(std::get<1>(rows[0]));
    ASSIGN_OR_RETURN(r.suit_id, idFromColumn<ObjectID>(std::get<2>(rows[0])));
    ASSIGN_OR_RETURN(r.actor, idFromColumn<Address>(std::get<3>(rows[0])));
    r.created_at = std::get<4>(rows[0]);
    return r;
}

mw::E<void> Database::deleteReaction(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
        "DELETE FROM reactions WHERE id = ?;"));
    DO_OR_RETURN(stmt.bind(id.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::createComment(const Comment& comment)
{
    const char* sql = "INSERT INTO comments (id, suit_id, commenter, "
                      "content, created_at) VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(comment.id.str(), comment.suit_id.str(),
                           comment.commenter.str(), comment.content,
                           comment.created_at));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Comment>> Database::getCommentById(const ObjectID& id)
{
    const char* sql = "SELECT id, suit_id, commenter, content, created_at "
                      "FROM comments WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, std::string,
                  int64_t>(std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    Comment c;
    ASSIGN_OR_RETURN(c.id, idFromColumn<ObjectID>(std::get<0>(rows[0])));
    ASSIGN_OR_RETURN(c.suit_id, idFromColumn<ObjectID>(std::get<1>(rows[0])));
    ASSIGN_OR_RETURN(c.commenter, idFromColumn<Address>(std::get<2>(rows[0])));
    c.content = std::get<3>(rows[0]);
    c.created_at = std::get<4>(rows[0]);
    return c;
}

mw::E<void> Database::createCoin(const Coin& coin)
{
    const char* sql = "INSERT INTO coins (id, owner, value) VALUES (?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(coin.id.str(), coin.owner.str(), coin.value));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::updateCoin(const Coin& coin)
{
    const char* sql = "UPDATE coins SET owner = ?, value = ? WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(coin.owner.str(), coin.value, coin.id.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::deleteCoin(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
        "DELETE FROM coins WHERE id = ?;"));
    DO_OR_RETURN(stmt.bind(id.str()));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Coin>> Database::getCoinById(const ObjectID& id)
{
    const char* sql = "SELECT id, owner, value FROM coins WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(auto rows, (db->eval<std::string, std::string, int64_t>(
                                    std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToCoin(rows[0]);
}

mw::E<std::vector<Coin>> Database::getCoinsByOwner(const Address& owner)
{
    const char* sql = "SELECT id, owner, value FROM coins WHERE owner = ? "
                      "ORDER BY rowid;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(owner.str()));
    ASSIGN_OR_RETURN(auto rows, (db->eval<std::string, std::string, int64_t>(
                                    std::move(stmt))));
    std::vector<Coin> coins;
    for(const auto& row : rows)
    {
        ASSIGN_OR_RETURN(auto c, rowToCoin(row));
        coins.push_back(std::move(c));
    }
    return coins;
}

mw::E<void> Database::createTipBalance(const TipBalance& balance)
{
    const char* sql = "INSERT INTO tip_balances (id, owner, balance, "
                      "total_received, total_withdrawn) "
                      "VALUES (?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(balance.id.str(), balance.owner.str(),
                           balance.balance, balance.total_received,
                           balance.total_withdrawn));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::updateTipBalance(const TipBalance& balance)
{
    const char* sql = "UPDATE tip_balances SET balance = ?, "
                      "total_received = ?, total_withdrawn = ? WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(balance.balance, balance.total_received,
                           balance.total_withdrawn, balance.id.str()));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<TipBalance>> Database::getTipBalanceById(const ObjectID& id)
{
    const char* sql = "SELECT id, owner, balance, total_received, "
                      "total_withdrawn FROM tip_balances WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, int64_t, int64_t, int64_t>(
            std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    TipBalance b;
    ASSIGN_OR_RETURN(b.id, idFromColumn<ObjectID>(std::get<0>(rows[0])));
    ASSIGN_OR_RETURN(b.owner, idFromColumn<Address>(std::get<1>(rows[0])));
    b.balance = std::get<2>(rows[0]);
    b.total_received = std::get<3>(rows[0]);
    b.total_withdrawn = std::get<4>(rows[0]);
    return b;
}

mw::E<std::optional<ObjectID>> Database::getBalanceIdByOwner(const Address& owner)
{
    const char* sql =
        "SELECT balance_id FROM tip_balance_registry WHERE owner = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(owner.str()));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return idFromColumn<ObjectID>(std::get<0>(rows[0]));
}

mw::E<void> Database::registerBalance(const Address& owner, const ObjectID& id)
{
    const char* sql = "INSERT INTO tip_balance_registry (owner, balance_id) "
                      "VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(owner.str(), id.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::createChat(const Chat& chat)
{
    const char* sql = "INSERT INTO chats (id, participant_1, participant_2, "
                      "created_at) VALUES (?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat.id.str(), chat.participant_1.str(),
                           chat.participant_2.str(), chat.created_at));
    return db->execute(std::move(stmt));
}

mw::E<std::optional<Chat>> Database::getChatById(const ObjectID& id)
{
    const char* sql = "SELECT id, participant_1, participant_2, created_at "
                      "FROM chats WHERE id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, int64_t>(
            std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    Chat c;
    ASSIGN_OR_RETURN(c.id, idFromColumn<ObjectID>(std::get<0>(rows[0])));
    ASSIGN_OR_RETURN(c.participant_1,
                     idFromColumn<Address>(std::get<1>(rows[0])));
    ASSIGN_OR_RETURN(c.participant_2,
                     idFromColumn<Address>(std::get<2>(rows[0])));
    c.created_at = std::get<3>(rows[0]);
    return c;
}

mw::E<std::optional<ObjectID>> Database::getChatIdByKey(const std::string& key)
{
    const char* sql = "SELECT chat_id FROM chat_registry WHERE key = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(key));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return idFromColumn<ObjectID>(std::get<0>(rows[0]));
}

mw::E<void> Database::registerChat(const std::string& key, const ObjectID& id)
{
    const char* sql = "INSERT INTO chat_registry (key, chat_id) VALUES (?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(key, id.str()));
    return db->execute(std::move(stmt));
}

mw::E<void> Database::appendMessage(const ObjectID& chat_id, int64_t index,
                                    const Message& message)
{
    const char* sql =
        "INSERT INTO messages (chat_id, idx, sender, encrypted_content, "
        "content_hash, timestamp, is_read) VALUES (?, ?, ?, ?, ?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat_id.str(), index, message.sender.str(),
                           hexEncode(message.encrypted_content),
                           hexEncode(message.content_hash), message.timestamp,
                           message.is_read ? 1 : 0));
    return db->execute(std::move(stmt));
}

mw::E<std::vector<Message>> Database::getMessages(const ObjectID& chat_id)
{
    const char* sql = "SELECT sender, encrypted_content, content_hash, "
                      "timestamp, is_read FROM messages WHERE chat_id = ? "
                      "ORDER BY idx;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat_id.str()));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, int64_t, int>(
            std::move(stmt))));
    std::vector<Message> messages;
    for(const auto& row : rows)
    {
        ASSIGN_OR_RETURN(auto m, rowToMessage(row));
        messages.push_back(std::move(m));
    }
    return messages;
}

mw::E<std::optional<Message>> Database::getMessage(const ObjectID& chat_id,
                                                   int64_t index)
{
    const char* sql = "SELECT sender, encrypted_content, content_hash, "
                      "timestamp, is_read FROM messages "
                      "WHERE chat_id = ? AND idx = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat_id.str(), index));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<std::string, std::string, std::string, int64_t, int>(
            std::move(stmt))));
    if(rows.empty())
    {
        return std::nullopt;
    }
    return rowToMessage(rows[0]);
}

mw::E<int64_t> Database::countMessages(const ObjectID& chat_id)
{
    const char* sql = "SELECT COUNT(*) FROM messages WHERE chat_id = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat_id.str()));
    ASSIGN_OR_RETURN(auto rows, db->eval<int64_t>(std::move(stmt)));
    if(rows.empty())
    {
        return 0;
    }
    return std::get<0>(rows[0]);
}

mw::E<void> Database::markMessageRead(const ObjectID& chat_id, int64_t index)
{
    const char* sql =
        "UPDATE messages SET is_read = 1 WHERE chat_id = ? AND idx = ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(chat_id.str(), index));
    return db->execute(std::move(stmt));
}

mw::E<int64_t> Database::appendEvent(const Event& event)
{
    const char* sql = "INSERT INTO events (type, payload, created_at) "
                      "VALUES (?, ?, ?);";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(std::string(Event::typeName(event.type)),
                           event.data.dump(), event.created_at));
    DO_OR_RETURN(db->execute(std::move(stmt)));
    return db->lastInsertRowID();
}

mw::E<std::vector<Event>> Database::getEventsSince(int64_t seq, int limit)
{
    const char* sql = "SELECT seq, type, payload, created_at FROM events "
                      "WHERE seq > ? ORDER BY seq LIMIT ?;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(seq, limit));
    ASSIGN_OR_RETURN(
        auto rows,
        (db->eval<int64_t, std::string, std::string, int64_t>(
            std::move(stmt))));

    std::vector<Event> result;
    for(const auto& row : rows)
    {
        Event e;
        e.seq = std::get<0>(row);
        auto type = Event::typeFromName(std::get<1>(row));
        if(!type)
        {
            return std::unexpected(mw::runtimeError(type.error().msg));
        }
        e.type = *type;
        e.data = nlohmann::json::parse(std::get<2>(row), nullptr, false);
        if(e.data.is_discarded())
        {
            return std::unexpected(mw::runtimeError(std::format(
                "Corrupted payload of event {}", *e.seq)));
        }
        e.created_at = std::get<3>(row);
        result.push_back(std::move(e));
    }
    return result;
}
