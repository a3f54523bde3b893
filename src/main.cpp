#include <charconv>
#include <format>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "error.hpp"
#include "json_codec.hpp"
#include "ledger.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {

struct Invocation
{
    Ledger& ledger;
    std::optional<Address> as;
    std::vector<std::string> args;

    E<Address> caller() const
    {
        if(!as.has_value())
        {
            return std::unexpected(ledgerError(
                Errc::INVALID_INPUT, "This command needs --as ADDRESS"));
        }
        return *as;
    }

    // Argument “i”, or “fallback” if there are not that many.
    std::string argOr(size_t i, const std::string& fallback) const
    {
        return i < args.size() ? args[i] : fallback;
    }
};

struct Command
{
    std::string usage;
    size_t min_args;
    std::function<E<nlohmann::json>(const Invocation&)> run;
};

E<int64_t> parseInt(const std::string& s)
{
    int64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if(ec != std::errc() || end != s.data() + s.size())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Not an integer: {}", s)));
    }
    return value;
}

E<uint64_t> parseCount(const std::string& s)
{
    ASSIGN_OR_RETURN(int64_t value, parseInt(s));
    if(value < 0)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Negative count: {}", s)));
    }
    return static_cast<uint64_t>(value);
}

E<Bytes> parseHex(const std::string& s)
{
    std::string_view digits = s;
    if(digits.starts_with("0x"))
    {
        digits.remove_prefix(2);
    }
    auto bytes = hexDecode(digits);
    if(!bytes.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("Not a hex string: {}", s)));
    }
    return *std::move(bytes);
}

// The address in argument “i”, or the caller if it is absent.
E<Address> addressArgOrCaller(const Invocation& inv, size_t i)
{
    if(i < inv.args.size())
    {
        return Address::fromStr(inv.args[i]);
    }
    return inv.caller();
}

E<nlohmann::json> suitsToJson(PostStore& posts,
                              const std::vector<ObjectID>& ids)
{
    nlohmann::json result = nlohmann::json::array();
    for(const ObjectID& id : ids)
    {
        ASSIGN_OR_RETURN(Suit s, posts.getSuit(id));
        result.push_back(s);
    }
    return result;
}

std::map<std::string, Command> commands()
{
    std::map<std::string, Command> cmds;

    cmds["create-profile"] = {"USERNAME [BIO] [PFP_URL]", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(Profile p, inv.ledger.identity().createProfile(
                caller, inv.args[0], inv.argOr(1, ""), inv.argOr(2, "")));
            return p;
        }};
    cmds["update-profile"] = {"PROFILE_ID USERNAME [BIO] [PFP_URL]", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID id, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Profile p, inv.ledger.identity().updateProfile(
                caller, id, inv.args[1], inv.argOr(2, ""), inv.argOr(3, "")));
            return p;
        }};
    cmds["username-available"] = {"USERNAME", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(bool available,
                             inv.ledger.identity().isUsernameAvailable(
                                 inv.args[0]));
            return available;
        }};
    cmds["whois"] = {"USERNAME", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address owner,
                             inv.ledger.identity().getOwnerByUsername(
                                 inv.args[0]));
            ASSIGN_OR_RETURN(Profile p,
                             inv.ledger.identity().getProfileByOwner(owner));
            return p;
        }};

    cmds["post"] = {"CONTENT [MEDIA_URL...]", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            std::vector<std::string> media(inv.args.begin() + 1,
                                           inv.args.end());
            ASSIGN_OR_RETURN(Suit s, inv.ledger.posts().createSuit(
                caller, inv.args[0], media));
            return s;
        }};
    cmds["show-suit"] = {"SUIT_ID", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(ObjectID id, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Suit s, inv.ledger.posts().getSuit(id));
            return s;
        }};
    cmds["recent"] = {"[LIMIT] [OFFSET]", 0,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(
                uint64_t limit,
                parseCount(inv.argOr(
                    0, std::to_string(Config::get().recent_page_size))));
            ASSIGN_OR_RETURN(uint64_t offset, parseCount(inv.argOr(1, "0")));
            ASSIGN_OR_RETURN(auto ids,
                             inv.ledger.posts().getRecent(limit, offset));
            return suitsToJson(inv.ledger.posts(), ids);
        }};
    cmds["by-creator"] = {"[ADDRESS]", 0,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address creator, addressArgOrCaller(inv, 0));
            ASSIGN_OR_RETURN(auto ids,
                             inv.ledger.posts().getByCreator(creator));
            return suitsToJson(inv.ledger.posts(), ids);
        }};

    cmds["like"] = {"SUIT_ID", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Reaction r,
                             inv.ledger.interactions().likeSuit(caller, suit));
            return r;
        }};
    cmds["unlike"] = {"SUIT_ID LIKE_ID", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(ObjectID like, ObjectID::fromStr(inv.args[1]));
            DO_OR_RETURN(inv.ledger.interactions().unlikeSuit(caller, suit,
                                                              like));
            return nlohmann::json{{"removed", like}};
        }};
    cmds["retweet"] = {"SUIT_ID", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Reaction r, inv.ledger.interactions().retweetSuit(
                caller, suit));
            return r;
        }};
    cmds["unretweet"] = {"SUIT_ID RETWEET_ID", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(ObjectID rt, ObjectID::fromStr(inv.args[1]));
            DO_OR_RETURN(inv.ledger.interactions().unretweetSuit(caller, suit,
                                                                 rt));
            return nlohmann::json{{"removed", rt}};
        }};
    cmds["comment"] = {"SUIT_ID TEXT", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Comment c, inv.ledger.interactions().commentOnSuit(
                caller, suit, inv.args[1]));
            return c;
        }};
    cmds["has-liked"] = {"SUIT_ID [ADDRESS]", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Address user, addressArgOrCaller(inv, 1));
            ASSIGN_OR_RETURN(bool liked,
                             inv.ledger.interactions().hasLiked(suit, user));
            return liked;
        }};
    cmds["has-retweeted"] = {"SUIT_ID [ADDRESS]", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Address user, addressArgOrCaller(inv, 1));
            ASSIGN_OR_RETURN(bool retweeted,
                             inv.ledger.interactions().hasRetweeted(suit, user));
            return retweeted;
        }};

    cmds["mint"] = {"ADDRESS VALUE", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address owner, Address::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(int64_t value, parseInt(inv.args[1]));
            ASSIGN_OR_RETURN(Coin c, inv.ledger.wallet().mint(owner, value));
            return c;
        }};
    cmds["coins"] = {"[ADDRESS]", 0,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address owner, addressArgOrCaller(inv, 0));
            ASSIGN_OR_RETURN(auto coins, inv.ledger.wallet().coinsOwnedBy(owner));
            return coins;
        }};
    cmds["tip"] = {"SUIT_ID COIN_ID", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID suit, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(ObjectID coin, ObjectID::fromStr(inv.args[1]));
            ASSIGN_OR_RETURN(Address creator,
                             inv.ledger.posts().creatorOf(suit));
            ASSIGN_OR_RETURN(ObjectID balance,
                             inv.ledger.tipping().getOrCreateBalance(creator));
            DO_OR_RETURN(inv.ledger.tipping().tipPost(caller, suit, balance,
                                                      coin));
            ASSIGN_OR_RETURN(TipBalance b,
                             inv.ledger.tipping().getBalance(balance));
            return b;
        }};
    cmds["withdraw"] = {"AMOUNT", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(int64_t amount, parseInt(inv.args[0]));
            ASSIGN_OR_RETURN(TipBalance b,
                             inv.ledger.tipping().getBalanceOf(caller));
            ASSIGN_OR_RETURN(Coin c, inv.ledger.tipping().withdraw(
                caller, b.id, amount));
            return c;
        }};
    cmds["balance"] = {"[ADDRESS]", 0,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address owner, addressArgOrCaller(inv, 0));
            ASSIGN_OR_RETURN(TipBalance b,
                             inv.ledger.tipping().getBalanceOf(owner));
            return b;
        }};

    cmds["start-chat"] = {"ADDRESS", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(Address other, Address::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(ObjectID id,
                             inv.ledger.messaging().startChat(caller, other));
            ASSIGN_OR_RETURN(Chat c, inv.ledger.messaging().getChat(id));
            return c;
        }};
    cmds["send"] = {"CHAT_ID CIPHERTEXT_HEX HASH_HEX", 3,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID chat, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Bytes content, parseHex(inv.args[1]));
            ASSIGN_OR_RETURN(Bytes hash, parseHex(inv.args[2]));
            ASSIGN_OR_RETURN(uint64_t index, inv.ledger.messaging().sendMessage(
                caller, chat, content, hash));
            return nlohmann::json{{"chat_id", chat}, {"index", index}};
        }};
    cmds["read"] = {"CHAT_ID INDEX", 2,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(Address caller, inv.caller());
            ASSIGN_OR_RETURN(ObjectID chat, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(uint64_t index, parseCount(inv.args[1]));
            DO_OR_RETURN(inv.ledger.messaging().markAsRead(caller, chat, index));
            return nlohmann::json{{"chat_id", chat}, {"index", index}};
        }};
    cmds["messages"] = {"CHAT_ID", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(ObjectID chat, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(auto messages,
                             inv.ledger.messaging().getMessages(chat));
            return messages;
        }};
    cmds["unread"] = {"CHAT_ID [ADDRESS]", 1,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(ObjectID chat, ObjectID::fromStr(inv.args[0]));
            ASSIGN_OR_RETURN(Address user, addressArgOrCaller(inv, 1));
            ASSIGN_OR_RETURN(uint64_t count,
                             inv.ledger.messaging().getUnreadCount(chat, user));
            return count;
        }};

    cmds["events"] = {"[AFTER_SEQ] [LIMIT]", 0,
        [](const Invocation& inv) -> E<nlohmann::json> {
            ASSIGN_OR_RETURN(int64_t after, parseInt(inv.argOr(0, "0")));
            ASSIGN_OR_RETURN(int64_t limit, parseInt(inv.argOr(1, "100")));
            ASSIGN_OR_RETURN(auto events,
                             inv.ledger.events().since(after, limit));
            return events;
        }};

    return cmds;
}

void printUsage(const cxxopts::Options& options,
                const std::map<std::string, Command>& cmds)
{
    std::cout << options.help() << "\nCommands:\n";
    for(const auto& [name, cmd] : cmds)
    {
        std::cout << "  " << name << " " << cmd.usage << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("suiter", "Decentralized social ledger");
    cmd_options.add_options()
        ("c,config", "Config file", cxxopts::value<std::string>())
        ("db", "Database file, overriding the config",
         cxxopts::value<std::string>())
        ("as", "Address of the caller", cxxopts::value<std::string>())
        ("v,verbose", "Log debug messages")
        ("h,help", "Print this message")
        ("command", "Command to run", cxxopts::value<std::string>())
        ("args", "Arguments of the command",
         cxxopts::value<std::vector<std::string>>());
    cmd_options.parse_positional({"command", "args"});
    cmd_options.positional_help("COMMAND [ARGS...]");

    auto cmds = commands();

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if(opts.count("help") || !opts.count("command"))
    {
        printUsage(cmd_options, cmds);
        return opts.count("help") ? 0 : 2;
    }

    Config& config = Config::get();
    try
    {
        if(opts.count("config"))
        {
            config.load(opts["config"].as<std::string>());
        }
        else
        {
            config.finalize();
        }
    }
    catch(const std::exception& e)
    {
        spdlog::error("Failed to load configuration: {}", e.what());
        return 1;
    }
    if(opts.count("db"))
    {
        config.db_path = opts["db"].as<std::string>();
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if(opts.count("verbose"))
    {
        spdlog::set_level(spdlog::level::debug);
    }

    std::string name = opts["command"].as<std::string>();
    auto cmd = cmds.find(name);
    if(cmd == cmds.end())
    {
        std::cerr << "Unknown command: " << name << std::endl;
        printUsage(cmd_options, cmds);
        return 2;
    }

    std::vector<std::string> args;
    if(opts.count("args"))
    {
        args = opts["args"].as<std::vector<std::string>>();
    }
    if(args.size() < cmd->second.min_args)
    {
        std::cerr << "Usage: suiter " << name << " " << cmd->second.usage
                  << std::endl;
        return 2;
    }

    std::optional<Address> as;
    if(opts.count("as"))
    {
        auto addr = Address::fromStr(opts["as"].as<std::string>());
        if(!addr.has_value())
        {
            std::cerr << errorMsg(addr.error()) << std::endl;
            return 1;
        }
        as = *addr;
    }

    auto ledger = Ledger::open(config.db_path, config.chain_id);
    if(!ledger.has_value())
    {
        spdlog::error("Failed to open ledger at {}: {}", config.db_path,
                      errorMsg(ledger.error()));
        return 1;
    }

    Invocation inv{**ledger, as, std::move(args)};
    E<nlohmann::json> result = cmd->second.run(inv);
    if(!result.has_value())
    {
        std::cerr << errorMsg(result.error()) << std::endl;
        return 1;
    }
    std::cout << result->dump(2) << std::endl;
    return 0;
}
