#include "messaging.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "events.hpp"
#include "transaction.hpp"

MessagingStore::MessagingStore(DatabaseInterface& db, HostInterface& host)
    : db(db), host(host)
{
}

E<ObjectID> MessagingStore::startChat(const Address& caller,
                                      const Address& other)
{
    if(caller == other)
    {
        return std::unexpected(ledgerError(Errc::SELF_CHAT,
                                           "Cannot chat with yourself"));
    }

    std::string key = chatKey(caller, other);
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(auto existing, db.getChatIdByKey(key));
    if(existing.has_value())
    {
        DO_OR_RETURN(tx.commit());
        return *existing;
    }

    Chat c;
    ASSIGN_OR_RETURN(c.id, host.newObjectID());
    c.participant_1 = std::min(caller, other);
    c.participant_2 = std::max(caller, other);
    c.created_at = host.nowMillis();

    DO_OR_RETURN(db.createChat(c));
    DO_OR_RETURN(db.registerChat(key, c.id));
    DO_OR_RETURN(db.appendEvent(events::chatCreated(c)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Started chat {} between {} and {}", c.id.str(),
                  c.participant_1.str(), c.participant_2.str());
    return c.id;
}

E<uint64_t> MessagingStore::sendMessage(const Address& caller,
                                        const ObjectID& chat,
                                        const Bytes& encrypted_content,
                                        const Bytes& content_hash)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Chat c, getChat(chat));
    if(!c.hasParticipant(caller))
    {
        return std::unexpected(ledgerError(
            Errc::NOT_PARTICIPANT, "Not a participant of this chat"));
    }
    if(encrypted_content.empty())
    {
        return std::unexpected(ledgerError(Errc::EMPTY_MESSAGE,
                                           "Message is empty"));
    }

    Message m;
    m.sender = caller;
    m.encrypted_content = encrypted_content;
    m.content_hash = content_hash;
    m.timestamp = host.nowMillis();
    m.is_read = false;

    ASSIGN_OR_RETURN(int64_t index, db.countMessages(chat));
    DO_OR_RETURN(db.appendMessage(chat, index, m));
    DO_OR_RETURN(db.appendEvent(
        events::messageSent(c, static_cast<uint64_t>(index), m)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("{} sent message {} in chat {}", caller.str(), index,
                  chat.str());
    return static_cast<uint64_t>(index);
}

E<void> MessagingStore::markAsRead(const Address& caller, const ObjectID& chat,
                                   uint64_t index)
{
    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(Chat c, getChat(chat));
    if(!c.hasParticipant(caller))
    {
        return std::unexpected(ledgerError(
            Errc::NOT_PARTICIPANT, "Not a participant of this chat"));
    }
    ASSIGN_OR_RETURN(int64_t count, db.countMessages(chat));
    if(index >= static_cast<uint64_t>(count))
    {
        return std::unexpected(ledgerError(
            Errc::INDEX_OUT_OF_RANGE,
            std::format("Chat has {} messages, no index {}", count, index)));
    }
    ASSIGN_OR_RETURN(auto found, db.getMessage(chat, static_cast<int64_t>(index)));
    if(!found.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INDEX_OUT_OF_RANGE, std::format("No message {}", index)));
    }
    const Message& m = *found;
    if(m.sender == caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_PARTICIPANT, "Cannot mark your own message as read"));
    }
    if(m.is_read)
    {
        return std::unexpected(ledgerError(
            Errc::ALREADY_READ, std::format("Message {} is already read",
                                            index)));
    }

    DO_OR_RETURN(db.markMessageRead(chat, static_cast<int64_t>(index)));
    DO_OR_RETURN(db.appendEvent(events::messageRead(
        c, index, caller, m.sender, host.nowMillis())));
    DO_OR_RETURN(tx.commit());
    return {};
}

E<Chat> MessagingStore::getChat(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto c, db.getChatById(id));
    if(!c.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Chat {} not found", id.str())));
    }
    return *c;
}

E<std::optional<ObjectID>> MessagingStore::findChat(const Address& a,
                                                    const Address& b)
{
    ASSIGN_OR_RETURN(auto id, db.getChatIdByKey(chatKey(a, b)));
    return id;
}

E<std::vector<Message>> MessagingStore::getMessages(const ObjectID& chat)
{
    DO_OR_RETURN(getChat(chat));
    ASSIGN_OR_RETURN(auto messages, db.getMessages(chat));
    return messages;
}

E<uint64_t> MessagingStore::getUnreadCount(const ObjectID& chat,
                                           const Address& user)
{
    ASSIGN_OR_RETURN(auto messages, getMessages(chat));
    uint64_t count = 0;
    for(const Message& m : messages)
    {
        if(m.sender != user && !m.is_read)
        {
            count++;
        }
    }
    return count;
}
