#pragma once

#include <cstdint>
#include <vector>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "types.hpp"

// One conversation per unordered pair of users, each with an
// append-only log of encrypted messages.
class MessagingStore
{
public:
    MessagingStore(DatabaseInterface& db, HostInterface& host);

    // Returns the chat between the caller and "other", creating it if
    // there is none yet.
    E<ObjectID> startChat(const Address& caller, const Address& other);
    // Returns the index of the new message.
    E<uint64_t> sendMessage(const Address& caller, const ObjectID& chat,
                            const Bytes& encrypted_content,
                            const Bytes& content_hash);
    // Only the recipient of a message may mark it read, and only once.
    E<void> markAsRead(const Address& caller, const ObjectID& chat,
                       uint64_t index);

    E<Chat> getChat(const ObjectID& id);
    E<std::optional<ObjectID>> findChat(const Address& a, const Address& b);
    // Full history, oldest first.
    E<std::vector<Message>> getMessages(const ObjectID& chat);
    // Messages from the other side that "user" has not read.
    E<uint64_t> getUnreadCount(const ObjectID& chat, const Address& user);

private:
    DatabaseInterface& db;
    HostInterface& host;
};
