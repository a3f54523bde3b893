#include "host.hpp"

#include <chrono>
#include <format>
#include <random>
#include <span>

#include <mw/crypto.hpp>
#include <mw/utils.hpp>

Host::Host(const std::string& chain_id) : chain_id(chain_id)
{
    std::random_device rd;
    salt = (static_cast<uint64_t>(rd()) << 32) | rd();
}

int64_t Host::nowMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        mw::Clock::now().time_since_epoch()).count();
}

E<ObjectID> Host::newObjectID()
{
    // Identities are the SHA-256 of a string that never repeats
    // within this process, and is salted against other processes.
    std::string seed = std::format("{}:{:016x}:{}:{}", chain_id, salt,
                                   nowMillis(), counter++);
    ASSIGN_OR_RETURN(auto digest, mw::SHA256Hasher().hashToBytes(seed));
    if(digest.size() != ID_LENGTH)
    {
        return std::unexpected(ledgerError(
            Errc::STORAGE, std::format("Unexpected digest length {}",
                                       digest.size())));
    }
    const auto* data = reinterpret_cast<const unsigned char*>(digest.data());
    return ObjectID::fromBytes(std::span<const unsigned char, ID_LENGTH>(
        data, ID_LENGTH));
}
