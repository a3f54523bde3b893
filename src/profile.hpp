#pragma once

#include <string>

#include "database.hpp"
#include "error.hpp"
#include "host.hpp"
#include "types.hpp"

constexpr size_t MIN_USERNAME_LENGTH = 3;
constexpr size_t MAX_USERNAME_LENGTH = 20;

// Profiles, and the global username -> owner registry.
class IdentityRegistry
{
public:
    IdentityRegistry(DatabaseInterface& db, HostInterface& host);

    // Reserve “username” for the caller and create the caller’s
    // profile. Each address gets at most one profile.
    E<Profile> createProfile(const Address& caller, const std::string& username,
                             const std::string& bio,
                             const std::string& pfp_url);
    // Only the owner may update. A changed username is released and
    // the new one reserved in the same transaction.
    E<Profile> updateProfile(const Address& caller, const ObjectID& profile_id,
                             const std::string& new_username,
                             const std::string& bio,
                             const std::string& pfp_url);

    E<bool> isUsernameAvailable(const std::string& username);
    E<Address> getOwnerByUsername(const std::string& username);
    E<Profile> getProfile(const ObjectID& id);
    E<Profile> getProfileByOwner(const Address& owner);

private:
    DatabaseInterface& db;
    HostInterface& host;
};

E<void> validateUsername(const std::string& username);
