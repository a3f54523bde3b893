#include "profile.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "events.hpp"
#include "transaction.hpp"
#include "utils.hpp"

namespace {

E<void> validateText(const std::string& s, std::string_view what)
{
    if(!utf8Length(s).has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_INPUT, std::format("{} is not valid UTF-8", what)));
    }
    return {};
}

} // namespace

E<void> validateUsername(const std::string& username)
{
    auto length = utf8Length(username);
    if(!length.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_USERNAME, "Username is not valid UTF-8"));
    }
    if(*length < MIN_USERNAME_LENGTH || *length > MAX_USERNAME_LENGTH)
    {
        return std::unexpected(ledgerError(
            Errc::INVALID_USERNAME,
            std::format("Username must be {} to {} characters long",
                        MIN_USERNAME_LENGTH, MAX_USERNAME_LENGTH)));
    }
    return {};
}

IdentityRegistry::IdentityRegistry(DatabaseInterface& db, HostInterface& host)
    : db(db), host(host)
{
}

E<Profile> IdentityRegistry::createProfile(
    const Address& caller, const std::string& username,
    const std::string& bio, const std::string& pfp_url)
{
    DO_OR_RETURN(validateUsername(username));
    DO_OR_RETURN(validateText(bio, "Bio"));
    DO_OR_RETURN(validateText(pfp_url, "Profile picture URL"));

    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(auto owner, db.getUsernameOwner(username));
    if(owner.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::USERNAME_TAKEN,
            std::format("Username {} is taken", username)));
    }
    ASSIGN_OR_RETURN(auto existing, db.getProfileByOwner(caller));
    if(existing.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::PROFILE_EXISTS,
            std::format("{} already has a profile", caller.str())));
    }

    Profile p;
    ASSIGN_OR_RETURN(p.id, host.newObjectID());
    p.owner = caller;
    p.username = username;
    p.bio = bio;
    p.pfp_url = pfp_url;
    p.created_at = host.nowMillis();

    DO_OR_RETURN(db.addUsername(username, caller));
    DO_OR_RETURN(db.createProfile(p));
    DO_OR_RETURN(db.appendEvent(events::profileCreated(p)));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Created profile {} for {} as {}", p.id.str(),
                  caller.str(), username);
    return p;
}

E<Profile> IdentityRegistry::updateProfile(
    const Address& caller, const ObjectID& profile_id,
    const std::string& new_username, const std::string& bio,
    const std::string& pfp_url)
{
    DO_OR_RETURN(validateText(bio, "Bio"));
    DO_OR_RETURN(validateText(pfp_url, "Profile picture URL"));

    ASSIGN_OR_RETURN(auto tx, Transaction::begin(db));
    ASSIGN_OR_RETURN(auto found, db.getProfileById(profile_id));
    if(!found.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND,
            std::format("Profile {} not found", profile_id.str())));
    }
    Profile p = *std::move(found);
    if(p.owner != caller)
    {
        return std::unexpected(ledgerError(
            Errc::NOT_OWNER, "Only the owner may update a profile"));
    }

    std::string old_username = p.username;
    if(new_username != old_username)
    {
        DO_OR_RETURN(validateUsername(new_username));
        ASSIGN_OR_RETURN(auto owner, db.getUsernameOwner(new_username));
        if(owner.has_value())
        {
            return std::unexpected(ledgerError(
                Errc::USERNAME_TAKEN,
                std::format("Username {} is taken", new_username)));
        }
        DO_OR_RETURN(db.removeUsername(old_username));
        DO_OR_RETURN(db.addUsername(new_username, caller));
        p.username = new_username;
    }
    p.bio = bio;
    p.pfp_url = pfp_url;

    DO_OR_RETURN(db.updateProfile(p));
    DO_OR_RETURN(db.appendEvent(
        events::profileUpdated(p, old_username, host.nowMillis())));
    DO_OR_RETURN(tx.commit());
    spdlog::debug("Updated profile {}", p.id.str());
    return p;
}

E<bool> IdentityRegistry::isUsernameAvailable(const std::string& username)
{
    ASSIGN_OR_RETURN(auto owner, db.getUsernameOwner(username));
    return !owner.has_value();
}

E<Address> IdentityRegistry::getOwnerByUsername(const std::string& username)
{
    ASSIGN_OR_RETURN(auto owner, db.getUsernameOwner(username));
    if(!owner.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Username {} not found", username)));
    }
    return *owner;
}

E<Profile> IdentityRegistry::getProfile(const ObjectID& id)
{
    ASSIGN_OR_RETURN(auto p, db.getProfileById(id));
    if(!p.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND, std::format("Profile {} not found", id.str())));
    }
    return *std::move(p);
}

E<Profile> IdentityRegistry::getProfileByOwner(const Address& owner)
{
    ASSIGN_OR_RETURN(auto p, db.getProfileByOwner(owner));
    if(!p.has_value())
    {
        return std::unexpected(ledgerError(
            Errc::NOT_FOUND,
            std::format("{} has no profile", owner.str())));
    }
    return *std::move(p);
}
