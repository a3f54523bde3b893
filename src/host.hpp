#pragma once

#include <cstdint>
#include <string>

#include "error.hpp"
#include "types.hpp"

// The services of the execution host the stores depend on.
class HostInterface
{
public:
    virtual ~HostInterface() = default;

    // Current chain time, in milliseconds since the Unix epoch.
    virtual int64_t nowMillis() = 0;
    // A fresh, globally unique object identity.
    virtual E<ObjectID> newObjectID() = 0;
};

class Host : public HostInterface
{
public:
    explicit Host(const std::string& chain_id);

    int64_t nowMillis() override;
    E<ObjectID> newObjectID() override;

private:
    std::string chain_id;
    uint64_t salt;
    uint64_t counter = 0;
};
