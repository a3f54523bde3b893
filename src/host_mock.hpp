#pragma once

#include <gmock/gmock.h>

#include "host.hpp"

class HostMock : public HostInterface
{
public:
    MOCK_METHOD(int64_t, nowMillis, (), (override));
    MOCK_METHOD(E<ObjectID>, newObjectID, (), (override));
};
