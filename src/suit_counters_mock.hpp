#pragma once

#include <gmock/gmock.h>

#include "suits.hpp"

class SuitCountersMock : public SuitCountersInterface
{
public:
    MOCK_METHOD(E<Address>, creatorOf, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, incrementLike, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, decrementLike, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, incrementComment, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, incrementRetweet, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, decrementRetweet, (const ObjectID&), (override));
    MOCK_METHOD(E<void>, addTipAmount, (const ObjectID&, int64_t), (override));
};
