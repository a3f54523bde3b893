#pragma once

#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "database.hpp"
#include "host_mock.hpp"
#include "ledger.hpp"

// A ledger over a fresh database file, with a clock the test controls
// and object IDs 0x1, 0x2, ... handed out in order.
class LedgerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        db_path = std::format("test_{}_{}.db", info->test_suite_name(),
                              info->name());
        removeDbFiles();

        auto database = std::make_unique<Database>(db_path);
        auto res = database->init();
        if(!res)
        {
            FAIL() << "Failed to init database: " << mw::errorMsg(res.error());
        }
        auto mock = std::make_unique<::testing::NiceMock<HostMock>>();
        host = mock.get();
        ON_CALL(*host, nowMillis()).WillByDefault([this]() { return now; });
        ON_CALL(*host, newObjectID()).WillByDefault([this]() {
            next_id++;
            return ObjectID::fromStr(std::format("0x{:x}", next_id));
        });
        ledger = std::make_unique<Ledger>(std::move(database), std::move(mock));

        alice = *Address::fromStr("0xa11ce");
        bob = *Address::fromStr("0xb0b");
        carol = *Address::fromStr("0xca201");
    }

    void TearDown() override
    {
        ledger.reset();
        removeDbFiles();
    }

    void removeDbFiles()
    {
        for(const std::string& suffix : {"", "-wal", "-shm"})
        {
            std::filesystem::remove(db_path + suffix);
        }
    }

    std::vector<Event> allEvents()
    {
        auto events = ledger->events().since(0, 1000);
        EXPECT_TRUE(events.has_value());
        return events.value_or(std::vector<Event>());
    }

    std::vector<Event> eventsOfType(Event::Type type)
    {
        std::vector<Event> result;
        for(Event& e : allEvents())
        {
            if(e.type == type)
            {
                result.push_back(std::move(e));
            }
        }
        return result;
    }

    std::string db_path;
    std::unique_ptr<Ledger> ledger;
    ::testing::NiceMock<HostMock>* host = nullptr;
    int64_t now = 1000;
    uint64_t next_id = 0;

    Address alice;
    Address bob;
    Address carol;
};
