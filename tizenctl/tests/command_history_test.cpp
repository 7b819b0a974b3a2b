#include <gtest/gtest.h>

#include "core/command_history.hpp"
#include "core/token_store.hpp"

namespace {

tv::CommandResult resultFor(const std::string& key) {
    tv::CommandResult result;
    result.key = key;
    result.timestamp = tv::nowMillis();
    return result;
}

}

TEST(CommandHistoryTest, MostRecentFirstAndCapped) {
    CommandHistory history;
    EXPECT_EQ(history.capacity(), CommandHistory::DEFAULT_CAPACITY);

    for (int i = 0; i < 12; i++) {
        history.record(resultFor("KEY_" + std::to_string(i)));
    }

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 10u);
    EXPECT_EQ(entries.front().key, "KEY_11");
    EXPECT_EQ(entries.back().key, "KEY_2");

    history.clear();
    EXPECT_EQ(history.size(), 0u);
}

TEST(CommandHistoryTest, ZeroCapacityKeepsNothing) {
    CommandHistory history(0);
    history.record(resultFor("KEY_POWER"));
    EXPECT_EQ(history.size(), 0u);
}

TEST(CommandResultTest, JsonShape) {
    tv::CommandResult result = resultFor("KEY_MUTE");
    result.outcome = tv::CommandOutcome::Retried;

    nlohmann::json json = result;
    EXPECT_EQ(json["command"], "KEY_MUTE");
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["retried"], true);
    EXPECT_FALSE(json.contains("error"));

    result.outcome = tv::CommandOutcome::Failed;
    result.error = "Connection closed";
    json = result;
    EXPECT_EQ(json["success"], false);
    EXPECT_EQ(json["error"], "Connection closed");
}

TEST(TokenStoreTest, DefaultsForUnknownHosts) {
    TokenStore store;
    tv::PairingCredential credential = store.get("10.0.0.1");
    EXPECT_FALSE(credential.paired);
    EXPECT_FALSE(credential.hasToken());
    EXPECT_FALSE(store.contains("10.0.0.1"));
}

TEST(TokenStoreTest, PutRemoveAndIgnoreEmptyHost) {
    TokenStore store;
    tv::PairingCredential credential;
    credential.token = "111";
    credential.paired = true;

    store.put("10.0.0.1", credential);
    store.put("", credential);
    EXPECT_EQ(store.hosts(), (std::vector<std::string>{"10.0.0.1"}));
    EXPECT_EQ(store.get("10.0.0.1").token.value_or(""), "111");

    store.remove("10.0.0.1");
    EXPECT_FALSE(store.contains("10.0.0.1"));
}
