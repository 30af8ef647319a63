/**
 * @file user_store_test.cpp
 * @brief Tests for UserStore accounts and its JSON form
 */

#include <gtest/gtest.h>
#include "wharf/HashUtils.h"
#include "wharf/UserStore.h"

#include <nlohmann/json.hpp>

using namespace Wharf;

TEST(UserStoreTest, AddedUserAuthenticates) {
    UserStore store;
    std::string err;
    ASSERT_TRUE(store.addUser("alice", "wonderland", "/srv/alice", false, err)) << err;
    EXPECT_TRUE(store.hasUser("alice"));
    EXPECT_EQ(store.size(), 1u);

    UserAccount account;
    ASSERT_TRUE(store.authenticate("alice", "wonderland", account));
    EXPECT_EQ(account.name, "alice");
    EXPECT_EQ(account.homeDirectory, "/srv/alice");
    EXPECT_FALSE(account.canWrite);
}

TEST(UserStoreTest, WrongPasswordAndUnknownUserFail) {
    UserStore store;
    std::string err;
    ASSERT_TRUE(store.addUser("alice", "wonderland", "/srv/alice", true, err)) << err;

    UserAccount account;
    EXPECT_FALSE(store.authenticate("alice", "Wonderland", account));
    EXPECT_FALSE(store.authenticate("bob", "wonderland", account));
    EXPECT_TRUE(account.name.empty());
}

TEST(UserStoreTest, PasswordIsNeverStoredInClear) {
    UserStore store;
    std::string err;
    ASSERT_TRUE(store.addUser("alice", "wonderland", "/srv/alice", true, err)) << err;

    const std::string dumped = store.toJson().dump();
    EXPECT_EQ(dumped.find("wonderland"), std::string::npos);
}

TEST(UserStoreTest, PrehashedEntryRoundTripsThroughJson) {
    UserAccount account;
    account.name = "carol";
    account.salt = "a1b2";
    account.passwordSha256Hex = HashUtils::hashPassword("a1b2", "secret");
    account.homeDirectory = "/srv/carol";

    UserStore original;
    original.addAccount(account);

    UserStore restored;
    std::string err;
    ASSERT_TRUE(UserStore::fromJson(original.toJson(), restored, err)) << err;

    UserAccount out;
    EXPECT_TRUE(restored.authenticate("carol", "secret", out));
    EXPECT_EQ(out.homeDirectory, "/srv/carol");
}

TEST(UserStoreTest, PlainPasswordEntryIsHashedOnLoad) {
    const auto j = nlohmann::json::parse(
        R"([{"name": "dave", "home": "/srv/dave", "password": "pw", "write": false}])");

    UserStore store;
    std::string err;
    ASSERT_TRUE(UserStore::fromJson(j, store, err)) << err;

    UserAccount account;
    ASSERT_TRUE(store.authenticate("dave", "pw", account));
    EXPECT_FALSE(account.canWrite);
    EXPECT_EQ(account.salt.size(), 32u);
}

TEST(UserStoreTest, InvalidEntriesAreRejected) {
    UserStore store;
    std::string err;

    EXPECT_FALSE(UserStore::fromJson(nlohmann::json::object(), store, err));
    EXPECT_FALSE(UserStore::fromJson(nlohmann::json::parse(R"([{"home": "/x", "password": "p"}])"),
                                     store, err));
    EXPECT_FALSE(UserStore::fromJson(nlohmann::json::parse(R"([{"name": "e", "password": "p"}])"),
                                     store, err));
    EXPECT_FALSE(UserStore::fromJson(nlohmann::json::parse(R"([{"name": "e", "home": "/x"}])"),
                                     store, err));
    EXPECT_FALSE(UserStore::fromJson(
        nlohmann::json::parse(R"([{"name": "e", "home": "/x", "password_sha256": "zz"}])"),
        store, err));
    EXPECT_FALSE(err.empty());
}
