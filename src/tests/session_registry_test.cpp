#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include "tessera/store/metadata_db.hpp"
#include "tessera/store/session_registry.hpp"
#include "test_utils.hpp"

using namespace tessera::store;

class SessionRegistryTest : public ::testing::Test {
protected:
    tessera::test::TempDir dir;
    std::unique_ptr<MetadataDb> db;
    std::unique_ptr<SessionRegistry> sessions;

    const std::vector<uint8_t> fingerprint = std::vector<uint8_t>(32, 0x11);
    const std::vector<uint8_t> other = std::vector<uint8_t>(32, 0x22);

    void SetUp() override {
        tessera::test::quiet_logging();
        db = std::make_unique<MetadataDb>(dir.path(), 2);
        sessions = std::make_unique<SessionRegistry>(*db);
    }
};

TEST_F(SessionRegistryTest, FirstJoinCreatesSession) {
    EXPECT_FALSE(sessions->find("room").has_value());
    EXPECT_TRUE(sessions->verify_or_create("room", fingerprint));

    auto record = sessions->find("room");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "room");
    EXPECT_EQ(record->fingerprint, fingerprint);
    EXPECT_GT(record->created_at, 0);
}

TEST_F(SessionRegistryTest, MatchingFingerprintIsAccepted) {
    ASSERT_TRUE(sessions->verify_or_create("room", fingerprint));
    EXPECT_TRUE(sessions->verify_or_create("room", fingerprint));
}

TEST_F(SessionRegistryTest, MismatchLeavesRecordUntouched) {
    ASSERT_TRUE(sessions->verify_or_create("room", fingerprint));
    auto before = sessions->find("room");

    EXPECT_FALSE(sessions->verify_or_create("room", other));

    auto after = sessions->find("room");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->fingerprint, fingerprint);
    EXPECT_EQ(after->last_active, before->last_active);
}

TEST_F(SessionRegistryTest, RecordsSurviveReopen) {
    ASSERT_TRUE(sessions->verify_or_create("room", fingerprint));
    sessions.reset();
    db.reset();

    db = std::make_unique<MetadataDb>(dir.path(), 2);
    sessions = std::make_unique<SessionRegistry>(*db);
    EXPECT_FALSE(sessions->verify_or_create("room", other));
    EXPECT_TRUE(sessions->verify_or_create("room", fingerprint));
}

TEST_F(SessionRegistryTest, IdleSessionsExpire) {
    ASSERT_TRUE(sessions->verify_or_create("idle", fingerprint));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ASSERT_TRUE(sessions->verify_or_create("busy", fingerprint));

    EXPECT_TRUE(sessions->expired(std::chrono::hours(1)).empty());

    auto expired = sessions->expired(std::chrono::milliseconds(15));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].id, "idle");

    sessions->touch("idle");
    EXPECT_TRUE(sessions->expired(std::chrono::milliseconds(15)).empty());
}

TEST_F(SessionRegistryTest, RemoveDeletesRecord) {
    ASSERT_TRUE(sessions->verify_or_create("room", fingerprint));
    EXPECT_TRUE(sessions->remove("room"));
    EXPECT_FALSE(sessions->remove("room"));
    EXPECT_FALSE(sessions->find("room").has_value());

    // Anyone can recreate an expired session
    EXPECT_TRUE(sessions->verify_or_create("room", other));
}
