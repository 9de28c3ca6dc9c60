#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "tessera/chunk/chunker.hpp"
#include "tessera/crypto/digest.hpp"
#include "tessera/store/chunk_store.hpp"
#include "tessera/store/metadata_db.hpp"
#include "tessera/store/session_registry.hpp"
#include "tessera/store/sqlite.hpp"
#include "tessera/sync/sync_coordinator.hpp"
#include "test_utils.hpp"

using namespace tessera;
using namespace tessera::network;

namespace {

// In-memory peer that records everything sent to it
class FakePeer : public Peer {
public:
    explicit FakePeer(std::string id) : id_(std::move(id)) {}

    const std::string& id() const override { return id_; }
    bool is_open() const override { return open_; }

    bool send(const Message& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
        sent_.push_back(message);
        return true;
    }

    void close() override { open_ = false; }

    std::vector<Message> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    template <typename T>
    std::vector<T> received() const {
        std::vector<T> result;
        for (const auto& message : sent()) {
            if (message.type == T::TYPE) {
                result.push_back(message.as<T>());
            }
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

private:
    std::string id_;
    std::atomic<bool> open_{true};
    mutable std::mutex mutex_;
    std::vector<Message> sent_;
};

} // namespace

class SyncCoordinatorTest : public ::testing::Test {
protected:
    static constexpr uint32_t CHUNK_SIZE = 16;
    const std::string session = "room";
    const std::vector<uint8_t> fingerprint = std::vector<uint8_t>(32, 0x5A);

    tessera::test::TempDir dir;
    config::ServerConfig config;
    std::unique_ptr<store::MetadataDb> db;
    std::unique_ptr<store::ChunkStore> store;
    std::unique_ptr<store::SessionRegistry> sessions;
    std::unique_ptr<sync::SyncCoordinator> coordinator;

    void SetUp() override {
        tessera::test::quiet_logging(boost::log::trivial::fatal);
        config.chunk_size = CHUNK_SIZE;
        config.max_items_per_session = 20;
        config.items_per_page = 5;
        db = std::make_unique<store::MetadataDb>(dir.path(), 2);
        store = std::make_unique<store::ChunkStore>(dir.path(), *db, CHUNK_SIZE);
        sessions = std::make_unique<store::SessionRegistry>(*db);
        rebuild();
    }

    void TearDown() override {
        coordinator.reset();
    }

    // Recreates the coordinator after a config change
    void rebuild() {
        coordinator.reset();
        coordinator = std::make_unique<sync::SyncCoordinator>(*store, *sessions, config);
    }

    std::shared_ptr<FakePeer> connect(const std::string& id) {
        auto peer = std::make_shared<FakePeer>(id);
        coordinator->add_peer(peer);
        return peer;
    }

    JoinRequest join_request(const std::string& name, std::vector<std::string> cached = {}) {
        JoinRequest request;
        request.session_id = session;
        request.fingerprint = fingerprint;
        request.chunk_size = CHUNK_SIZE;
        request.client_name = name;
        request.cached_ids = std::move(cached);
        return request;
    }

    std::shared_ptr<FakePeer> joined(const std::string& id, const std::string& name) {
        auto peer = connect(id);
        coordinator->handle_message(id, Message::make(join_request(name)));
        EXPECT_TRUE(coordinator->is_joined(id));
        peer->clear();
        return peer;
    }

    std::vector<ChunkMessage> chunks_for(const std::string& content_id, std::size_t size, uint8_t seed = 0) {
        const auto bytes = tessera::test::pattern_bytes(size, seed);
        const auto parts = chunk::split(bytes, CHUNK_SIZE);
        std::vector<ChunkMessage> result;
        for (const auto& part : parts) {
            ChunkMessage message;
            message.content_id = content_id;
            message.index = part.index;
            message.total_chunks = static_cast<uint32_t>(parts.size());
            message.total_size = bytes.size();
            message.iv = std::vector<uint8_t>(16, seed);
            message.content_type = "application/octet-stream";
            message.name = content_id + ".bin";
            message.data = part.data;
            message.checksum = crypto::sha256(part.data);
            result.push_back(std::move(message));
        }
        return result;
    }

    void upload(const std::string& peer_id, const std::string& content_id, std::size_t size = 48) {
        for (const auto& chunk : chunks_for(content_id, size)) {
            coordinator->handle_message(peer_id, Message::make(chunk));
        }
    }
};

TEST_F(SyncCoordinatorTest, FirstJoinCreatesSession) {
    auto alice = connect("p1");
    coordinator->handle_message("p1", Message::make(join_request("alice")));

    auto results = alice->received<JoinResult>();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].accepted);
    EXPECT_EQ(results[0].client_id, "p1");
    EXPECT_EQ(results[0].members, std::vector<std::string>{"alice#p1"});
    EXPECT_TRUE(sessions->find(session).has_value());

    // Empty session still gets a page
    auto pages = alice->received<ContentPage>();
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].total, 0u);
}

TEST_F(SyncCoordinatorTest, MembersAreToldAboutJoinsAndLeaves) {
    auto alice = joined("p1", "alice");
    auto bob = connect("p2");
    coordinator->handle_message("p2", Message::make(join_request("bob")));

    auto joins = alice->received<ClientJoined>();
    ASSERT_EQ(joins.size(), 1u);
    EXPECT_EQ(joins[0].client_id, "p2");
    EXPECT_EQ(joins[0].client_name, "bob");
    EXPECT_TRUE(bob->received<ClientJoined>().empty());
    EXPECT_EQ(bob->received<JoinResult>()[0].members.size(), 2u);

    coordinator->handle_disconnect("p2");
    auto leaves = alice->received<ClientLeft>();
    ASSERT_EQ(leaves.size(), 1u);
    EXPECT_EQ(leaves[0].client_id, "p2");
    EXPECT_EQ(coordinator->members(session), std::vector<std::string>{"alice#p1"});
}

TEST_F(SyncCoordinatorTest, WrongPassphraseIsRejected) {
    joined("p1", "alice");
    auto mallory = connect("p2");

    auto request = join_request("mallory");
    request.fingerprint = std::vector<uint8_t>(32, 0x00);
    coordinator->handle_message("p2", Message::make(request));

    auto results = mallory->received<JoinResult>();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].accepted);
    EXPECT_EQ(results[0].error, ErrorCode::AUTHENTICATION);
    EXPECT_FALSE(coordinator->is_joined("p2"));
    EXPECT_EQ(sessions->find(session)->fingerprint, fingerprint);
    EXPECT_THROW(coordinator->join("p2", request), sync::AuthenticationError);
}

TEST_F(SyncCoordinatorTest, ChunkSizeMismatchIsConfigurationError) {
    auto peer = connect("p1");
    auto request = join_request("odd");
    request.chunk_size = 1024;
    coordinator->handle_message("p1", Message::make(request));

    auto results = peer->received<JoinResult>();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error, ErrorCode::CONFIGURATION);
    EXPECT_FALSE(sessions->find(session).has_value());
}

TEST_F(SyncCoordinatorTest, MessagesBeforeJoinAreRejected) {
    auto peer = connect("p1");
    coordinator->handle_message("p1", Message::make(ListContent{0, 5}));

    auto errors = peer->received<ErrorMessage>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::PROTOCOL);

    // Liveness works without a session
    coordinator->handle_message("p1", Message::make(Ping{9}));
    ASSERT_EQ(peer->received<Pong>().size(), 1u);
    EXPECT_EQ(peer->received<Pong>()[0].nonce, 9u);
}

TEST_F(SyncCoordinatorTest, ContentIsAnnouncedOnlyAfterFinalize) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");

    auto chunks = chunks_for("c1", 40);
    ASSERT_EQ(chunks.size(), 3u);
    coordinator->handle_message("p1", Message::make(chunks[0]));
    coordinator->handle_message("p1", Message::make(chunks[2]));
    EXPECT_TRUE(bob->received<ContentAvailable>().empty());

    coordinator->handle_message("p1", Message::make(chunks[1]));
    auto available = bob->received<ContentAvailable>();
    ASSERT_EQ(available.size(), 1u);
    EXPECT_EQ(available[0].info.content_id, "c1");
    EXPECT_EQ(available[0].info.total_chunks, 3u);
    EXPECT_EQ(available[0].info.total_size, 40u);
    EXPECT_TRUE(store->is_finalized("c1"));

    EXPECT_EQ(alice->received<ChunkAck>().size(), 3u);
    EXPECT_TRUE(alice->received<ContentAvailable>().empty());
}

TEST_F(SyncCoordinatorTest, RetransmitIsAcknowledgedAsDuplicate) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1");
    upload("p1", "c1");

    auto acks = alice->received<ChunkAck>();
    ASSERT_EQ(acks.size(), 6u);
    EXPECT_FALSE(acks[0].duplicate);
    EXPECT_TRUE(acks[5].duplicate);
    EXPECT_EQ(bob->received<ContentAvailable>().size(), 1u);
}

TEST_F(SyncCoordinatorTest, ConflictingChunkIsRejected) {
    auto alice = joined("p1", "alice");
    upload("p1", "c1");

    auto forged = chunks_for("c1", 48)[0];
    forged.data[0] ^= 0xFF;
    forged.checksum = crypto::sha256(forged.data);
    coordinator->handle_message("p1", Message::make(forged));

    auto errors = alice->received<ChunkErrorMessage>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::CHUNK_CONFLICT);
}

TEST_F(SyncCoordinatorTest, InvalidChunkIsRejected) {
    auto alice = joined("p1", "alice");
    auto chunk = chunks_for("c1", 48)[0];
    chunk.data.resize(3);
    chunk.checksum.clear();
    coordinator->handle_message("p1", Message::make(chunk));

    auto errors = alice->received<ChunkErrorMessage>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::INVALID_CHUNK);
}

TEST_F(SyncCoordinatorTest, RequestedChunksAreServed) {
    joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1", 40);

    coordinator->handle_message("p2", Message::make(RequestChunk{"c1", 2}));
    auto chunks = bob->received<ChunkMessage>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 2u);
    EXPECT_EQ(chunks[0].data.size(), 8u);
    EXPECT_EQ(chunks[0].checksum, crypto::sha256(chunks[0].data));
    EXPECT_EQ(chunks[0].total_chunks, 3u);

    coordinator->handle_message("p2", Message::make(RequestChunk{"missing", 0}));
    coordinator->handle_message("p2", Message::make(RequestChunk{"c1", 7}));
    auto errors = bob->received<ChunkErrorMessage>();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(errors[1].code, ErrorCode::NOT_FOUND);
}

TEST_F(SyncCoordinatorTest, OtherSessionsContentIsInvisible) {
    joined("p1", "alice");
    upload("p1", "c1");

    auto outsider = connect("p9");
    auto request = join_request("eve");
    request.session_id = "elsewhere";
    coordinator->handle_message("p9", Message::make(request));
    outsider->clear();

    coordinator->handle_message("p9", Message::make(RequestChunk{"c1", 0}));
    coordinator->handle_message("p9", Message::make(RemoveContent{"c1"}));
    EXPECT_EQ(outsider->received<ChunkErrorMessage>().size(), 1u);
    EXPECT_EQ(outsider->received<ErrorMessage>().size(), 1u);
    EXPECT_TRUE(store->is_finalized("c1"));
}

TEST_F(SyncCoordinatorTest, RemoveIsBroadcastToEveryMember) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1");

    coordinator->handle_message("p2", Message::make(RemoveContent{"c1"}));
    EXPECT_EQ(alice->received<ContentRemoved>().size(), 1u);
    EXPECT_EQ(bob->received<ContentRemoved>().size(), 1u);
    EXPECT_FALSE(store->find_metadata("c1").has_value());

    // Removing again only confirms to the requester
    coordinator->handle_message("p2", Message::make(RemoveContent{"c1"}));
    EXPECT_EQ(alice->received<ContentRemoved>().size(), 1u);
    EXPECT_EQ(bob->received<ContentRemoved>().size(), 2u);
}

TEST_F(SyncCoordinatorTest, ClearAllSendsOneNoticePerMember) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1");
    upload("p1", "c2");

    coordinator->handle_message("p1", Message::make(ClearAll{session}));

    EXPECT_EQ(alice->received<SessionCleared>().size(), 1u);
    EXPECT_EQ(bob->received<SessionCleared>().size(), 1u);
    EXPECT_TRUE(bob->received<ContentRemoved>().empty());
    EXPECT_EQ(store->list_content(session, 0, 10).total, 0u);
    EXPECT_TRUE(sessions->find(session).has_value());
    EXPECT_FALSE(std::filesystem::exists(store->content_dir(session, "c1")));
    EXPECT_FALSE(std::filesystem::exists(store->content_dir(session, "c2")));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / session));

    coordinator->handle_message("p1", Message::make(ClearAll{"elsewhere"}));
    EXPECT_EQ(alice->received<ErrorMessage>().size(), 1u);
}

TEST_F(SyncCoordinatorTest, FailedClearAnnouncesWhatWasDeleted) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1");
    upload("p1", "c2");
    bob->clear();

    store::Database side(dir.path() / store::MetadataDb::FILE_NAME);
    side.exec("CREATE TRIGGER refuse_c2 BEFORE DELETE ON content WHEN OLD.id = 'c2' "
              "BEGIN SELECT RAISE(ABORT, 'refused'); END;");

    coordinator->handle_message("p1", Message::make(ClearAll{session}));

    auto removed = bob->received<ContentRemoved>();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].content_id, "c1");
    EXPECT_TRUE(bob->received<SessionCleared>().empty());
    EXPECT_TRUE(alice->received<SessionCleared>().empty());

    auto errors = alice->received<ErrorMessage>();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ErrorCode::STORAGE);

    EXPECT_FALSE(store->find_metadata("c1").has_value());
    EXPECT_TRUE(store->is_finalized("c2"));

    // Once storage recovers the clear completes
    side.exec("DROP TRIGGER refuse_c2;");
    bob->clear();
    coordinator->handle_message("p1", Message::make(ClearAll{session}));
    EXPECT_EQ(bob->received<SessionCleared>().size(), 1u);
    EXPECT_EQ(store->list_content(session, 0, 10).total, 0u);
}

TEST_F(SyncCoordinatorTest, ListSendsPageAndAnnouncements) {
    auto alice = joined("p1", "alice");
    upload("p1", "c1");
    upload("p1", "c2");
    upload("p1", "c3");
    alice->clear();

    coordinator->handle_message("p1", Message::make(ListContent{1, 5}));
    auto pages = alice->received<ContentPage>();
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].total, 3u);
    EXPECT_EQ(pages[0].offset, 1u);
    ASSERT_EQ(pages[0].items.size(), 2u);
    EXPECT_EQ(pages[0].items[0].content_id, "c2");
    EXPECT_EQ(pages[0].items[1].content_id, "c1");
    EXPECT_EQ(alice->received<ContentAvailable>().size(), 2u);

    // The page comes after its announcements
    EXPECT_EQ(alice->sent().back().type, MessageType::CONTENT_PAGE);
}

TEST_F(SyncCoordinatorTest, JoinCatchUpSkipsCachedContent) {
    joined("p1", "alice");
    upload("p1", "c1");
    upload("p1", "c2");

    auto carol = connect("p3");
    coordinator->handle_message("p3", Message::make(join_request("carol", {"c1"})));

    auto available = carol->received<ContentAvailable>();
    ASSERT_EQ(available.size(), 1u);
    EXPECT_EQ(available[0].info.content_id, "c2");

    auto pages = carol->received<ContentPage>();
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].items.size(), 2u);
    EXPECT_EQ(carol->sent().front().type, MessageType::JOIN_RESULT);
}

TEST_F(SyncCoordinatorTest, RenameAndPinAreBroadcast) {
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");
    upload("p1", "c1");

    coordinator->handle_message("p2", Message::make(RenameContent{"c1", "report.pdf"}));
    coordinator->handle_message("p2", Message::make(PinContent{"c1", true}));

    auto updates = alice->received<ContentUpdated>();
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].info.name, "report.pdf");
    EXPECT_TRUE(updates[1].info.pinned);
    EXPECT_EQ(bob->received<ContentUpdated>().size(), 2u);

    coordinator->handle_message("p2", Message::make(RenameContent{"missing", "x"}));
    coordinator->handle_message("p2", Message::make(RenameContent{"c1", std::string(300, 'x')}));
    EXPECT_EQ(bob->received<ErrorMessage>().size(), 2u);
    EXPECT_EQ(store->get_metadata("c1").name, "report.pdf");
}

TEST_F(SyncCoordinatorTest, RetentionRemovesOldestUnpinned) {
    config.max_items_per_session = 2;
    rebuild();
    auto alice = joined("p1", "alice");
    auto bob = joined("p2", "bob");

    upload("p1", "c1");
    upload("p1", "c2");
    coordinator->handle_message("p1", Message::make(PinContent{"c1", true}));
    upload("p1", "c3");

    auto removed = bob->received<ContentRemoved>();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].content_id, "c2");
    EXPECT_EQ(alice->received<ContentRemoved>().size(), 1u);
    EXPECT_TRUE(store->is_finalized("c1"));
    EXPECT_TRUE(store->is_finalized("c3"));
}

TEST_F(SyncCoordinatorTest, IdleSessionsExpire) {
    config.session_timeout = std::chrono::milliseconds(20);
    rebuild();
    auto alice = joined("p1", "alice");
    upload("p1", "c1");

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    coordinator->run_housekeeping();

    EXPECT_EQ(alice->received<SessionExpired>().size(), 1u);
    EXPECT_FALSE(store->find_metadata("c1").has_value());
    EXPECT_FALSE(sessions->find(session).has_value());
    EXPECT_FALSE(coordinator->is_joined("p1"));
}

TEST_F(SyncCoordinatorTest, SilentPeersAreDropped) {
    config.heartbeat_timeout = std::chrono::milliseconds(20);
    rebuild();
    auto quiet = connect("p1");
    auto chatty = connect("p2");

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    coordinator->handle_message("p2", Message::make(Ping{1}));
    coordinator->run_housekeeping();

    EXPECT_FALSE(quiet->is_open());
    EXPECT_TRUE(chatty->is_open());
}

TEST_F(SyncCoordinatorTest, StalePendingUploadsAreCollected) {
    config.pending_timeout = std::chrono::milliseconds(20);
    rebuild();
    joined("p1", "alice");
    coordinator->handle_message("p1", Message::make(chunks_for("partial", 48)[0]));

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    coordinator->run_housekeeping();
    EXPECT_FALSE(store->find_metadata("partial").has_value());
}

TEST_F(SyncCoordinatorTest, HealthReportsStore) {
    auto peer = connect("p1");
    coordinator->handle_message("p1", Message::make(HealthCheck{}));
    auto status = peer->received<HealthStatus>();
    ASSERT_EQ(status.size(), 1u);
    EXPECT_TRUE(status[0].healthy);
}

TEST_F(SyncCoordinatorTest, StopClosesEveryPeer) {
    auto alice = joined("p1", "alice");
    auto idle = connect("p2");
    EXPECT_EQ(coordinator->peer_count(), 2u);

    coordinator->stop();
    EXPECT_FALSE(alice->is_open());
    EXPECT_FALSE(idle->is_open());
    EXPECT_EQ(coordinator->peer_count(), 0u);
}
