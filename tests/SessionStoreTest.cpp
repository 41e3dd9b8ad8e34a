#include <gtest/gtest.h>

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <thread>
#include <vector>

#include "SessionStore.hpp"
#include "TestUtils.hpp"
#include "upload_session.pb.h"

using google::protobuf::util::TimeUtil;

class SessionStoreTest : public ::testing::Test {
   protected:
    FileIdentity MakeIdentity(const std::string& name, std::size_t size) {
        const auto path = dir_ / name;
        WriteFile(path, MakeMp4Data(size));
        auto [ok, identity, err] = MakeFileIdentityFrom(path);
        EXPECT_TRUE(ok) << err.message;
        return identity;
    }

    UploadSession MakeSession(const FileIdentity& identity,
                              std::uint64_t confirmed) {
        UploadSession session;
        session.identity = identity;
        session.upload_url = "https://upload.test/session/" + identity.slot;
        session.confirmed_bytes = confirmed;
        session.total_bytes = identity.size;
        session.content_type = "video/mp4";
        session.created_at = std::chrono::system_clock::now();
        return session;
    }

    TempDir dir_;
    std::filesystem::path state_dir_ = dir_ / "state" / "uploads";
};

TEST_F(SessionStoreTest, SaveThenLoadRoundTrips) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 4096);
    const UploadSession saved = MakeSession(identity, 1024);

    ASSERT_FALSE(store.Save(saved).has_value());
    EXPECT_TRUE(std::filesystem::exists(store.RecordPath(identity)));
    EXPECT_EQ(store.RecordPath(identity).extension().string(), ".upload");

    const auto loaded = store.Load(identity);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->upload_url, saved.upload_url);
    EXPECT_EQ(loaded->confirmed_bytes, 1024u);
    EXPECT_EQ(loaded->total_bytes, 4096u);
    EXPECT_EQ(loaded->content_type, "video/mp4");
    EXPECT_EQ(loaded->identity.key, identity.key);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                  loaded->created_at.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::seconds>(
                  saved.created_at.time_since_epoch()));
}

TEST_F(SessionStoreTest, RecordIsJsonWithFieldNames) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 100);
    ASSERT_FALSE(store.Save(MakeSession(identity, 0)).has_value());

    const std::string json = ReadFile(store.RecordPath(identity));
    for (const char* field :
         {"file_path", "file_identity", "upload_url", "confirmed_bytes",
          "total_bytes", "content_type", "created_time", "updated_time"}) {
        EXPECT_NE(json.find(field), std::string::npos) << field;
    }
}

TEST_F(SessionStoreTest, SaveOverwritesPreviousOffset) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 4096);

    ASSERT_FALSE(store.Save(MakeSession(identity, 1000)).has_value());
    ASSERT_FALSE(store.Save(MakeSession(identity, 3000)).has_value());

    const auto loaded = store.Load(identity);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->confirmed_bytes, 3000u);
    EXPECT_FALSE(std::filesystem::exists(
        store.RecordPath(identity).string() + ".tmp"));
}

TEST_F(SessionStoreTest, MissingRecordIsNotFound) {
    SessionStore store(state_dir_);
    EXPECT_FALSE(store.Load(MakeIdentity("clip.mp4", 10)).has_value());
}

TEST_F(SessionStoreTest, MalformedRecordIsNotFound) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 10);

    std::filesystem::create_directories(state_dir_);
    WriteFile(store.RecordPath(identity), "{ not json");

    EXPECT_FALSE(store.Load(identity).has_value());
}

TEST_F(SessionStoreTest, RecordForDifferentSizeIsNotFound) {
    SessionStore store(state_dir_);
    const FileIdentity before = MakeIdentity("clip.mp4", 4096);
    ASSERT_FALSE(store.Save(MakeSession(before, 2048)).has_value());

    const FileIdentity after = MakeIdentity("clip.mp4", 8192);
    ASSERT_EQ(before.slot, after.slot);

    EXPECT_FALSE(store.Load(after).has_value());
}

TEST_F(SessionStoreTest, SaveRejectsOffsetBeyondTotal) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 100);
    UploadSession session = MakeSession(identity, 0);
    session.confirmed_bytes = 101;

    EXPECT_TRUE(store.Save(session).has_value());
    EXPECT_FALSE(std::filesystem::exists(store.RecordPath(identity)));
}

TEST_F(SessionStoreTest, SaveFailsWhenDirectoryIsAFile) {
    WriteFile(dir_ / "blocked", "x");
    SessionStore store(dir_ / "blocked" / "uploads");

    const auto err = store.Save(MakeSession(MakeIdentity("clip.mp4", 10), 0));
    ASSERT_TRUE(err.has_value());
    EXPECT_FALSE(err->message.empty());
}

TEST_F(SessionStoreTest, DeleteRemovesRecordAndToleratesMissing) {
    SessionStore store(state_dir_);
    const FileIdentity identity = MakeIdentity("clip.mp4", 10);
    ASSERT_FALSE(store.Save(MakeSession(identity, 0)).has_value());

    store.Delete(identity);
    EXPECT_FALSE(std::filesystem::exists(store.RecordPath(identity)));
    EXPECT_FALSE(store.Load(identity).has_value());

    store.Delete(identity);
}

TEST_F(SessionStoreTest, PurgeRemovesOnlyExpiredRecords) {
    SessionStore store(state_dir_);
    const FileIdentity fresh = MakeIdentity("fresh.mp4", 10);
    const FileIdentity old = MakeIdentity("old.mp4", 10);
    ASSERT_FALSE(store.Save(MakeSession(fresh, 0)).has_value());

    UploadSessionRecord record;
    record.set_file_path(old.path.string());
    record.set_file_identity(old.key);
    record.set_upload_url("https://upload.test/session/old");
    record.set_total_bytes(old.size);
    *record.mutable_created_time() =
        TimeUtil::GetCurrentTime() - TimeUtil::HoursToDuration(24 * 10);
    *record.mutable_updated_time() =
        TimeUtil::GetCurrentTime() - TimeUtil::HoursToDuration(24 * 8);

    std::string json;
    ASSERT_TRUE(
        google::protobuf::util::MessageToJsonString(record, &json).ok());
    WriteFile(store.RecordPath(old), json);
    WriteFile(state_dir_ / "unrelated.txt", "keep me");

    ASSERT_TRUE(store.Load(old).has_value());

    EXPECT_EQ(store.PurgeExpired(std::chrono::hours(24 * 7)), 1u);
    EXPECT_FALSE(std::filesystem::exists(store.RecordPath(old)));
    EXPECT_TRUE(std::filesystem::exists(store.RecordPath(fresh)));
    EXPECT_TRUE(std::filesystem::exists(state_dir_ / "unrelated.txt"));
}

TEST_F(SessionStoreTest, PurgeOfMissingDirectoryIsNoop) {
    SessionStore store(dir_ / "does-not-exist");
    EXPECT_EQ(store.PurgeExpired(), 0u);
}

TEST_F(SessionStoreTest, ConcurrentSavesOfDifferentFiles) {
    SessionStore store(state_dir_);

    std::vector<FileIdentity> identities;
    for (int i = 0; i < 8; ++i) {
        identities.push_back(
            MakeIdentity("clip" + std::to_string(i) + ".mp4", 64 + i));
    }

    std::vector<std::thread> threads;
    for (const auto& identity : identities) {
        threads.emplace_back([&, identity] {
            for (std::uint64_t offset = 0; offset <= identity.size;
                 offset += 16) {
                EXPECT_FALSE(store.Save(MakeSession(identity, offset)).has_value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& identity : identities) {
        EXPECT_TRUE(store.Load(identity).has_value()) << identity.slot;
    }
}
