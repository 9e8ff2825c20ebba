#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "TestSupport.hpp"
#include "storage/CredentialStore.hpp"
#include "storage/ProtectedDataStore.hpp"
#include "storage/StorageError.hpp"
#include "storage/Storage.hpp"

namespace fs = std::filesystem;

static std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void spit(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

class StoresTest : public TempDirTest {
protected:
    fs::path usersFile() const { return dir / "user_data.json"; }
    fs::path dataFile() const { return dir / "protected_data.json"; }
};

TEST_F(StoresTest, MissingFilesAreEmptyCollections) {
    JsonCredentialStore users(usersFile());
    JsonProtectedDataStore data(dataFile());

    EXPECT_TRUE(users.load().empty());
    EXPECT_TRUE(users.empty());
    EXPECT_FALSE(users.find("alice").has_value());
    EXPECT_TRUE(data.load().empty());
    EXPECT_TRUE(data.listNotes("alice").empty());

    // Loading does not create anything
    EXPECT_FALSE(fs::exists(usersFile()));
    EXPECT_FALSE(fs::exists(dataFile()));
}

TEST_F(StoresTest, UpsertInsertsAndReplaces) {
    JsonCredentialStore users(usersFile());

    users.upsert(UserRecord("alice", "aa", Role::Admin));
    users.upsert(UserRecord("bob", "bb", Role::User));
    users.upsert(UserRecord("bob", "cc", Role::Admin));

    UserMap all = users.load();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at("bob").password_hash, "cc");
    EXPECT_EQ(all.at("bob").role, Role::Admin);

    auto alice = users.find("alice");
    ASSERT_TRUE(alice.has_value());
    EXPECT_EQ(alice->password_hash, "aa");
}

TEST_F(StoresTest, CredentialLayout) {
    JsonCredentialStore users(usersFile());
    users.upsert(UserRecord("alice", "abc123", Role::Admin));

    auto doc = nlohmann::json::parse(slurp(usersFile()));
    ASSERT_TRUE(doc.contains("alice"));
    EXPECT_EQ(doc["alice"]["username"], "alice");
    EXPECT_EQ(doc["alice"]["passwordHash"], "abc123");
    EXPECT_EQ(doc["alice"]["role"], "admin");
}

TEST_F(StoresTest, SaveOfLoadIsANoOp) {
    JsonCredentialStore users(usersFile());
    users.upsert(UserRecord("zed", "11", Role::User));
    users.upsert(UserRecord("alice", "22", Role::Admin));

    JsonProtectedDataStore data(dataFile());
    data.appendNote("alice", Note("hello \"world\"\nline two", 1700000000));
    data.appendFile("alice", FileRef{ "doc.txt", 1700000100 });

    const std::string usersBefore = slurp(usersFile());
    const std::string dataBefore = slurp(dataFile());

    users.save(users.load());
    data.save(data.load());

    EXPECT_EQ(slurp(usersFile()), usersBefore);
    EXPECT_EQ(slurp(dataFile()), dataBefore);
}

TEST_F(StoresTest, ProtectedLayoutAndTimestamps) {
    JsonProtectedDataStore data(dataFile());
    data.appendNote("alice", Note("n1", 1714564800));

    auto doc = nlohmann::json::parse(slurp(dataFile()));
    ASSERT_TRUE(doc.contains("alice"));
    EXPECT_EQ(doc["alice"]["username"], "alice");
    ASSERT_EQ(doc["alice"]["notes"].size(), 1u);
    EXPECT_EQ(doc["alice"]["notes"][0]["content"], "n1");
    EXPECT_EQ(doc["alice"]["notes"][0]["createdAt"], "2024-05-01T12:00:00Z");
    EXPECT_TRUE(doc["alice"]["files"].is_array());

    auto notes = data.listNotes("alice");
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].created_at, 1714564800);
}

TEST_F(StoresTest, AppendCreatesRecordLazily) {
    JsonProtectedDataStore data(dataFile());
    data.appendNote("bob", Note("a", 1));
    data.appendNote("bob", Note("b", 2));
    data.appendNote("carol", Note("c", 3));

    ProtectedMap all = data.load();
    ASSERT_EQ(all.size(), 2u);
    ASSERT_EQ(all.at("bob").notes.size(), 2u);
    EXPECT_EQ(all.at("bob").notes[0].content, "a");
    EXPECT_EQ(all.at("bob").notes[1].content, "b");
    EXPECT_TRUE(all.at("carol").files.empty());
}

TEST_F(StoresTest, CorruptCredentialFileIsReported) {
    spit(usersFile(), "{ \"alice\": ");
    JsonCredentialStore users(usersFile());

    try {
        users.load();
        FAIL() << "expected StorageError";
    }
    catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageError::Kind::Corrupt);
    }

    // Not repaired behind the caller's back
    EXPECT_EQ(slurp(usersFile()), "{ \"alice\": ");
}

TEST_F(StoresTest, StructurallyWrongDocumentsAreCorrupt) {
    JsonCredentialStore users(usersFile());

    spit(usersFile(), "[1, 2, 3]");
    EXPECT_THROW(users.load(), StorageError);

    spit(usersFile(), R"({"alice": {"username": "alice", "passwordHash": "x"}})");
    EXPECT_THROW(users.load(), StorageError);

    spit(usersFile(), R"({"alice": {"username": "alice", "passwordHash": "x", "role": "root"}})");
    EXPECT_THROW(users.load(), StorageError);

    spit(usersFile(), R"({"alice": {"username": "bob", "passwordHash": "x", "role": "user"}})");
    EXPECT_THROW(users.load(), StorageError);

    JsonProtectedDataStore data(dataFile());
    spit(dataFile(), R"({"alice": {"username": "alice", "notes": [{"content": "x", "createdAt": "yesterday"}], "files": []}})");
    EXPECT_THROW(data.load(), StorageError);

    spit(dataFile(), R"({"alice": "notes"})");
    EXPECT_THROW(data.listNotes("alice"), StorageError);
}

TEST_F(StoresTest, SaveCreatesDataDirectory) {
    JsonCredentialStore users(dir / "nested" / "deeper" / "user_data.json");
    users.upsert(UserRecord("alice", "x", Role::Admin));
    EXPECT_TRUE(fs::exists(dir / "nested" / "deeper" / "user_data.json"));
    EXPECT_FALSE(fs::exists(dir / "nested" / "deeper" / "user_data.json.tmp"));
}

TEST_F(StoresTest, UnwritableLocationIsWriteError) {
    // A regular file where the data directory should be
    spit(dir / "blocker", "x");
    JsonCredentialStore users(dir / "blocker" / "user_data.json");

    try {
        users.upsert(UserRecord("alice", "x", Role::Admin));
        FAIL() << "expected StorageError";
    }
    catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageError::Kind::Write);
    }
}

TEST(IsoTimeTest, FormatAndParse) {
    EXPECT_EQ(formatIsoTime(0), "1970-01-01T00:00:00Z");

    std::time_t t = 0;
    ASSERT_TRUE(parseIsoTime("2024-05-01T12:00:00Z", t));
    EXPECT_EQ(t, 1714564800);

    EXPECT_FALSE(parseIsoTime("2024-05-01 12:00:00", t));
    EXPECT_FALSE(parseIsoTime("2024-13-01T12:00:00Z", t));
    EXPECT_FALSE(parseIsoTime("2024-05-01T12:00:00Zjunk", t));
}

TEST_F(StoresTest, NonUtf8IsNeverRewritten) {
    JsonCredentialStore users(usersFile());
    users.upsert(UserRecord("alice", "aa", Role::Admin));
    const std::string before = slurp(usersFile());

    try {
        users.upsert(UserRecord("caf\xe9", "bb", Role::User));
        FAIL() << "expected StorageError";
    }
    catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageError::Kind::Write);
    }
    EXPECT_EQ(slurp(usersFile()), before);
    EXPECT_FALSE(fs::exists(dir / "user_data.json.tmp"));

    JsonProtectedDataStore data(dataFile());
    EXPECT_THROW(data.appendNote("alice", Note("caf\xe9", 1)), StorageError);
    EXPECT_FALSE(fs::exists(dataFile()));
}

TEST(StorageTextTest, IsStorableText) {
    EXPECT_TRUE(Storage::isStorableText(""));
    EXPECT_TRUE(Storage::isStorableText("plain"));
    EXPECT_TRUE(Storage::isStorableText("caf\xc3\xa9"));
    EXPECT_FALSE(Storage::isStorableText("caf\xe9"));
    EXPECT_FALSE(Storage::isStorableText("\xc3"));
}
