// =============================================================================
// Session Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "store/SessionStore.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace store;
using capture::Message;
using capture::Role;

namespace fs = std::filesystem;

class SessionStoreTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("tk_store_") + info->name());
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static SessionRecord record(const std::string& conversation, const std::string& captured_at,
                                const std::string& question, const std::string& answer) {
        SessionRecord r;
        r.conversation = conversation;
        r.captured_at = captured_at;
        r.messages = {Message{Role::User, question}, Message{Role::Assistant, answer}};
        return r;
    }
};

TEST_F(SessionStoreTest, MissingRecordIsNotFound) {
    SessionStore s(dir_.string());
    SessionRecord r;
    EXPECT_FALSE(s.load("Budget.xlsx", r));
    EXPECT_TRUE(s.list().empty());
    EXPECT_EQ(s.count(), 0u);
}

TEST_F(SessionStoreTest, SaveThenLoad) {
    SessionStore s(dir_.string());
    SessionRecord rec = record("Budget.xlsx", "2026-03-01T10:00:00Z", "Sum column B", "Added =SUM(B:B).");
    rec.messages.push_back(Message{Role::User, "Now chart it"});
    rec.messages.push_back(Message{Role::Assistant, "Chart inserted."});
    rec.snapshot_digest = "1f2e";

    s.save(rec);
    EXPECT_FALSE(rec.id.empty());
    EXPECT_TRUE(fs::exists(s.path_for("Budget.xlsx")));

    SessionRecord back;
    std::string err;
    ASSERT_TRUE(s.load("Budget.xlsx", back, &err));
    EXPECT_TRUE(err.empty()) << err;
    EXPECT_EQ(back.id, rec.id);
    EXPECT_EQ(back.conversation, "Budget.xlsx");
    EXPECT_EQ(back.captured_at, "2026-03-01T10:00:00Z");
    EXPECT_EQ(back.model, "claude-for-excel");
    EXPECT_EQ(back.snapshot_digest, "1f2e");
    EXPECT_EQ(back.messages, rec.messages);
    EXPECT_EQ(back.user_prompt, "Sum column B");
    EXPECT_EQ(back.assistant_response, "Added =SUM(B:B).\n\nChart inserted.");
}

TEST_F(SessionStoreTest, SavingAgainKeepsId) {
    SessionStore s(dir_.string());
    SessionRecord rec = record("Budget.xlsx", "2026-03-01T10:00:00Z", "Q", "A");
    s.save(rec);
    const std::string id = rec.id;

    rec.messages.push_back(Message{Role::User, "Q2"});
    s.save(rec);

    SessionRecord back;
    ASSERT_TRUE(s.load("Budget.xlsx", back));
    EXPECT_EQ(back.id, id);
    EXPECT_EQ(back.messages.size(), 3u);
    EXPECT_EQ(s.count(), 1u);
}

TEST_F(SessionStoreTest, RecordWithoutConversationIsRefused) {
    SessionStore s(dir_.string());
    SessionRecord rec;
    EXPECT_THROW(s.save(rec), std::runtime_error);
}

TEST_F(SessionStoreTest, SimilarNamesGetDistinctFiles) {
    SessionStore s(dir_.string());
    EXPECT_NE(s.path_for("a/b"), s.path_for("a_b"));
    EXPECT_EQ(s.path_for("a/b").parent_path(), dir_);
}

TEST_F(SessionStoreTest, ListIsMostRecentFirst) {
    SessionStore s(dir_.string());
    SessionRecord older = record("Old.xlsx", "2026-01-01T00:00:00Z", "Old question", "Old answer");
    SessionRecord newer = record("New.xlsx", "2026-02-01T00:00:00Z", "New question", "New answer");
    s.save(older);
    s.save(newer);

    auto all = s.list();

    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].conversation, "New.xlsx");
    EXPECT_EQ(all[1].conversation, "Old.xlsx");
    EXPECT_EQ(all[0].message_count, 2u);
    EXPECT_EQ(all[0].user_prompt_preview, "New question");
}

TEST_F(SessionStoreTest, PreviewIsTruncated) {
    SessionStore s(dir_.string());
    SessionRecord rec = record("Long.xlsx", "2026-01-01T00:00:00Z", std::string(300, 'q'), "A");
    s.save(rec);

    auto all = s.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].user_prompt_preview.size(), 200u);
}

TEST_F(SessionStoreTest, SearchIsCaseInsensitive) {
    SessionStore s(dir_.string());
    SessionRecord a = record("A.xlsx", "2026-01-01T00:00:00Z", "Build a Pivot table", "Done");
    SessionRecord b = record("B.xlsx", "2026-01-02T00:00:00Z", "Format dates", "Applied the PIVOT style too");
    SessionRecord c = record("C.xlsx", "2026-01-03T00:00:00Z", "Chart sales", "Inserted a chart");
    s.save(a);
    s.save(b);
    s.save(c);

    auto hits = s.search("pivot");

    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].conversation, "B.xlsx");
    EXPECT_EQ(hits[1].conversation, "A.xlsx");
    EXPECT_TRUE(s.search("no such words").empty());
}

TEST_F(SessionStoreTest, RemoveDeletesRecord) {
    SessionStore s(dir_.string());
    SessionRecord rec = record("Budget.xlsx", "2026-01-01T00:00:00Z", "Q", "A");
    s.save(rec);

    EXPECT_TRUE(s.remove("Budget.xlsx"));
    EXPECT_FALSE(s.remove("Budget.xlsx"));

    SessionRecord back;
    EXPECT_FALSE(s.load("Budget.xlsx", back));
}

TEST_F(SessionStoreTest, ClearRemovesEveryRecord) {
    SessionStore s(dir_.string());
    EXPECT_EQ(s.clear(), 0u);

    SessionRecord a = record("A.xlsx", "2026-01-01T00:00:00Z", "Q", "A");
    SessionRecord b = record("B.xlsx", "2026-01-02T00:00:00Z", "Q", "A");
    s.save(a);
    s.save(b);
    ASSERT_EQ(s.count(), 2u);

    EXPECT_EQ(s.clear(), 2u);
    EXPECT_EQ(s.count(), 0u);
    EXPECT_TRUE(s.list().empty());
}

TEST_F(SessionStoreTest, FindById) {
    SessionStore s(dir_.string());
    SessionRecord a = record("A.xlsx", "2026-01-01T00:00:00Z", "Pivot please", "Done");
    SessionRecord b = record("B.xlsx", "2026-01-02T00:00:00Z", "Chart please", "Done");
    s.save(a);
    s.save(b);

    SessionRecord found;
    ASSERT_TRUE(s.find_by_id(b.id, found));
    EXPECT_EQ(found.conversation, "B.xlsx");
    EXPECT_EQ(found.user_prompt, "Chart please");

    EXPECT_FALSE(s.find_by_id("no-such-id", found));
    EXPECT_FALSE(s.find_by_id("", found));
}

TEST_F(SessionStoreTest, OffSchemaHistoryLoadsEmpty) {
    SessionStore s(dir_.string());
    fs::create_directories(dir_);
    {
        std::ofstream out(s.path_for("Broken.xlsx"));
        out << R"({"id":"x1","conversation":"Broken.xlsx","messages":[{"role":"robot","content":"?"}]})";
    }

    SessionRecord back;
    std::string err;
    ASSERT_TRUE(s.load("Broken.xlsx", back, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(back.id, "x1");
    EXPECT_TRUE(back.messages.empty());
}

TEST_F(SessionStoreTest, UnparseableFileLoadsEmpty) {
    SessionStore s(dir_.string());
    fs::create_directories(dir_);
    {
        std::ofstream out(s.path_for("Garbage.xlsx"));
        out << "{{{";
    }

    SessionRecord back;
    std::string err;
    ASSERT_TRUE(s.load("Garbage.xlsx", back, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(back.conversation, "Garbage.xlsx");
    EXPECT_TRUE(back.messages.empty());
    EXPECT_TRUE(s.list().empty());
}

TEST(DerivedFieldsTest, FirstUserPromptAndJoinedReplies) {
    SessionRecord rec;
    rec.messages = {
        Message{Role::Assistant, "Welcome back."},
        Message{Role::User, "First"},
        Message{Role::User, "Second"},
        Message{Role::Assistant, "Reply"},
    };
    refresh_derived_fields(rec);

    EXPECT_EQ(rec.user_prompt, "First");
    EXPECT_EQ(rec.assistant_response, "Welcome back.\n\nReply");
}
