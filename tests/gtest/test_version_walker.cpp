// =============================================================================
// Version History Walker Tests
// =============================================================================

#include <gtest/gtest.h>
#include "regmetrics/history/version_walker.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace regmetrics;
using namespace regmetrics::history;

namespace {

VersionRecord make_version(const std::string& date, std::optional<std::string> text,
                           std::set<std::string> authors) {
    VersionRecord v;
    v.document_id = "doc-1";
    v.version_date = date;
    v.raw_text = std::move(text);
    v.revision_author_ids = std::move(authors);
    return v;
}

DocumentHistory make_history(std::vector<VersionRecord> versions) {
    DocumentHistory h;
    h.document_id = "doc-1";
    h.versions = std::move(versions);
    return h;
}

} // namespace

class VersionWalkerTest : public ::testing::Test {
protected:
    DocumentHistory three_versions() {
        return make_history({
            make_version("2023-03-01", "Third text. It grew.", {"A", "C"}),
            make_version("2023-02-01", "Second text.", {"B"}),
            make_version("2023-01-01", "First text.", {"A"}),
        });
    }
};

TEST_F(VersionWalkerTest, CumulativeAuthorsNewestFirst) {
    VersionWalker walker(three_versions());
    std::vector<MetricsRecord> records = walker.walk();

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].metrics_date, "2023-03-01");
    EXPECT_EQ(records[0].total_authors, 3u);
    EXPECT_EQ(records[0].revision_authors, 2u);
    EXPECT_EQ(records[1].metrics_date, "2023-02-01");
    EXPECT_EQ(records[1].total_authors, 2u);
    EXPECT_EQ(records[1].revision_authors, 1u);
    EXPECT_EQ(records[2].metrics_date, "2023-01-01");
    EXPECT_EQ(records[2].total_authors, 1u);
    EXPECT_EQ(records[2].revision_authors, 1u);

    EXPECT_EQ(records[0].document_id, "doc-1");
    EXPECT_EQ(records[0].sentence_count, 2u);
    EXPECT_EQ(records[0].content_snapshot, "Third text. It grew.");
    EXPECT_EQ(walker.computed(), 3u);
}

TEST_F(VersionWalkerTest, StateTransitions) {
    VersionWalker walker(three_versions());
    EXPECT_EQ(walker.state(), WalkState::AtLatest);
    EXPECT_EQ(walker.position(), 0u);

    auto first = walker.step();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->metrics_date, "2023-03-01");
    EXPECT_EQ(walker.state(), WalkState::Walking);

    ASSERT_TRUE(walker.step().has_value());
    EXPECT_EQ(walker.state(), WalkState::Walking);

    ASSERT_TRUE(walker.step().has_value());
    EXPECT_EQ(walker.state(), WalkState::Done);
    EXPECT_EQ(walker.position(), 3u);

    EXPECT_FALSE(walker.step().has_value());
    EXPECT_EQ(walker.state(), WalkState::Done);
    EXPECT_STREQ(walk_state_name(walker.state()), "DONE");
}

TEST_F(VersionWalkerTest, EmptyHistory) {
    VersionWalker walker(make_history({}));
    EXPECT_EQ(walker.state(), WalkState::AtLatest);
    EXPECT_TRUE(walker.walk().empty());
    EXPECT_EQ(walker.state(), WalkState::Done);
    EXPECT_EQ(walker.version_count(), 0u);
}

TEST_F(VersionWalkerTest, MissingVersionSkippedWithoutAuthors) {
    VersionWalker walker(make_history({
        make_version("2023-03-01", "Third text.", {"A", "C"}),
        make_version("2023-02-01", std::nullopt, {"B"}),
        make_version("2023-01-01", "First text.", {"A"}),
    }));

    EXPECT_EQ(walker.status(1), VersionStatus::Missing);
    std::vector<MetricsRecord> records = walker.walk();

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].metrics_date, "2023-03-01");
    EXPECT_EQ(records[0].total_authors, 2u);
    EXPECT_EQ(records[1].metrics_date, "2023-01-01");
    EXPECT_EQ(records[1].total_authors, 1u);
    EXPECT_EQ(walker.skipped_missing(), 1u);
    EXPECT_EQ(walker.skipped_malformed(), 0u);
}

TEST_F(VersionWalkerTest, MalformedDatesSkipped) {
    VersionWalker walker(make_history({
        make_version("2023-05-01", "Latest.", {"A"}),
        make_version("2023-05-01", "Duplicate date.", {"B"}),
        make_version("bad", "Bad date.", {"C"}),
        make_version("2023-06-01", "Out of order.", {"D"}),
        make_version("2023-04-01", "Older.", {"E"}),
    }));

    EXPECT_EQ(walker.status(0), VersionStatus::Valid);
    EXPECT_EQ(walker.status(1), VersionStatus::Malformed);
    EXPECT_EQ(walker.status(2), VersionStatus::Malformed);
    EXPECT_EQ(walker.status(3), VersionStatus::Malformed);
    EXPECT_EQ(walker.status(4), VersionStatus::Valid);

    std::vector<MetricsRecord> records = walker.walk();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].total_authors, 2u);
    EXPECT_EQ(records[1].total_authors, 1u);
    EXPECT_EQ(walker.skipped_malformed(), 3u);
}

TEST_F(VersionWalkerTest, MistypedOldDateDoesNotDropOlderVersions) {
    VersionWalker walker(make_history({
        make_version("2023-03-01", "March.", {"A"}),
        make_version("2003-02-01", "Typo in the year.", {"B"}),
        make_version("2023-01-01", "January.", {"C"}),
        make_version("2022-12-01", "December.", {"D"}),
        make_version("2022-11-01", "November.", {"E"}),
    }));

    EXPECT_EQ(walker.status(0), VersionStatus::Valid);
    EXPECT_EQ(walker.status(1), VersionStatus::Malformed);
    EXPECT_EQ(walker.status(2), VersionStatus::Valid);
    EXPECT_EQ(walker.status(3), VersionStatus::Valid);
    EXPECT_EQ(walker.status(4), VersionStatus::Valid);

    std::vector<MetricsRecord> records = walker.walk();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].metrics_date, "2023-03-01");
    EXPECT_EQ(records[0].total_authors, 4u);
    EXPECT_EQ(records[1].metrics_date, "2023-01-01");
    EXPECT_EQ(records[3].metrics_date, "2022-11-01");
    EXPECT_EQ(records[3].total_authors, 1u);
    EXPECT_EQ(walker.skipped_malformed(), 1u);
}

TEST_F(VersionWalkerTest, MistypedNewDateIsTheOneSkipped) {
    VersionWalker walker(make_history({
        make_version("2023-04-01", "April.", {"A"}),
        make_version("2033-03-01", "Typo in the year.", {"B"}),
        make_version("2023-02-01", "February.", {"C"}),
        make_version("2023-01-01", "January.", {"D"}),
    }));

    EXPECT_EQ(walker.status(0), VersionStatus::Valid);
    EXPECT_EQ(walker.status(1), VersionStatus::Malformed);
    EXPECT_EQ(walker.status(2), VersionStatus::Valid);
    EXPECT_EQ(walker.status(3), VersionStatus::Valid);
    EXPECT_EQ(walker.walk().size(), 3u);
}

TEST_F(VersionWalkerTest, TotalsNeverIncreaseTowardOlderVersions) {
    VersionWalker walker(make_history({
        make_version("2023-06-01", "F.", {"A"}),
        make_version("2023-05-01", "E.", {"B", "C"}),
        make_version("2023-04-01", "D.", {}),
        make_version("2023-03-01", std::nullopt, {"Z"}),
        make_version("2023-02-01", "B.", {"A", "B"}),
        make_version("2023-01-01", "A.", {"D"}),
    }));

    for (size_t i = 1; i < walker.version_count(); ++i) {
        EXPECT_GE(walker.cumulative_authors(i - 1), walker.cumulative_authors(i));
    }
    EXPECT_EQ(walker.cumulative_authors(0), 4u);
    EXPECT_EQ(walker.cumulative_authors(5), 1u);
}

TEST_F(VersionWalkerTest, MarkupVersionUsesStructure) {
    VersionWalker walker(make_history({
        make_version("2023-01-01",
                "<PART>1<SUBPART><HD>Subpart A\xE2\x80\x94General</HD>"
                "<SECTION>1.1 Alpha beta.</SECTION><SECTION>1.2 Gamma.</SECTION>"
                "<CITA>Ignored citation.</CITA></SUBPART></PART>",
                {"A"}),
    }));

    std::vector<MetricsRecord> records = walker.walk();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].section_count, 2u);
    EXPECT_EQ(records[0].subpart_count, 1u);
    EXPECT_EQ(records[0].content_snapshot, "Alpha beta.\n\nGamma.");
    EXPECT_EQ(records[0].word_count, 3u);
    EXPECT_EQ(records[0].paragraph_count, 2u);
}

TEST_F(VersionWalkerTest, UnparseableMarkupIsMalformed) {
    VersionWalker walker(make_history({
        make_version("2023-02-01", "<!-- nothing but a comment -->", {"A"}),
        make_version("2023-01-01", "Plain text.", {"B"}),
    }));

    EXPECT_EQ(walker.status(0), VersionStatus::Malformed);
    std::vector<MetricsRecord> records = walker.walk();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].total_authors, 1u);
}

TEST_F(VersionWalkerTest, ReservedOnlyVersionHasNoWords) {
    VersionWalker walker(make_history({
        make_version("2023-01-01",
                "<PART>2<SECTION><SECTNO>\xC2\xA7 2.1</SECTNO>"
                "<RESERVED>[Reserved]</RESERVED></SECTION></PART>",
                {}),
    }));

    std::vector<MetricsRecord> records = walker.walk();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].word_count, 0u);
    EXPECT_EQ(records[0].section_count, 1u);
    EXPECT_NEAR(records[0].language_complexity_score, 0.1, 1e-9);
    EXPECT_NEAR(records[0].readability_score, 100.0, 1e-9);
    EXPECT_EQ(records[0].total_authors, 0u);
}

TEST_F(VersionWalkerTest, SnapshotCanBeDisabled) {
    WalkerOptions options;
    options.keep_snapshot = false;
    VersionWalker walker(three_versions(), options);

    for (const auto& record : walker.walk()) {
        EXPECT_TRUE(record.content_snapshot.empty());
        EXPECT_GT(record.word_count, 0u);
    }
}
