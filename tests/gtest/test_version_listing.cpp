// =============================================================================
// Version Listing Loader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "regmetrics/error.hpp"
#include "regmetrics/history/version_listing.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace regmetrics;
using namespace regmetrics::history;
namespace fs = std::filesystem;

class VersionListingTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("regm_listing_" + std::string(::testing::UnitTest::GetInstance()
                                                 ->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const fs::path& p, const std::string& text) {
        std::ofstream out(p);
        out << text;
    }
};

TEST_F(VersionListingTest, SingleDocumentObject) {
    auto histories = parse_version_listing(R"({
        "document_id": "doc-9",
        "versions": [
            {"version_date": "2023-02-01", "authors": ["A", "B", 42], "raw_text": "Newest."},
            {"version_date": " 2023-01-01 ", "authors": [], "raw_text": "Oldest."}
        ]})", dir);

    ASSERT_EQ(histories.size(), 1u);
    const DocumentHistory& h = histories[0];
    EXPECT_EQ(h.document_id, "doc-9");
    ASSERT_EQ(h.versions.size(), 2u);
    EXPECT_EQ(h.versions[0].version_date, "2023-02-01");
    EXPECT_EQ(h.versions[0].revision_author_ids, (std::set<std::string>{"42", "A", "B"}));
    EXPECT_EQ(*h.versions[0].raw_text, "Newest.");
    EXPECT_EQ(h.versions[1].version_date, "2023-01-01");
    EXPECT_EQ(h.versions[1].document_id, "doc-9");
    EXPECT_TRUE(h.versions[1].revision_author_ids.empty());
}

TEST_F(VersionListingTest, ArrayOfDocumentsAndNumericIds) {
    auto histories = parse_version_listing(R"([
        {"document_id": "a", "versions": []},
        {"document_id": 17, "versions": [{"version_date": "2023-01-01"}]}
    ])", dir);

    ASSERT_EQ(histories.size(), 2u);
    EXPECT_EQ(histories[0].document_id, "a");
    EXPECT_TRUE(histories[0].versions.empty());
    EXPECT_EQ(histories[1].document_id, "17");
    ASSERT_EQ(histories[1].versions.size(), 1u);
    EXPECT_FALSE(histories[1].versions[0].raw_text.has_value());
}

TEST_F(VersionListingTest, FileReferencesResolvedAgainstBaseDir) {
    write(dir / "v1.xml", "<PART>1<SECTION>1.1 Text.</SECTION></PART>");

    auto histories = parse_version_listing(R"({
        "document_id": "doc-1",
        "versions": [
            {"version_date": "2023-02-01", "file": "absent.xml"},
            {"version_date": "2023-01-01", "file": "v1.xml"}
        ]})", dir);

    ASSERT_EQ(histories.size(), 1u);
    ASSERT_EQ(histories[0].versions.size(), 2u);
    EXPECT_FALSE(histories[0].versions[0].raw_text.has_value());
    ASSERT_TRUE(histories[0].versions[1].raw_text.has_value());
    EXPECT_EQ(*histories[0].versions[1].raw_text, "<PART>1<SECTION>1.1 Text.</SECTION></PART>");
}

TEST_F(VersionListingTest, InvalidListingsThrow) {
    EXPECT_THROW(parse_version_listing("{not json", dir), ParseError);
    EXPECT_THROW(parse_version_listing(R"({"versions": []})", dir), ParseError);
    EXPECT_THROW(parse_version_listing(R"([1, 2])", dir), ParseError);
}

TEST_F(VersionListingTest, DirectoryScanRecordsBadFiles) {
    write(dir / "a.json", R"({"document_id": "doc-a", "versions": []})");
    fs::create_directories(dir / "nested");
    write(dir / "nested" / "b.json", R"([{"document_id": "doc-b"}, {"document_id": "doc-c"}])");
    write(dir / "broken.json", "{");
    write(dir / "notes.txt", "not a listing");

    ListingLoadResult result = load_version_listings(dir);

    ASSERT_EQ(result.histories.size(), 3u);
    EXPECT_EQ(result.histories[0].document_id, "doc-a");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("broken.json"), std::string::npos);
}

TEST_F(VersionListingTest, MissingPathIsError) {
    ListingLoadResult result = load_version_listings(dir / "nowhere");
    EXPECT_TRUE(result.histories.empty());
    EXPECT_EQ(result.errors.size(), 1u);
}
