// =============================================================================
// Title Store and Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include "regmetrics/error.hpp"
#include "regmetrics/store/codec.hpp"
#include "regmetrics/store/index.hpp"
#include "regmetrics/store/title_store.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <tuple>
#include <vector>

using namespace regmetrics;
using namespace regmetrics::store;
namespace fs = std::filesystem;

namespace {

SectionRecord make_section(const std::string& year, const std::string& title,
                           const std::string& part, const std::string& section,
                           const std::string& content) {
    SectionRecord rec;
    rec.year = year;
    rec.title_number = title;
    rec.part_number = part;
    rec.part_title = "Part " + part;
    rec.section_number = section;
    rec.section_title = "Section " + section + ".";
    rec.content = content;
    rec.content_empty = content.empty();
    return rec;
}

TitleFile make_title(const std::string& year, const std::string& title) {
    TitleFile tf;
    tf.year = year;
    tf.title_number = title;
    tf.volume = "1";
    tf.volumes = {"1"};
    for (const auto& [part, section, content] :
         std::vector<std::tuple<std::string, std::string, std::string>>{
             {"1", "1.1", "General rule.\n\nSecond paragraph."},
             {"1", "1.10", "Tenth section."},
             {"1", "1.2", ""},
             {"2", "2.1", "Caf\xC3\xA9 \xE2\x80\x9Cquoted\xE2\x80\x9D text."}}) {
        PartContainer& pc = tf.parts[part];
        pc.part_number = part;
        pc.part_title = "Part " + part;
        pc.sections.emplace(section, make_section(year, title, part, section, content));
    }
    return tf;
}

} // namespace

class StoreTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("regm_store_" + std::string(::testing::UnitTest::GetInstance()
                                                ->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    StoreIndex write_and_index(TitleStore& store, const std::vector<TitleFile>& titles) {
        std::vector<WriteReceipt> receipts;
        for (const auto& tf : titles) {
            WriteResult result = store.write(tf);
            EXPECT_TRUE(result.ok) << result.error;
            receipts.push_back(result.receipt);
        }
        StoreIndex index = StoreIndex::build(receipts, root);
        index.save(root);
        return index;
    }
};

TEST_F(StoreTest, WriteThenLookupRoundTrip) {
    TitleStore store(root);
    TitleFile tf = make_title("2023", "1");
    write_and_index(store, {tf});

    EXPECT_TRUE(fs::exists(root / "2023" / "title_1.json"));

    SectionLookup lookup(root);
    auto rec = lookup.lookup("2023", "1", "2", "2.1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(*rec, tf.parts.at("2").sections.at("2.1"));

    auto empty = lookup.lookup("2023", "1", "1", "1.2");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->content_empty);
    EXPECT_TRUE(empty->content.empty());
}

TEST_F(StoreTest, LookupMissReturnsNullopt) {
    TitleStore store(root);
    write_and_index(store, {make_title("2023", "1")});

    SectionLookup lookup(root);
    EXPECT_FALSE(lookup.lookup("2023", "1", "1", "9.9").has_value());
    EXPECT_FALSE(lookup.lookup("2023", "7", "1", "1.1").has_value());
    EXPECT_FALSE(lookup.lookup("1999", "1", "1", "1.1").has_value());
}

TEST_F(StoreTest, RewriteIsByteIdenticalAndLeavesNoTemp) {
    TitleStore store(root);
    TitleFile tf = make_title("2023", "1");

    ASSERT_TRUE(store.write(tf).ok);
    std::string first = slurp(root / "2023" / "title_1.json");
    ASSERT_TRUE(store.write(tf).ok);
    std::string second = slurp(root / "2023" / "title_1.json");

    EXPECT_EQ(first, second);
    EXPECT_FALSE(fs::exists(root / "2023" / "title_1.json.tmp"));
    EXPECT_EQ(first, serialize_title_file(tf));
}

TEST_F(StoreTest, LoadPreservesNaturalOrder) {
    TitleStore store(root);
    ASSERT_TRUE(store.write(make_title("2023", "1")).ok);

    auto loaded = store.load("2023", "1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->volumes, (std::vector<std::string>{"1"}));

    std::vector<std::string> order;
    for (const auto& [number, rec] : loaded->parts.at("1").sections) order.push_back(number);
    EXPECT_EQ(order, (std::vector<std::string>{"1.1", "1.2", "1.10"}));

    EXPECT_FALSE(store.load("2023", "99").has_value());
}

TEST_F(StoreTest, WriteWithoutKeysFails) {
    TitleStore store(root);
    TitleFile tf;
    WriteResult result = store.write(tf);
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(StoreTest, BuildWithMissingFileThrows) {
    WriteReceipt receipt = TitleStore::receipt_for(make_title("2023", "5"));
    EXPECT_THROW(StoreIndex::build({receipt}, root), IndexInconsistencyError);
}

TEST_F(StoreTest, BuildWithDuplicateTitleThrows) {
    TitleStore store(root);
    WriteResult result = store.write(make_title("2023", "1"));
    ASSERT_TRUE(result.ok);
    EXPECT_THROW(StoreIndex::build({result.receipt, result.receipt}, root),
                 IndexInconsistencyError);
}

TEST_F(StoreTest, SaveAndLoadIndex) {
    TitleStore store(root);
    StoreIndex built = write_and_index(store, {make_title("2023", "1"), make_title("2023", "10"),
                                               make_title("2022", "2")});

    StoreIndex loaded = StoreIndex::load(root);
    EXPECT_EQ(loaded.size(), built.size());
    EXPECT_EQ(loaded.size(), 12u);
    EXPECT_EQ(loaded.serialize(), built.serialize());
    EXPECT_TRUE(loaded.contains(IndexKey{"2023", "10", "1", "1.10"}));
    EXPECT_EQ(*loaded.locate(IndexKey{"2022", "2", "2", "2.1"}), "2022/title_2.json");
}

TEST_F(StoreTest, CatalogueListings) {
    TitleStore store(root);
    StoreIndex index = write_and_index(store, {make_title("2023", "10"), make_title("2023", "2"),
                                               make_title("2022", "1")});

    EXPECT_EQ(index.years(), (std::vector<std::string>{"2022", "2023"}));
    EXPECT_EQ(index.titles("2023"), (std::vector<std::string>{"2", "10"}));
    EXPECT_EQ(index.parts("2023", "2"), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(index.sections("2023", "2", "1"), (std::vector<std::string>{"1.1", "1.2", "1.10"}));
    EXPECT_TRUE(index.titles("1999").empty());
    EXPECT_TRUE(index.sections("2023", "2", "9").empty());
}

TEST_F(StoreTest, CorruptTitleFileThrows) {
    fs::create_directories(root / "2023");
    {
        std::ofstream out(root / "2023" / "title_3.json");
        out << "{not json";
    }
    TitleStore store(root);
    EXPECT_THROW(store.load("2023", "3"), StoreError);
    EXPECT_THROW(parse_title_file("[]"), StoreError);
    EXPECT_THROW(parse_title_file(R"({"year":"2023","title_number":"1"})"), StoreError);
}

TEST_F(StoreTest, MissingIndexThrowsOnOpen) {
    EXPECT_THROW(SectionLookup lookup(root), StoreError);
}

TEST_F(StoreTest, IndexedFileRemovedIsInconsistency) {
    TitleStore store(root);
    write_and_index(store, {make_title("2023", "1")});
    fs::remove(root / "2023" / "title_1.json");

    SectionLookup lookup(root);
    EXPECT_THROW(lookup.lookup("2023", "1", "1", "1.1"), IndexInconsistencyError);
}
