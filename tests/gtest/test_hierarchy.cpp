// =============================================================================
// Hierarchy Parser Tests
// =============================================================================

#include <gtest/gtest.h>
#include "regmetrics/markup/hierarchy.hpp"
#include <filesystem>
#include <string>

using namespace regmetrics;
using namespace regmetrics::markup;

namespace {

const HierarchyNode* find_first(const HierarchyNode& node, NodeKind kind) {
    if (node.kind == kind) return &node;
    for (const auto& child : node.children) {
        if (const HierarchyNode* hit = find_first(*child, kind)) return hit;
    }
    return nullptr;
}

const HierarchyNode* find_section(const HierarchyNode& node, const std::string& number) {
    if (node.kind == NodeKind::Section && node.number == number) return &node;
    for (const auto& child : node.children) {
        if (const HierarchyNode* hit = find_section(*child, number)) return hit;
    }
    return nullptr;
}

} // namespace

class HierarchyTest : public ::testing::Test {
protected:
    HierarchyParser parser;
};

TEST_F(HierarchyTest, CitationExcludedFromSectionContent) {
    auto outcome = parser.parse_string(
        "<PART>1<SECTION>1.1<CITATION>Source: 61 FR 100</CITATION>"
        "This part applies to all regulations.</SECTION></PART>");

    ASSERT_TRUE(outcome.ok()) << *outcome.error;
    EXPECT_EQ(outcome.excluded, 1u);
    EXPECT_EQ(outcome.anomalies, 0u);

    const HierarchyNode* part = find_first(*outcome.root, NodeKind::Part);
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->number, "1");

    const HierarchyNode* section = find_section(*outcome.root, "1.1");
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(extract_text(*section), "This part applies to all regulations.");
}

TEST_F(HierarchyTest, LabelledDocument) {
    auto outcome = parser.parse_string(
        "<CFRDOC><TITLE>\n"
        "  <PART>\n"
        "    <HD SOURCE=\"HED\">PART 1\xE2\x80\x94GENERAL PROVISIONS</HD>\n"
        "    <CONTENTS><SECTNO>1.1</SECTNO></CONTENTS>\n"
        "    <AUTH><P>5 U.S.C. 301.</P></AUTH>\n"
        "    <SECTION>\n"
        "      <SECTNO>\xC2\xA7 1.1</SECTNO>\n"
        "      <SUBJECT>Scope.</SUBJECT>\n"
        "      <P>First   paragraph.</P>\n"
        "      <P>Second\n paragraph.</P>\n"
        "    </SECTION>\n"
        "    <SECTION>\n"
        "      <SECTNO>\xC2\xA7 1.2</SECTNO>\n"
        "      <RESERVED>[Reserved]</RESERVED>\n"
        "    </SECTION>\n"
        "  </PART>\n"
        "</TITLE></CFRDOC>");

    ASSERT_TRUE(outcome.ok()) << *outcome.error;
    EXPECT_EQ(outcome.excluded, 2u);

    const HierarchyNode* part = find_first(*outcome.root, NodeKind::Part);
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->number, "1");
    EXPECT_EQ(part->heading, "GENERAL PROVISIONS");

    const HierarchyNode* scope = find_section(*outcome.root, "1.1");
    ASSERT_NE(scope, nullptr);
    EXPECT_EQ(scope->heading, "Scope.");
    EXPECT_EQ(extract_text(*scope), "First paragraph.\n\nSecond paragraph.");

    const HierarchyNode* reserved = find_section(*outcome.root, "1.2");
    ASSERT_NE(reserved, nullptr);
    EXPECT_EQ(reserved->heading, "[Reserved]");
    EXPECT_TRUE(extract_text(*reserved).empty());

    // Part-level text is only the excluded authority and contents
    EXPECT_TRUE(part->paragraphs.empty());
    EXPECT_EQ(count_nodes(*outcome.root, NodeKind::Section), 2u);
}

TEST_F(HierarchyTest, SectionOutsidePartGoesToUnassignedPart) {
    auto outcome = parser.parse_string("<DOC><SECTION>5.1 Lone text.</SECTION></DOC>");

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.anomalies, 1u);

    const HierarchyNode* part = find_first(*outcome.root, NodeKind::Part);
    ASSERT_NE(part, nullptr);
    EXPECT_TRUE(part->synthetic);
    EXPECT_EQ(part->number, kUnassignedPartNumber);
    EXPECT_EQ(part->heading, kUnassignedPartTitle);

    const HierarchyNode* section = find_section(*part, "5.1");
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(extract_text(*section), "Lone text.");
}

TEST_F(HierarchyTest, NestedSectionAttachedBesideOuter) {
    auto outcome = parser.parse_string(
        "<PART>1<SECTION>1.1 Outer.<SECTION>1.2 Inner.</SECTION></SECTION></PART>");

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.anomalies, 1u);

    const HierarchyNode* part = find_first(*outcome.root, NodeKind::Part);
    ASSERT_NE(part, nullptr);
    ASSERT_EQ(part->children.size(), 2u);
    EXPECT_EQ(part->children[0]->number, "1.1");
    EXPECT_EQ(part->children[1]->number, "1.2");
    EXPECT_EQ(extract_text(*part->children[0]), "Outer.");
    EXPECT_EQ(extract_text(*part->children[1]), "Inner.");
}

TEST_F(HierarchyTest, NestedPartAttachedToTitle) {
    auto outcome = parser.parse_string(
        "<DOC><PART>1<PART>2<SECTION>2.1 Body.</SECTION></PART></PART></DOC>");

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.anomalies, 1u);
    ASSERT_EQ(outcome.root->children.size(), 2u);
    EXPECT_EQ(outcome.root->children[0]->number, "1");
    EXPECT_EQ(outcome.root->children[1]->number, "2");
    EXPECT_EQ(count_nodes(*outcome.root->children[1], NodeKind::Section), 1u);
}

TEST_F(HierarchyTest, SubpartHeadingNumber) {
    auto outcome = parser.parse_string(
        "<PART><HD>PART 2\xE2\x80\x94Rules</HD>"
        "<SUBPART><HD>Subpart A\xE2\x80\x94General</HD>"
        "<SECTION><SECTNO>\xC2\xA7 2.1</SECTNO><P>Text.</P></SECTION>"
        "</SUBPART></PART>");

    ASSERT_TRUE(outcome.ok());
    const HierarchyNode* subpart = find_first(*outcome.root, NodeKind::Subpart);
    ASSERT_NE(subpart, nullptr);
    EXPECT_EQ(subpart->number, "A");
    EXPECT_EQ(subpart->heading, "General");
    EXPECT_EQ(count_nodes(*outcome.root, NodeKind::Subpart), 1u);
    EXPECT_NE(find_section(*subpart, "2.1"), nullptr);
}

TEST_F(HierarchyTest, EmptyInputIsParseError) {
    auto outcome = parser.parse_string("");
    EXPECT_FALSE(outcome.ok());
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error_code, ErrorCode::PARSE_ERROR);
}

TEST_F(HierarchyTest, RecoversFromUnclosedTags) {
    auto outcome = parser.parse_string("<PART>1<SECTION>1.1 Text that never closes");
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(count_nodes(*outcome.root, NodeKind::Section), 1u);
}

TEST_F(HierarchyTest, ExtractKeepsDocumentOrder) {
    auto outcome = parser.parse_string(
        "<PART>1 Intro.<SECTION>1.1 Body.</SECTION>Outro.</PART>");

    ASSERT_TRUE(outcome.ok());
    const HierarchyNode* part = find_first(*outcome.root, NodeKind::Part);
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(extract_text(*part), "Intro.\n\nBody.\n\nOutro.");
}

TEST_F(HierarchyTest, LowercaseTags) {
    auto outcome = parser.parse_string("<part>3<section>3.1 Lower.</section></part>");

    ASSERT_TRUE(outcome.ok());
    const HierarchyNode* section = find_section(*outcome.root, "3.1");
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(section->tag, "SECTION");
    EXPECT_EQ(extract_text(*section), "Lower.");
}

TEST_F(HierarchyTest, MissingFileIsError) {
    auto outcome = parser.parse_file(std::filesystem::path("/nonexistent/regm/CFR-2023-title1-vol1.xml"));
    EXPECT_FALSE(outcome.ok());
    EXPECT_TRUE(outcome.error.has_value());
}

TEST_F(HierarchyTest, ExcludedTagSet) {
    EXPECT_TRUE(HierarchyParser::is_excluded_tag("CITA"));
    EXPECT_TRUE(HierarchyParser::is_excluded_tag("FTNT"));
    EXPECT_FALSE(HierarchyParser::is_excluded_tag("P"));
    EXPECT_STREQ(node_kind_name(NodeKind::Subpart), "SUBPART");
}
