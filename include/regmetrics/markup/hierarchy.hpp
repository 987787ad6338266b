/**
 * @file hierarchy.hpp
 * @brief Hierarchy Parser: one markup document -> typed structural tree
 *
 * The tree keeps TITLE, PART, SUBPART and SECTION nodes plus EXCLUDED leaves
 * for citation, note and editorial elements. Every other element is a
 * transparent container whose text belongs to the nearest structural node.
 *
 * Recovery rules (each one is a structural anomaly, logged as a warning):
 *   - SECTION or SUBPART outside any PART -> synthetic "unassigned" PART
 *   - PART nested in PART                 -> attached to the title instead
 *   - SECTION nested in SECTION           -> attached beside the outer section
 *
 * parse_file() and parse_string() never throw: failures come back in
 * ParseOutcome::error.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "regmetrics/error.hpp"

namespace regmetrics::markup {

enum class NodeKind {
    Title,
    Part,
    Subpart,
    Section,
    Excluded
};

const char* node_kind_name(NodeKind kind);

inline constexpr const char* kUnassignedPartNumber = "unassigned";
inline constexpr const char* kUnassignedPartTitle = "[Unassigned sections]";

struct HierarchyNode {
    NodeKind kind = NodeKind::Title;
    std::string tag;        // source element name, upper-cased
    std::string number;     // verbatim numbering, label stripped and trimmed
    std::string heading;    // SUBJECT / HD / RESERVED text
    bool synthetic = false; // created by anomaly recovery

    // Directly-owned body paragraphs, whitespace collapsed
    std::vector<std::string> paragraphs;

    std::vector<std::unique_ptr<HierarchyNode>> children;
    // child_slots[i] = paragraphs.size() when children[i] was attached;
    // keeps own text and children in document order
    std::vector<size_t> child_slots;

    HierarchyNode() = default;
    HierarchyNode(NodeKind k, std::string t) : kind(k), tag(std::move(t)) {}

    HierarchyNode& add_child(std::unique_ptr<HierarchyNode> child) {
        child_slots.push_back(paragraphs.size());
        children.push_back(std::move(child));
        return *children.back();
    }
};

// Own paragraphs plus the extracted text of every non-excluded child, in
// document order, joined with blank lines.
std::string extract_text(const HierarchyNode& node);

// Depth-first count of nodes of one kind (the node itself included)
size_t count_nodes(const HierarchyNode& node, NodeKind kind);

struct ParseOutcome {
    std::optional<HierarchyNode> root;  // set on success
    size_t anomalies = 0;
    size_t excluded = 0;
    std::optional<std::string> error;   // set on failure
    ErrorCode error_code = ErrorCode::SUCCESS;

    bool ok() const { return root.has_value() && !error; }
};

class HierarchyParser {
public:
    // Initializes libxml2 once per process; safe to construct from any thread
    HierarchyParser();

    ParseOutcome parse_file(const std::filesystem::path& path) const;

    // `source_name` only labels log lines and errors
    ParseOutcome parse_string(std::string_view markup,
                              const std::string& source_name = "<memory>") const;

    static bool is_excluded_tag(std::string_view upper_tag);
};

} // namespace regmetrics::markup
