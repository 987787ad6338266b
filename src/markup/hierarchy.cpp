// =============================================================================
// hierarchy.cpp - libxml2-backed Hierarchy Parser
// =============================================================================

#include "regmetrics/markup/hierarchy.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cctype>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "regmetrics/logging.hpp"
#include "regmetrics/util/text.hpp"
#include "regmetrics/util/utf8.hpp"

namespace regmetrics::markup {

namespace {

constexpr int kParseOptions = XML_PARSE_RECOVER | XML_PARSE_NONET | XML_PARSE_NOERROR |
                              XML_PARSE_NOWARNING | XML_PARSE_HUGE;

struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

void ensure_libxml_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { xmlInitParser(); });
}

std::string last_libxml_error(const char* fallback) {
    const xmlError* err = xmlGetLastError();
    if (err && err->message) {
        return util::trim(err->message);
    }
    return fallback;
}

const std::unordered_set<std::string_view>& excluded_tags() {
    static const std::unordered_set<std::string_view> tags = {
        "CITA", "CITE", "CITATION", "SOURCE", "AUTH", "SECAUTH", "FTNT", "FTREF",
        "NOTE", "NOTES", "EDNOTE", "EFFDNOT", "EDITNOTE", "CONTENTS", "EAR", "PRTPAGE"
    };
    return tags;
}

const std::unordered_set<std::string_view>& block_tags() {
    static const std::unordered_set<std::string_view> tags = {
        "P", "FP", "HD", "PSPACE", "EXTRACT", "ROW", "LI"
    };
    return tags;
}

std::string element_name(const xmlNode* node) {
    return util::to_upper_ascii(reinterpret_cast<const char*>(node->name));
}

// Split a heading such as "PART 1 - General Provisions" (em or en dash) into
// number and heading. Either side may come back empty.
std::pair<std::string, std::string> split_heading(const std::string& text) {
    static const std::string kEmDash = util::encode_utf8(0x2014);
    static const std::string kEnDash = util::encode_utf8(0x2013);

    size_t pos = text.find(kEmDash);
    size_t len = kEmDash.size();
    if (pos == std::string::npos) {
        pos = text.find(kEnDash);
        len = kEnDash.size();
    }
    if (pos == std::string::npos) {
        pos = text.find(" - ");
        len = 3;
    }
    if (pos == std::string::npos) {
        return {util::strip_number_label(text), std::string()};
    }
    return {util::strip_number_label(text.substr(0, pos)), util::trim(text.substr(pos + len))};
}

// -----------------------------------------------------------------------------
// TreeBuilder - one recursive pass over the libxml2 DOM
// -----------------------------------------------------------------------------

class TreeBuilder {
public:
    TreeBuilder(HierarchyNode& root, const std::string& source)
        : root_(root), source_(source) {}

    void build(xmlNode* root_element) {
        root_.tag = element_name(root_element);
        Cursor cursor{&root_, root_element, nullptr, nullptr, nullptr};
        if (is_structural(root_.tag)) {
            visit_element(root_element, cursor);
        } else {
            visit_children(root_element, cursor);
        }
        flush_all();
    }

    size_t anomalies() const { return anomalies_; }
    size_t excluded() const { return excluded_; }

private:
    struct Cursor {
        HierarchyNode* owner;     // nearest structural node; receives text
        xmlNode* owner_element;   // element that opened `owner`
        HierarchyNode* part;
        HierarchyNode* subpart;
        HierarchyNode* section;
    };

    static bool is_structural(const std::string& tag) {
        return tag == "PART" || tag == "SUBPART" || tag == "SECTION";
    }

    void visit_children(xmlNode* element, const Cursor& cursor) {
        for (xmlNode* child = element->children; child; child = child->next) {
            switch (child->type) {
                case XML_TEXT_NODE:
                case XML_CDATA_SECTION_NODE:
                    append_text(child, element, cursor);
                    break;
                case XML_ELEMENT_NODE:
                    visit_element(child, cursor);
                    break;
                default:
                    break;  // comments, PIs, unresolved entity refs
            }
        }
    }

    void visit_element(xmlNode* element, const Cursor& cursor) {
        std::string tag = element_name(element);

        if (HierarchyParser::is_excluded_tag(tag)) {
            ++excluded_;
            cursor.owner->add_child(std::make_unique<HierarchyNode>(NodeKind::Excluded, tag));
            return;
        }

        if (tag == "PART") {
            open_part(element, tag, cursor);
        } else if (tag == "SUBPART") {
            open_subpart(element, tag, cursor);
        } else if (tag == "SECTION") {
            open_section(element, tag, cursor);
        } else if (element->parent == cursor.owner_element && take_label(element, tag, cursor)) {
            return;
        } else if (block_tags().count(tag)) {
            flush(cursor.owner);
            visit_children(element, cursor);
            flush(cursor.owner);
        } else {
            visit_children(element, cursor);
        }
    }

    void open_part(xmlNode* element, const std::string& tag, const Cursor& cursor) {
        if (cursor.part) {
            anomaly("PART ", describe(cursor.part), " contains another PART; attaching it to the title");
        }
        flush(cursor.owner);
        flush(&root_);
        HierarchyNode& part = root_.add_child(std::make_unique<HierarchyNode>(NodeKind::Part, tag));
        visit_children(element, Cursor{&part, element, &part, nullptr, nullptr});
        flush(&part);
    }

    void open_subpart(xmlNode* element, const std::string& tag, const Cursor& cursor) {
        HierarchyNode* part = cursor.part;
        if (!part) {
            anomaly("SUBPART outside any PART; attaching it to the unassigned part");
            part = unassigned_part();
        } else if (cursor.section || cursor.subpart) {
            anomaly("SUBPART nested below ", describe(cursor.owner), "; attaching it to PART ",
                    describe(part));
        }
        flush(cursor.owner);
        flush(part);
        HierarchyNode& subpart = part->add_child(std::make_unique<HierarchyNode>(NodeKind::Subpart, tag));
        visit_children(element, Cursor{&subpart, element, part, &subpart, nullptr});
        flush(&subpart);
    }

    void open_section(xmlNode* element, const std::string& tag, const Cursor& cursor) {
        HierarchyNode* parent = cursor.subpart ? cursor.subpart : cursor.part;
        if (!parent) {
            anomaly("SECTION outside any PART; attaching it to the unassigned part");
            parent = unassigned_part();
        } else if (cursor.section) {
            anomaly("SECTION nested in SECTION ", describe(cursor.section),
                    "; attaching it beside the outer section");
        }
        flush(cursor.owner);
        flush(parent);
        HierarchyNode& section = parent->add_child(std::make_unique<HierarchyNode>(NodeKind::Section, tag));
        HierarchyNode* part = cursor.part ? cursor.part : parent;
        visit_children(element, Cursor{&section, element, part, cursor.subpart, &section});
        flush(&section);
    }

    // Label elements directly below a structural element name it instead of
    // contributing body text. Returns false when the element is ordinary body.
    bool take_label(xmlNode* element, const std::string& tag, const Cursor& cursor) {
        HierarchyNode& owner = *cursor.owner;

        if (tag == "SECTNO" && owner.kind == NodeKind::Section) {
            if (owner.number.empty()) owner.number = util::strip_number_label(label_text(element));
            return true;
        }
        if (tag == "PARTNO" && owner.kind == NodeKind::Part) {
            if (owner.number.empty()) owner.number = util::strip_number_label(label_text(element));
            return true;
        }
        if ((tag == "SUBJECT" || tag == "RESERVED") && owner.heading.empty()) {
            owner.heading = label_text(element);
            return true;
        }
        if (tag == "HD" && owner.heading.empty() && owner.kind != NodeKind::Section) {
            std::string text = label_text(element);
            if (owner.kind == NodeKind::Title) {
                owner.heading = text;
                return true;
            }
            auto [number, heading] = split_heading(text);
            if (owner.number.empty()) {
                owner.number = number;
                owner.heading = heading;
            } else {
                owner.heading = heading.empty() ? text : heading;
            }
            return true;
        }
        return false;
    }

    // Collapsed text of a label element, excluded descendants skipped
    std::string label_text(const xmlNode* element) {
        std::string out;
        collect_text(element, out);
        return util::collapse_whitespace(out);
    }

    void collect_text(const xmlNode* element, std::string& out) {
        for (const xmlNode* child = element->children; child; child = child->next) {
            if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
                if (child->content) {
                    out += reinterpret_cast<const char*>(child->content);
                }
            } else if (child->type == XML_ELEMENT_NODE &&
                       !HierarchyParser::is_excluded_tag(element_name(child))) {
                out.push_back(' ');
                collect_text(child, out);
                out.push_back(' ');
            }
        }
    }

    void append_text(const xmlNode* text_node, const xmlNode* parent, const Cursor& cursor) {
        if (!text_node->content) return;
        std::string_view text(reinterpret_cast<const char*>(text_node->content));
        HierarchyNode& owner = *cursor.owner;
        std::string& pending = pending_[&owner];

        // Unlabelled structural node: the leading token of its own text is
        // its number ("<SECTION>1.1 ...").
        if (parent == cursor.owner_element && owner.kind != NodeKind::Title &&
            owner.kind != NodeKind::Excluded && owner.number.empty() &&
            owner.paragraphs.empty() && util::trim(pending).empty()) {
            std::string trimmed = util::trim(text);
            if (trimmed.empty()) return;

            size_t cut = 0;
            while (cut < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[cut]))) ++cut;
            owner.number = util::strip_number_label(trimmed.substr(0, cut));
            if (owner.number.empty()) {
                // Lone label word such as "PART"; the number follows
                std::string rest = util::trim(trimmed.substr(cut));
                size_t next = 0;
                while (next < rest.size() && !std::isspace(static_cast<unsigned char>(rest[next]))) ++next;
                owner.number = rest.substr(0, next);
                cut = trimmed.size() - rest.size() + next;
            }
            pending.push_back(' ');
            pending.append(trimmed.substr(cut));
            return;
        }

        pending.push_back(' ');
        pending.append(text);
    }

    void flush(HierarchyNode* node) {
        auto it = pending_.find(node);
        if (it == pending_.end()) return;
        std::string paragraph = util::collapse_whitespace(it->second);
        it->second.clear();
        if (!paragraph.empty()) {
            node->paragraphs.push_back(std::move(paragraph));
        }
    }

    void flush_all() {
        for (auto& [node, text] : pending_) {
            std::string paragraph = util::collapse_whitespace(text);
            text.clear();
            if (!paragraph.empty()) node->paragraphs.push_back(std::move(paragraph));
        }
    }

    HierarchyNode* unassigned_part() {
        if (!unassigned_) {
            flush(&root_);
            auto part = std::make_unique<HierarchyNode>(NodeKind::Part, "PART");
            part->number = kUnassignedPartNumber;
            part->heading = kUnassignedPartTitle;
            part->synthetic = true;
            unassigned_ = &root_.add_child(std::move(part));
        }
        return unassigned_;
    }

    static std::string describe(const HierarchyNode* node) {
        if (!node) return "<none>";
        return node->number.empty() ? std::string("<unnumbered>") : node->number;
    }

    template<typename... Args>
    void anomaly(Args&&... args) {
        ++anomalies_;
        LOG_WARN("Structural anomaly in ", source_, ": ", std::forward<Args>(args)...);
    }

    HierarchyNode& root_;
    const std::string& source_;
    HierarchyNode* unassigned_ = nullptr;
    std::unordered_map<HierarchyNode*, std::string> pending_;
    size_t anomalies_ = 0;
    size_t excluded_ = 0;
};

ParseOutcome build_outcome(DocPtr doc, const std::string& source) {
    ParseOutcome outcome;

    xmlNode* root_element = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
    if (!root_element) {
        outcome.error = "no root element in " + source + ": " +
                        last_libxml_error("document is empty or not markup");
        outcome.error_code = ErrorCode::PARSE_ERROR;
        return outcome;
    }

    HierarchyNode root(NodeKind::Title, "TITLE");
    TreeBuilder builder(root, source);
    builder.build(root_element);

    outcome.anomalies = builder.anomalies();
    outcome.excluded = builder.excluded();
    outcome.root = std::move(root);
    return outcome;
}

void append_extracted(const HierarchyNode& node, std::vector<const std::string*>& out) {
    size_t next_paragraph = 0;
    for (size_t i = 0; i < node.children.size(); ++i) {
        for (; next_paragraph < node.child_slots[i]; ++next_paragraph) {
            out.push_back(&node.paragraphs[next_paragraph]);
        }
        if (node.children[i]->kind != NodeKind::Excluded) {
            append_extracted(*node.children[i], out);
        }
    }
    for (; next_paragraph < node.paragraphs.size(); ++next_paragraph) {
        out.push_back(&node.paragraphs[next_paragraph]);
    }
}

} // namespace

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Title:    return "TITLE";
        case NodeKind::Part:     return "PART";
        case NodeKind::Subpart:  return "SUBPART";
        case NodeKind::Section:  return "SECTION";
        case NodeKind::Excluded: return "EXCLUDED";
    }
    return "UNKNOWN";
}

std::string extract_text(const HierarchyNode& node) {
    if (node.kind == NodeKind::Excluded) return {};

    std::vector<const std::string*> paragraphs;
    append_extracted(node, paragraphs);

    std::string out;
    for (const std::string* p : paragraphs) {
        if (!out.empty()) out += "\n\n";
        out += *p;
    }
    return out;
}

size_t count_nodes(const HierarchyNode& node, NodeKind kind) {
    size_t n = node.kind == kind ? 1 : 0;
    for (const auto& child : node.children) {
        n += count_nodes(*child, kind);
    }
    return n;
}

HierarchyParser::HierarchyParser() {
    ensure_libxml_initialized();
}

bool HierarchyParser::is_excluded_tag(std::string_view upper_tag) {
    return excluded_tags().count(upper_tag) > 0;
}

ParseOutcome HierarchyParser::parse_file(const std::filesystem::path& path) const {
    const std::string source = path.string();
    try {
        xmlResetLastError();
        DocPtr doc(xmlReadFile(source.c_str(), nullptr, kParseOptions));
        return build_outcome(std::move(doc), source);
    } catch (const std::exception& e) {
        ParseOutcome outcome;
        outcome.error = "failed to parse " + source + ": " + e.what();
        outcome.error_code = ErrorCode::PARSE_ERROR;
        return outcome;
    }
}

ParseOutcome HierarchyParser::parse_string(std::string_view markup, const std::string& source_name) const {
    try {
        xmlResetLastError();
        DocPtr doc(xmlReadMemory(markup.data(), static_cast<int>(markup.size()),
                                 source_name.c_str(), nullptr, kParseOptions));
        return build_outcome(std::move(doc), source_name);
    } catch (const std::exception& e) {
        ParseOutcome outcome;
        outcome.error = "failed to parse " + source_name + ": " + e.what();
        outcome.error_code = ErrorCode::PARSE_ERROR;
        return outcome;
    }
}

} // namespace regmetrics::markup
