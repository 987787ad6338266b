#include "regmetrics/markup/record_builder.hpp"

#include <set>
#include <utility>

#include "regmetrics/logging.hpp"

namespace regmetrics::markup {

namespace {

constexpr const char* kUnknownNumber = "unknown";

struct BuildContext {
    const std::string& year;
    const std::string& title_number;
    std::vector<SectionRecord>& out;
};

void collect_sections(const HierarchyNode& node, const HierarchyNode* part, BuildContext& ctx) {
    for (const auto& child : node.children) {
        switch (child->kind) {
            case NodeKind::Excluded:
                break;
            case NodeKind::Part:
                collect_sections(*child, child.get(), ctx);
                break;
            case NodeKind::Section: {
                SectionRecord rec;
                rec.year = ctx.year;
                rec.title_number = ctx.title_number;
                if (part) {
                    rec.part_number = part->number.empty() ? kUnknownNumber : part->number;
                    rec.part_title = part->heading;
                } else {
                    rec.part_number = kUnassignedPartNumber;
                    rec.part_title = kUnassignedPartTitle;
                }
                rec.section_number = child->number.empty() ? kUnknownNumber : child->number;
                rec.section_title = child->heading;
                rec.content = extract_text(*child);
                rec.content_empty = rec.content.empty();
                ctx.out.push_back(std::move(rec));
                break;
            }
            default:
                collect_sections(*child, part, ctx);
                break;
        }
    }
}

} // namespace

std::vector<SectionRecord> build_section_records(const HierarchyNode& root,
                                                 const std::string& year,
                                                 const std::string& title_number) {
    std::vector<SectionRecord> records;
    BuildContext ctx{year, title_number, records};
    const HierarchyNode* part = root.kind == NodeKind::Part ? &root : nullptr;
    collect_sections(root, part, ctx);
    return records;
}

AssembleStats merge_into_title_file(TitleFile& title,
                                    const std::vector<SectionRecord>& records,
                                    const std::string& volume) {
    AssembleStats stats;
    std::set<std::pair<std::string, std::string>> from_this_volume;
    if (title.volume.empty()) title.volume = volume;
    title.volumes.push_back(volume);

    for (const auto& rec : records) {
        auto [part_it, part_added] = title.parts.try_emplace(rec.part_number);
        PartContainer& part = part_it->second;
        if (part_added) {
            part.part_number = rec.part_number;
            part.part_title = rec.part_title;
        } else if (part.part_title.empty()) {
            part.part_title = rec.part_title;
        }

        auto [sec_it, sec_added] = part.sections.try_emplace(rec.section_number, rec);
        auto key = std::make_pair(rec.part_number, rec.section_number);
        if (sec_added) {
            from_this_volume.insert(std::move(key));
            ++stats.added;
        } else if (from_this_volume.count(key)) {
            sec_it->second = rec;
            ++stats.replaced;
            LOG_WARN("Section ", rec.section_number, " repeats in part ", rec.part_number,
                     " of title ", title.title_number, " (", title.year, ", vol ", volume,
                     "); keeping the later occurrence");
        } else {
            ++stats.duplicates;
            LOG_WARN("Duplicate section ", rec.section_number, " in part ", rec.part_number,
                     " of title ", title.title_number, " (", title.year, ", vol ", volume,
                     "); keeping the occurrence from an earlier volume");
        }
    }
    return stats;
}

TitleFile assemble_title_file(const std::vector<SectionRecord>& records,
                              const std::string& year,
                              const std::string& title_number,
                              const std::string& volume) {
    TitleFile title;
    title.year = year;
    title.title_number = title_number;
    merge_into_title_file(title, records, volume);
    return title;
}

} // namespace regmetrics::markup
