#include "regmetrics/store/index.hpp"

#include <boost/json.hpp>

#include "regmetrics/error.hpp"
#include "regmetrics/logging.hpp"
#include "regmetrics/store/codec.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

namespace regmetrics::store {

void StoreIndex::add_title(const std::string& year, const std::string& title, TitleInfo info) {
    auto& titles = catalogue_[year];
    if (titles.count(title)) {
        throw IndexInconsistencyError("title indexed twice", year + "/" + title);
    }
    for (const auto& [part_number, part] : info.parts) {
        for (const auto& section : part.sections) {
            entries_.emplace(IndexKey{year, title, part_number, section}, info.file);
        }
    }
    titles.emplace(title, std::move(info));
}

StoreIndex StoreIndex::build(const std::vector<WriteReceipt>& receipts,
                             const fs::path& store_root) {
    StoreIndex index;
    for (const auto& receipt : receipts) {
        std::error_code ec;
        if (!fs::is_regular_file(store_root / receipt.location, ec)) {
            throw IndexInconsistencyError("no TitleFile behind indexed keys",
                                          (store_root / receipt.location).string());
        }

        TitleInfo info;
        info.file = receipt.location;
        for (const auto& part : receipt.parts) {
            PartInfo p;
            p.part_title = part.part_title;
            p.sections = part.sections;
            info.parts.emplace(part.part_number, std::move(p));
        }
        index.add_title(receipt.year, receipt.title_number, std::move(info));
    }
    LOG_INFO("Index built: ", receipts.size(), " title files, ", index.size(), " sections");
    return index;
}

std::string StoreIndex::serialize() const {
    json::object root;
    for (const auto& [year, titles] : catalogue_) {
        json::object year_obj;
        for (const auto& [title, info] : titles) {
            json::object title_obj;
            title_obj["file"] = info.file;
            json::object parts;
            for (const auto& [part_number, part] : info.parts) {
                json::object p;
                p["part_title"] = part.part_title;
                json::array sections;
                for (const auto& s : part.sections) sections.push_back(json::value(s));
                p["sections"] = std::move(sections);
                parts[part_number] = std::move(p);
            }
            title_obj["parts"] = std::move(parts);
            year_obj[title] = std::move(title_obj);
        }
        root[year] = std::move(year_obj);
    }
    std::string out = json::serialize(root);
    out.push_back('\n');
    return out;
}

void StoreIndex::save(const fs::path& store_root) const {
    write_file_atomic(path_in(store_root), serialize());
}

StoreIndex StoreIndex::load(const fs::path& store_root) {
    fs::path path = path_in(store_root);
    std::error_code fs_ec;
    if (!fs::is_regular_file(path, fs_ec)) {
        throw StoreError(ErrorCode::STORE_READ_FAILED,
                         "no index found; run 'regmetrics convert' first", path.string());
    }
    std::string text = read_file(path);

    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec || !v.is_object()) {
        throw StoreError(ErrorCode::STORE_READ_FAILED,
                         "index is not a JSON object" + (ec ? ": " + ec.message() : std::string()),
                         path.string());
    }

    StoreIndex index;
    for (const auto& year_kv : v.get_object()) {
        std::string year(year_kv.key().data(), year_kv.key().size());
        if (!year_kv.value().is_object()) continue;
        for (const auto& title_kv : year_kv.value().get_object()) {
            std::string title(title_kv.key().data(), title_kv.key().size());
            if (!title_kv.value().is_object()) continue;
            const json::object& t = title_kv.value().get_object();

            TitleInfo info;
            info.file = json_string_or(t, "file", TitleStore::location_for(year, title));
            if (const json::value* parts = t.if_contains("parts"); parts && parts->is_object()) {
                for (const auto& part_kv : parts->get_object()) {
                    std::string part_number(part_kv.key().data(), part_kv.key().size());
                    PartInfo p;
                    if (part_kv.value().is_object()) {
                        const json::object& po = part_kv.value().get_object();
                        p.part_title = json_string_or(po, "part_title", "");
                        if (const json::value* secs = po.if_contains("sections");
                            secs && secs->is_array()) {
                            for (const auto& s : secs->get_array()) {
                                if (s.is_string()) {
                                    p.sections.emplace_back(s.get_string().data(),
                                                            s.get_string().size());
                                }
                            }
                        }
                    }
                    info.parts.emplace(std::move(part_number), std::move(p));
                }
            }
            index.add_title(year, title, std::move(info));
        }
    }
    return index;
}

std::optional<std::string> StoreIndex::locate(const IndexKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> StoreIndex::years() const {
    std::vector<std::string> out;
    for (const auto& [year, titles] : catalogue_) out.push_back(year);
    return out;
}

std::vector<std::string> StoreIndex::titles(const std::string& year) const {
    std::vector<std::string> out;
    auto it = catalogue_.find(year);
    if (it == catalogue_.end()) return out;
    for (const auto& [title, info] : it->second) out.push_back(title);
    return out;
}

std::vector<std::string> StoreIndex::parts(const std::string& year,
                                           const std::string& title) const {
    std::vector<std::string> out;
    auto y = catalogue_.find(year);
    if (y == catalogue_.end()) return out;
    auto t = y->second.find(title);
    if (t == y->second.end()) return out;
    for (const auto& [part, info] : t->second.parts) out.push_back(part);
    return out;
}

std::vector<std::string> StoreIndex::sections(const std::string& year, const std::string& title,
                                              const std::string& part) const {
    auto y = catalogue_.find(year);
    if (y == catalogue_.end()) return {};
    auto t = y->second.find(title);
    if (t == y->second.end()) return {};
    auto p = t->second.parts.find(part);
    if (p == t->second.parts.end()) return {};
    return p->second.sections;
}

// =============================================================================
// SectionLookup
// =============================================================================

SectionLookup::SectionLookup(const fs::path& store_root)
    : store_(store_root), index_(StoreIndex::load(store_root)) {}

std::optional<SectionRecord> SectionLookup::lookup(const std::string& year,
                                                   const std::string& title_number,
                                                   const std::string& part_number,
                                                   const std::string& section_number) const {
    IndexKey key{year, title_number, part_number, section_number};
    auto location = index_.locate(key);
    if (!location) {
        return std::nullopt;
    }

    auto title = store_.load(*location);
    if (!title) {
        throw IndexInconsistencyError("indexed TitleFile is missing", *location);
    }
    auto part = title->parts.find(part_number);
    if (part == title->parts.end()) {
        throw IndexInconsistencyError("indexed part not in TitleFile", key.to_string());
    }
    auto section = part->second.sections.find(section_number);
    if (section == part->second.sections.end()) {
        throw IndexInconsistencyError("indexed section not in TitleFile", key.to_string());
    }
    return section->second;
}

} // namespace regmetrics::store
