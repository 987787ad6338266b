/**
 * @file index.hpp
 * @brief Global section index and O(1) section lookup
 *
 * The index maps (year, title, part, section) to the store-relative path of
 * the TitleFile holding that section. It is built once per conversion run
 * from write receipts, after every TitleFile write has completed.
 *
 * index.json:
 *   {"<year>": {"<title>": {"file": "<year>/title_<n>.json",
 *                           "parts": {"<part>": {"part_title": "...",
 *                                                "sections": ["1.1", ...]}}}}}
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "regmetrics/store/title_store.hpp"
#include "regmetrics/types.hpp"
#include "regmetrics/util/text.hpp"

namespace regmetrics::store {

struct IndexKey {
    std::string year;
    std::string title_number;
    std::string part_number;
    std::string section_number;

    bool operator==(const IndexKey& other) const {
        return year == other.year && title_number == other.title_number &&
               part_number == other.part_number && section_number == other.section_number;
    }

    std::string to_string() const {
        return year + "/" + title_number + "/" + part_number + "/" + section_number;
    }
};

struct IndexKeyHash {
    size_t operator()(const IndexKey& k) const {
        std::hash<std::string> h;
        size_t seed = h(k.year);
        for (const std::string* s : {&k.title_number, &k.part_number, &k.section_number}) {
            seed ^= h(*s) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

class StoreIndex {
public:
    static constexpr const char* kFileName = "index.json";

    StoreIndex() = default;

    // Throws IndexInconsistencyError if a receipt's TitleFile is not on disk
    // or two receipts claim the same (year, title).
    static StoreIndex build(const std::vector<WriteReceipt>& receipts,
                            const std::filesystem::path& store_root);

    // Throws StoreError if index.json is absent or unreadable
    static StoreIndex load(const std::filesystem::path& store_root);

    static std::filesystem::path path_in(const std::filesystem::path& store_root) {
        return store_root / kFileName;
    }

    // Atomic write of index.json
    void save(const std::filesystem::path& store_root) const;

    bool contains(const IndexKey& key) const { return entries_.count(key) > 0; }
    std::optional<std::string> locate(const IndexKey& key) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Catalogue listings, natural order; empty when the prefix is unknown
    std::vector<std::string> years() const;
    std::vector<std::string> titles(const std::string& year) const;
    std::vector<std::string> parts(const std::string& year, const std::string& title) const;
    std::vector<std::string> sections(const std::string& year, const std::string& title,
                                      const std::string& part) const;

    std::string serialize() const;

private:
    struct PartInfo {
        std::string part_title;
        std::vector<std::string> sections;
    };
    struct TitleInfo {
        std::string file;
        std::map<std::string, PartInfo, util::NumberingLess> parts;
    };
    using TitleMap = std::map<std::string, TitleInfo, util::NumberingLess>;

    void add_title(const std::string& year, const std::string& title, TitleInfo info);

    std::unordered_map<IndexKey, std::string, IndexKeyHash> entries_;
    std::map<std::string, TitleMap, util::NumberingLess> catalogue_;
};

/**
 * @brief Read side of the store: index -> one TitleFile -> one record
 */
class SectionLookup {
public:
    // Loads the index once; throws StoreError if it is missing
    explicit SectionLookup(const std::filesystem::path& store_root);

    // nullopt when the key is not indexed. Throws IndexInconsistencyError when
    // the index names a TitleFile that does not hold the section.
    std::optional<SectionRecord> lookup(const std::string& year,
                                        const std::string& title_number,
                                        const std::string& part_number,
                                        const std::string& section_number) const;

    const StoreIndex& index() const { return index_; }

private:
    TitleStore store_;
    StoreIndex index_;
};

} // namespace regmetrics::store
