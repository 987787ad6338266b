/**
 * @file title_store.hpp
 * @brief Indexed Store Writer: one JSON file per (year, title)
 *
 * Layout under the store root:
 *   <year>/title_<n>.json   one TitleFile
 *   index.json              global index (see index.hpp)
 *
 * Every file is written to "<name>.tmp" and renamed into place, so readers
 * never observe a partial TitleFile. Writers for different (year, title)
 * pairs touch disjoint paths and never contend.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "regmetrics/types.hpp"

namespace regmetrics::store {

// Keys of a written TitleFile (not its content); the index is built from these
struct PartReceipt {
    std::string part_number;
    std::string part_title;
    std::vector<std::string> sections;
};

struct WriteReceipt {
    std::string year;
    std::string title_number;
    std::string location;  // store-relative path
    std::vector<PartReceipt> parts;
};

struct WriteResult {
    bool ok = false;
    std::string error;
    WriteReceipt receipt;  // valid when ok
};

// Seam for the coordinator; tests substitute a failing writer
class TitleFileWriter {
public:
    virtual ~TitleFileWriter() = default;
    virtual WriteResult write(const TitleFile& title) = 0;
};

class TitleStore : public TitleFileWriter {
public:
    explicit TitleStore(std::filesystem::path root);

    // Never throws; failures come back in WriteResult::error
    WriteResult write(const TitleFile& title) override;

    // nullopt if the file does not exist; throws StoreError if it is unreadable
    std::optional<TitleFile> load(const std::string& location) const;
    std::optional<TitleFile> load(const std::string& year, const std::string& title_number) const;

    bool exists(const std::string& location) const;

    const std::filesystem::path& root() const { return root_; }

    static std::string location_for(const std::string& year, const std::string& title_number);
    static WriteReceipt receipt_for(const TitleFile& title);

private:
    std::filesystem::path root_;
};

// Write `content` to `target` through a sibling temp file and rename.
// Throws StoreError(STORE_WRITE_FAILED).
void write_file_atomic(const std::filesystem::path& target, const std::string& content);

// Throws StoreError(STORE_READ_FAILED)
std::string read_file(const std::filesystem::path& path);

} // namespace regmetrics::store
