#include "regmetrics/store/title_store.hpp"

#include <fstream>
#include <sstream>

#include "regmetrics/error.hpp"
#include "regmetrics/logging.hpp"
#include "regmetrics/store/codec.hpp"

namespace fs = std::filesystem;

namespace regmetrics::store {

void write_file_atomic(const fs::path& target, const std::string& content) {
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StoreError(ErrorCode::STORE_WRITE_FAILED,
                             "cannot create directory: " + ec.message(),
                             target.parent_path().string());
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreError(ErrorCode::STORE_WRITE_FAILED, "cannot open for writing", tmp.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw StoreError(ErrorCode::STORE_WRITE_FAILED, "short write", tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StoreError(ErrorCode::STORE_WRITE_FAILED, "rename failed: " + ec.message(),
                         target.string());
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreError(ErrorCode::STORE_READ_FAILED, "cannot open for reading", path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TitleStore::TitleStore(fs::path root) : root_(std::move(root)) {}

std::string TitleStore::location_for(const std::string& year, const std::string& title_number) {
    return year + "/title_" + title_number + ".json";
}

WriteReceipt TitleStore::receipt_for(const TitleFile& title) {
    WriteReceipt receipt;
    receipt.year = title.year;
    receipt.title_number = title.title_number;
    receipt.location = location_for(title.year, title.title_number);
    receipt.parts.reserve(title.parts.size());
    for (const auto& [part_number, part] : title.parts) {
        PartReceipt p;
        p.part_number = part_number;
        p.part_title = part.part_title;
        p.sections.reserve(part.sections.size());
        for (const auto& [section_number, rec] : part.sections) {
            p.sections.push_back(section_number);
        }
        receipt.parts.push_back(std::move(p));
    }
    return receipt;
}

WriteResult TitleStore::write(const TitleFile& title) {
    WriteResult result;
    try {
        REGMETRICS_CHECK_ARGUMENT(!title.year.empty() && !title.title_number.empty(),
                                  "TitleFile needs a year and a title number");

        std::string location = location_for(title.year, title.title_number);
        write_file_atomic(root_ / location, serialize_title_file(title));

        result.receipt = receipt_for(title);
        result.ok = true;
        LOG_DEBUG("Wrote ", location, " (", title.parts.size(), " parts, ",
                  title.section_count(), " sections)");
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }
    return result;
}

bool TitleStore::exists(const std::string& location) const {
    std::error_code ec;
    return fs::is_regular_file(root_ / location, ec);
}

std::optional<TitleFile> TitleStore::load(const std::string& location) const {
    fs::path path = root_ / location;
    if (!exists(location)) {
        return std::nullopt;
    }
    return parse_title_file(read_file(path), path.string());
}

std::optional<TitleFile> TitleStore::load(const std::string& year,
                                          const std::string& title_number) const {
    return load(location_for(year, title_number));
}

} // namespace regmetrics::store
