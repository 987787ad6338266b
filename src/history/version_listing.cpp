#include "regmetrics/history/version_listing.hpp"

#include <algorithm>

#include <boost/json.hpp>

#include "regmetrics/error.hpp"
#include "regmetrics/logging.hpp"
#include "regmetrics/store/codec.hpp"
#include "regmetrics/store/title_store.hpp"
#include "regmetrics/util/text.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

namespace regmetrics::history {

namespace {

VersionRecord parse_version(const json::value& v, const std::string& document_id,
                            const fs::path& base_dir) {
    VersionRecord rec;
    rec.document_id = document_id;
    if (!v.is_object()) {
        LOG_WARN("Document ", document_id, ": version entry is not an object");
        return rec;  // empty date, rejected by the walker
    }
    const json::object& obj = v.get_object();
    rec.version_date = util::trim(store::json_string_or(obj, "version_date", ""));

    if (const json::value* authors = obj.if_contains("authors"); authors && authors->is_array()) {
        for (const auto& a : authors->get_array()) {
            if (a.is_string()) {
                rec.revision_author_ids.emplace(a.get_string().data(), a.get_string().size());
            } else if (a.is_int64()) {
                rec.revision_author_ids.insert(std::to_string(a.get_int64()));
            }
        }
    }

    if (const json::value* text = obj.if_contains("raw_text"); text && text->is_string()) {
        rec.raw_text = std::string(text->get_string().data(), text->get_string().size());
    } else if (const json::value* file = obj.if_contains("file"); file && file->is_string()) {
        fs::path p(std::string(file->get_string().data(), file->get_string().size()));
        if (p.is_relative()) p = base_dir / p;
        try {
            rec.raw_text = store::read_file(p);
        } catch (const RegMetricsException& e) {
            LOG_WARN("Document ", document_id, " version ", rec.version_date,
                     ": cannot read ", p.string(), " (", e.what(), ")");
        }
    }
    return rec;
}

DocumentHistory parse_document(const json::value& v, const fs::path& base_dir,
                               const std::string& origin) {
    if (!v.is_object()) {
        throw ParseError("listing entry is not an object", origin);
    }
    const json::object& obj = v.get_object();

    DocumentHistory history;
    history.document_id = store::json_string_or(obj, "document_id", "");
    if (history.document_id.empty()) {
        if (const json::value* id = obj.if_contains("document_id"); id && id->is_int64()) {
            history.document_id = std::to_string(id->get_int64());
        }
    }
    if (history.document_id.empty()) {
        throw ParseError("listing entry has no document_id", origin);
    }

    if (const json::value* versions = obj.if_contains("versions"); versions && versions->is_array()) {
        for (const auto& entry : versions->get_array()) {
            history.versions.push_back(parse_version(entry, history.document_id, base_dir));
        }
    }
    return history;
}

} // namespace

std::vector<DocumentHistory> parse_version_listing(std::string_view json_text,
                                                   const fs::path& base_dir,
                                                   const std::string& origin) {
    json::error_code ec;
    json::value root = json::parse(json::string_view(json_text.data(), json_text.size()), ec);
    if (ec) {
        throw ParseError("invalid listing JSON: " + ec.message(), origin);
    }

    std::vector<DocumentHistory> histories;
    if (root.is_array()) {
        for (const auto& doc : root.get_array()) {
            histories.push_back(parse_document(doc, base_dir, origin));
        }
    } else {
        histories.push_back(parse_document(root, base_dir, origin));
    }
    return histories;
}

ListingLoadResult load_version_listings(const fs::path& path) {
    ListingLoadResult result;

    std::vector<fs::path> files;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        for (const auto& entry : fs::recursive_directory_iterator(
                path, fs::directory_options::skip_permission_denied)) {
            if (entry.is_regular_file() &&
                util::to_upper_ascii(entry.path().extension().string()) == ".JSON") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
    } else if (fs::is_regular_file(path, ec)) {
        files.push_back(path);
    } else {
        result.errors.push_back("listing path not found: " + path.string());
        LOG_ERROR(result.errors.back());
        return result;
    }

    for (const auto& file : files) {
        try {
            auto histories = parse_version_listing(store::read_file(file),
                                                   file.parent_path(), file.string());
            for (auto& h : histories) result.histories.push_back(std::move(h));
        } catch (const RegMetricsException& e) {
            result.errors.push_back(file.string() + ": " + e.what());
            LOG_ERROR("Cannot load version listing ", file.string(), ": ", e.what());
        }
    }

    LOG_INFO("Loaded ", result.histories.size(), " document histories from ", files.size(),
             " listing files");
    return result;
}

} // namespace regmetrics::history
