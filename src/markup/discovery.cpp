#include "regmetrics/markup/discovery.hpp"

#include <algorithm>
#include <regex>

#include "regmetrics/logging.hpp"
#include "regmetrics/util/text.hpp"

namespace fs = std::filesystem;

namespace regmetrics::markup {

std::optional<MarkupSource> parse_source_name(const fs::path& path) {
    static const std::regex pattern(R"(CFR-(\d+)-title(\d+)-vol(\d+))", std::regex::icase);

    std::string name = path.filename().string();
    std::smatch match;
    if (!std::regex_search(name, match, pattern)) {
        return std::nullopt;
    }
    MarkupSource src;
    src.path = path;
    src.year = match[1].str();
    src.title_number = match[2].str();
    src.volume = match[3].str();
    return src;
}

DiscoveryResult discover_sources(const fs::path& root) {
    DiscoveryResult result;

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        LOG_WARN("Input path not found: ", root.string());
        return result;
    }

    if (fs::is_regular_file(root, ec)) {
        if (auto src = parse_source_name(root)) {
            result.sources.push_back(std::move(*src));
        } else {
            result.ignored.push_back(root);
        }
        return result;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(
                root, fs::directory_options::skip_permission_denied)) {
            if (!entry.is_regular_file()) continue;
            if (util::to_upper_ascii(entry.path().extension().string()) != ".XML") continue;

            if (auto src = parse_source_name(entry.path())) {
                result.sources.push_back(std::move(*src));
            } else {
                result.ignored.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        LOG_WARN("Directory scan error in ", root.string(), ": ", e.what());
    }

    std::sort(result.sources.begin(), result.sources.end(),
              [](const MarkupSource& a, const MarkupSource& b) {
                  int c = util::compare_numbering(a.year, b.year);
                  if (c != 0) return c < 0;
                  c = util::compare_numbering(a.title_number, b.title_number);
                  if (c != 0) return c < 0;
                  c = util::compare_numbering(a.volume, b.volume);
                  if (c != 0) return c < 0;
                  return a.path < b.path;
              });
    std::sort(result.ignored.begin(), result.ignored.end());

    for (const auto& p : result.ignored) {
        LOG_DEBUG("Ignoring unrecognized file name: ", p.string());
    }
    LOG_INFO("Discovered ", result.sources.size(), " markup files under ", root.string(),
             " (", result.ignored.size(), " ignored)");
    return result;
}

} // namespace regmetrics::markup
