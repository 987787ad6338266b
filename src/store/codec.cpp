#include "regmetrics/store/codec.hpp"

#include "regmetrics/error.hpp"

namespace regmetrics::store {

namespace json = boost::json;

std::string json_string(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) {
        throw StoreError(ErrorCode::STORE_READ_FAILED,
                         "missing or non-string field '" + std::string(key) + "'");
    }
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

std::string json_string_or(const json::object& obj, std::string_view key,
                           const std::string& fallback) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) return fallback;
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

json::object section_to_json(const SectionRecord& rec) {
    json::object obj;
    obj["year"] = rec.year;
    obj["title_number"] = rec.title_number;
    obj["part_number"] = rec.part_number;
    obj["part_title"] = rec.part_title;
    obj["section_number"] = rec.section_number;
    obj["section_title"] = rec.section_title;
    obj["content"] = rec.content;
    obj["content_empty"] = rec.content_empty;
    return obj;
}

json::object title_file_to_json(const TitleFile& title) {
    json::object root;
    root["year"] = title.year;
    root["title_number"] = title.title_number;
    root["volume"] = title.volume;

    json::array volumes;
    for (const auto& v : title.volumes) volumes.push_back(json::value(v));
    root["volumes"] = std::move(volumes);

    json::object parts;
    for (const auto& [part_number, part] : title.parts) {
        json::object p;
        p["part_number"] = part.part_number;
        p["part_title"] = part.part_title;
        json::object sections;
        for (const auto& [section_number, rec] : part.sections) {
            sections[section_number] = section_to_json(rec);
        }
        p["sections"] = std::move(sections);
        parts[part_number] = std::move(p);
    }
    root["parts"] = std::move(parts);
    return root;
}

SectionRecord section_from_json(const json::value& v) {
    if (!v.is_object()) {
        throw StoreError(ErrorCode::STORE_READ_FAILED, "section entry is not an object");
    }
    const json::object& obj = v.get_object();
    SectionRecord rec;
    rec.year = json_string(obj, "year");
    rec.title_number = json_string(obj, "title_number");
    rec.part_number = json_string(obj, "part_number");
    rec.part_title = json_string_or(obj, "part_title", "");
    rec.section_number = json_string(obj, "section_number");
    rec.section_title = json_string_or(obj, "section_title", "");
    rec.content = json_string_or(obj, "content", "");
    const json::value* empty = obj.if_contains("content_empty");
    rec.content_empty = (empty && empty->is_bool()) ? empty->get_bool() : rec.content.empty();
    return rec;
}

TitleFile title_file_from_json(const json::value& v) {
    if (!v.is_object()) {
        throw StoreError(ErrorCode::STORE_READ_FAILED, "title file root is not an object");
    }
    const json::object& root = v.get_object();

    TitleFile title;
    title.year = json_string(root, "year");
    title.title_number = json_string(root, "title_number");
    title.volume = json_string_or(root, "volume", "");

    if (const json::value* vols = root.if_contains("volumes"); vols && vols->is_array()) {
        for (const auto& vol : vols->get_array()) {
            if (vol.is_string()) {
                title.volumes.emplace_back(vol.get_string().data(), vol.get_string().size());
            }
        }
    }

    const json::value* parts = root.if_contains("parts");
    if (!parts || !parts->is_object()) {
        throw StoreError(ErrorCode::STORE_READ_FAILED, "title file has no 'parts' object");
    }
    for (const auto& part_kv : parts->get_object()) {
        if (!part_kv.value().is_object()) {
            throw StoreError(ErrorCode::STORE_READ_FAILED, "part entry is not an object");
        }
        const json::object& p = part_kv.value().get_object();
        std::string part_key(part_kv.key().data(), part_kv.key().size());

        PartContainer part;
        part.part_number = json_string_or(p, "part_number", part_key);
        part.part_title = json_string_or(p, "part_title", "");
        if (const json::value* secs = p.if_contains("sections"); secs && secs->is_object()) {
            for (const auto& sec_kv : secs->get_object()) {
                std::string sec_key(sec_kv.key().data(), sec_kv.key().size());
                part.sections.emplace(sec_key, section_from_json(sec_kv.value()));
            }
        }
        title.parts.emplace(part_key, std::move(part));
    }
    return title;
}

std::string serialize_title_file(const TitleFile& title) {
    std::string out = json::serialize(title_file_to_json(title));
    out.push_back('\n');
    return out;
}

TitleFile parse_title_file(std::string_view text, const std::string& origin) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw StoreError(ErrorCode::STORE_READ_FAILED, "invalid JSON: " + ec.message(), origin);
    }
    return title_file_from_json(v);
}

} // namespace regmetrics::store
