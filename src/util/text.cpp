#include "regmetrics/util/text.hpp"

#include <algorithm>
#include <cctype>

namespace regmetrics::util {

namespace {

// Length of the whitespace sequence starting at s[i], 0 if none
size_t whitespace_at(std::string_view s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (std::isspace(c)) return 1;
    if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) return 2;
    return 0;
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string_view strip_leading_zeros(std::string_view s) {
    size_t i = 0;
    while (i + 1 < s.size() && s[i] == '0') ++i;
    return s.substr(i);
}

int compare_segment(std::string_view a, std::string_view b) {
    bool da = all_digits(a);
    bool db = all_digits(b);
    if (da && db) {
        std::string_view na = strip_leading_zeros(a);
        std::string_view nb = strip_leading_zeros(b);
        if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
        int c = na.compare(nb);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (da != db) return da ? -1 : 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end) {
        size_t w = whitespace_at(s, begin);
        if (w == 0) break;
        begin += w;
    }
    while (end > begin) {
        unsigned char c = static_cast<unsigned char>(s[end - 1]);
        if (std::isspace(c)) {
            --end;
        } else if (c == 0xA0 && end - begin >= 2 && static_cast<unsigned char>(s[end - 2]) == 0xC2) {
            end -= 2;
        } else {
            break;
        }
    }
    return std::string(s.substr(begin, end - begin));
}

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (size_t i = 0; i < s.size();) {
        size_t w = whitespace_at(s, i);
        if (w > 0) {
            pending_space = !out.empty();
            i += w;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

std::vector<std::string> split_whitespace(std::string_view s) {
    std::vector<std::string> tokens;
    std::string cur;
    for (size_t i = 0; i < s.size();) {
        size_t w = whitespace_at(s, i);
        if (w > 0) {
            if (!cur.empty()) {
                tokens.push_back(std::move(cur));
                cur.clear();
            }
            i += w;
            continue;
        }
        cur.push_back(s[i]);
        ++i;
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

std::string to_upper_ascii(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(s[i])) !=
            std::toupper(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string strip_number_label(std::string_view raw) {
    static constexpr std::string_view kSection = "\xC2\xA7";  // §
    static constexpr std::string_view kLabels[] = {"SUBPART", "PART", "PT.", "SEC."};

    std::string s = collapse_whitespace(raw);
    std::string_view view(s);

    while (view.substr(0, kSection.size()) == kSection) {
        view.remove_prefix(kSection.size());
        while (!view.empty() && view.front() == ' ') view.remove_prefix(1);
    }

    for (std::string_view label : kLabels) {
        if (starts_with_ci(view, label)) {
            std::string_view rest = view.substr(label.size());
            // "PART 1" or "Pt.1", but not "PARTIAL"
            if (rest.empty() || rest.front() == ' ' || label.back() == '.') {
                view = rest;
                while (!view.empty() && view.front() == ' ') view.remove_prefix(1);
            }
            break;
        }
    }

    return trim(view);
}

int compare_numbering(std::string_view a, std::string_view b) {
    size_t ia = 0;
    size_t ib = 0;
    while (ia <= a.size() && ib <= b.size()) {
        size_t ea = a.find('.', ia);
        size_t eb = b.find('.', ib);
        if (ea == std::string_view::npos) ea = a.size();
        if (eb == std::string_view::npos) eb = b.size();

        int c = compare_segment(a.substr(ia, ea - ia), b.substr(ib, eb - ib));
        if (c != 0) return c;

        bool a_done = ea >= a.size();
        bool b_done = eb >= b.size();
        if (a_done || b_done) {
            if (a_done && !b_done) return -1;
            if (!a_done && b_done) return 1;
            break;
        }
        ia = ea + 1;
        ib = eb + 1;
    }
    // Numerically equal spellings ("01" vs "1") still need a strict order
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool is_iso_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    int month = (s[5] - '0') * 10 + (s[6] - '0');
    int day = (s[8] - '0') * 10 + (s[9] - '0');
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace regmetrics::util
