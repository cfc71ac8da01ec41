// chainseg/cpp/src/sitemap.cpp
#include "chainseg/sitemap.h"

#include <cstring>

namespace chainseg {

std::string xml_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string xml_unescape(std::string_view s) {
    static const struct { const char* ent; char c; } kEnts[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool hit = false;
        if (s[i] == '&') {
            for (const auto& e : kEnts) {
                const size_t n = std::strlen(e.ent);
                if (s.compare(i, n, e.ent) == 0) {
                    out.push_back(e.c);
                    i += n;
                    hit = true;
                    break;
                }
            }
        }
        if (!hit) out.push_back(s[i++]);
    }
    return out;
}

std::string format_url_entry(std::string_view loc, const UrlEntryStyle& style) {
    std::string e;
    e.reserve(loc.size() + 128);
    e += "  <url>\n    <loc>";
    e += xml_escape(loc);
    e += "</loc>\n    <changefreq>";
    e += style.changefreq;
    e += "</changefreq>\n    <priority>";
    e += style.priority;
    e += "</priority>\n  </url>\n";
    return e;
}

std::vector<std::string> extract_locs(std::string_view doc) {
    static constexpr std::string_view kOpen = "<loc>";
    static constexpr std::string_view kClose = "</loc>";

    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        const size_t a = doc.find(kOpen, pos);
        if (a == std::string_view::npos) break;
        const size_t b = doc.find(kClose, a + kOpen.size());
        if (b == std::string_view::npos) break;
        out.push_back(xml_unescape(doc.substr(a + kOpen.size(), b - a - kOpen.size())));
        pos = b + kClose.size();
    }
    return out;
}

} // namespace chainseg
