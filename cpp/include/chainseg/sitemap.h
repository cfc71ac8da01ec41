// chainseg/cpp/include/chainseg/sitemap.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chainseg {

constexpr const char* kUrlsetHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">\n";
constexpr const char* kUrlsetFooter = "</urlset>\n";
constexpr const char* kUrlsetFooterMarker = "</urlset>";
constexpr const char* kUrlEntryClose = "</url>\n";

constexpr const char* kSitemapIndexHeader =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<sitemapindex xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">\n";
constexpr const char* kSitemapIndexFooter = "</sitemapindex>\n";

std::string xml_escape(std::string_view s);
std::string xml_unescape(std::string_view s);

struct UrlEntryStyle {
    std::string changefreq{"weekly"};
    std::string priority{"0.8"};
};

// "  <url>\n    <loc>...</loc>\n ... </url>\n"; loc is escaped here
std::string format_url_entry(std::string_view loc, const UrlEntryStyle& style);

// <loc> contents in document order, unescaped
std::vector<std::string> extract_locs(std::string_view doc);

} // namespace chainseg
