#include "mapping.hpp"
#include "util.hpp"

#include <cctype>
#include <stdexcept>

namespace bili_trends {

namespace {

std::string readString(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return {};
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    std::string::size_type pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

int64_t readInt(const nlohmann::json& node, const char* key, int64_t fallback) {
    auto it = node.find(key);
    if (it == node.end()) return fallback;

    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float())   return static_cast<int64_t>(it->get<double>());
    if (it->is_string()) {
        const auto s = trim(it->get<std::string>());
        if (s.empty()) return fallback;
        std::size_t i = (s[0] == '-') ? 1 : 0;
        if (i == s.size()) return fallback;
        for (std::size_t j = i; j < s.size(); ++j) {
            if (!std::isdigit(static_cast<unsigned char>(s[j]))) return fallback;
        }
        try {
            return std::stoll(s);
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }
    return fallback;
}

std::string stripHighlight(const std::string& title) {
    std::string out = title;
    replaceAll(out, "<em class=\"keyword\">", "");
    replaceAll(out, "</em>", "");
    replaceAll(out, "&quot;", "\"");
    replaceAll(out, "&#39;", "'");
    replaceAll(out, "&lt;", "<");
    replaceAll(out, "&gt;", ">");
    replaceAll(out, "&amp;", "&");
    return out;
}

std::optional<int64_t> parseDuration(const std::string& text) {
    const auto parts = split(trim(text), ':');
    if (parts.empty() || parts.size() > 3) return std::nullopt;

    int64_t total = 0;
    for (const auto& part : parts) {
        if (part.empty() || part.size() > 6) return std::nullopt;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        total = total * 60 + std::stoll(part);
    }
    return total;
}

RawRecord parseVideoItem(const nlohmann::json& node) {
    RawRecord r;
    r.bvid        = readString(node, "bvid");
    r.aid         = readInt(node, "aid", readInt(node, "id"));
    r.title       = stripHighlight(readString(node, "title"));
    r.description = readString(node, "description");
    r.tags        = readString(node, "tag");
    r.typeName    = readString(node, "typename");
    r.authorId    = readInt(node, "mid");
    r.authorName  = readString(node, "author");

    const int64_t pubdate = readInt(node, "pubdate", readInt(node, "senddate"));
    if (pubdate > 0) r.pubdate = pubdate;

    // Duration arrives as "mm:ss" in search results, seconds elsewhere.
    auto durIt = node.find("duration");
    if (durIt != node.end()) {
        if (durIt->is_number()) {
            r.durationSeconds = readInt(node, "duration");
        } else if (durIt->is_string()) {
            r.durationSeconds = parseDuration(durIt->get<std::string>());
        }
    }

    r.views     = readInt(node, "play");
    r.likes     = readInt(node, "like");
    r.coins     = readInt(node, "coins");
    r.favorites = readInt(node, "favorites");
    r.shares    = readInt(node, "share");
    r.replies   = readInt(node, "review");
    r.danmaku   = readInt(node, "video_review");
    return r;
}

SearchPage parseSearchPage(const nlohmann::json& responseBody) {
    SearchPage page;

    if (!responseBody.is_object() || !responseBody.contains("data")) {
        throw std::runtime_error("Response missing 'data' field");
    }

    const auto& data = responseBody["data"];
    if (!data.is_object()) {
        throw std::runtime_error("Response 'data' is not an object");
    }

    page.page       = static_cast<int>(readInt(data, "page", 1));
    page.numPages   = static_cast<int>(readInt(data, "numPages"));
    page.numResults = readInt(data, "numResults");

    // An exhausted query omits 'result' entirely.
    auto resultIt = data.find("result");
    if (resultIt == data.end() || resultIt->is_null()) {
        return page;
    }
    if (!resultIt->is_array()) {
        throw std::runtime_error("Response 'data.result' is not an array");
    }

    for (const auto& item : *resultIt) {
        if (!item.is_object()) continue;
        // Mixed result lists carry users / articles too.
        const auto type = item.value("type", std::string("video"));
        if (type != "video") continue;

        auto record = parseVideoItem(item);
        if (record.identity().empty()) {
            ++page.skipped;
            continue;
        }
        page.records.push_back(std::move(record));
    }

    return page;
}

} // namespace bili_trends
