#include "segmenter.hpp"

#include <algorithm>
#include <cctype>

namespace bili_trends {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

enum class CharClass { Latin, Cjk, Other };

CharClass classify(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) ? CharClass::Latin
                                                            : CharClass::Other;
    }
    if (isCjk(cp)) return CharClass::Cjk;
    // Latin-1 supplement / Latin extended letters.
    if ((cp >= 0xC0 && cp <= 0x24F) && cp != 0xD7 && cp != 0xF7) return CharClass::Latin;
    return CharClass::Other;
}

} // namespace

char32_t decodeUtf8(const std::string& s, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);

    int      extra = 0;
    char32_t cp    = 0;
    if (lead < 0x80)                { cp = lead;        extra = 0; }
    else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
    else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
    else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
    else {
        ++pos;
        return kReplacement;
    }

    if (pos + extra >= s.size()) {
        ++pos;
        return kReplacement;
    }
    for (int i = 1; i <= extra; ++i) {
        const auto c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return kReplacement;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    pos += extra + 1;
    return cp;
}

bool isCjk(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF)      // unified ideographs
        || (cp >= 0x3400 && cp <= 0x4DBF)      // extension A
        || (cp >= 0xF900 && cp <= 0xFAFF)      // compatibility ideographs
        || (cp >= 0x20000 && cp <= 0x2A6DF);   // extension B
}

std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (std::size_t pos = 0; pos < s.size(); ++n) {
        decodeUtf8(s, pos);
    }
    return n;
}

// ---------------------------------------------------------------------------
// Segmenter
// ---------------------------------------------------------------------------

Segmenter::Segmenter(Fallback fallback)
    : mFallback(fallback) {}

void Segmenter::addWord(const std::string& word) {
    if (word.empty()) return;

    std::size_t length = 0;
    for (std::size_t pos = 0; pos < word.size(); ++length) {
        if (!isCjk(decodeUtf8(word, pos))) return;
    }
    mDictionary.insert(word);
    mMaxWordLength = std::max(mMaxWordLength, length);
}

std::vector<std::string> Segmenter::segment(const std::string& text) const {
    std::vector<std::string> tokens;
    std::string              latin;
    std::vector<std::string> cjk;   // one UTF-8 character per entry

    auto flushLatin = [&] {
        if (!latin.empty()) {
            std::transform(latin.begin(), latin.end(), latin.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            tokens.push_back(std::move(latin));
            latin.clear();
        }
    };
    auto flushCjk = [&] {
        if (!cjk.empty()) {
            segmentCjkRun(cjk, tokens);
            cjk.clear();
        }
    };

    for (std::size_t pos = 0; pos < text.size();) {
        const std::size_t start = pos;
        const char32_t cp = decodeUtf8(text, pos);

        switch (classify(cp)) {
            case CharClass::Latin:
                flushCjk();
                latin.append(text, start, pos - start);
                break;
            case CharClass::Cjk:
                flushLatin();
                cjk.emplace_back(text, start, pos - start);
                break;
            case CharClass::Other:
                flushLatin();
                flushCjk();
                break;
        }
    }
    flushLatin();
    flushCjk();

    return tokens;
}

void Segmenter::segmentCjkRun(const std::vector<std::string>& chars,
                              std::vector<std::string>& out) const
{
    std::vector<std::string> pending;
    std::size_t i = 0;

    while (i < chars.size()) {
        const std::size_t longest = std::min(mMaxWordLength, chars.size() - i);

        std::size_t matched = 0;
        std::string candidate;
        for (std::size_t len = longest; len >= 1; --len) {
            candidate.clear();
            for (std::size_t k = 0; k < len; ++k) candidate += chars[i + k];
            if (mDictionary.count(candidate)) {
                matched = len;
                break;
            }
        }

        if (matched == 0) {
            pending.push_back(chars[i]);
            ++i;
            continue;
        }

        flushUnmatched(pending, out);
        out.push_back(candidate);
        i += matched;
    }
    flushUnmatched(pending, out);
}

void Segmenter::flushUnmatched(std::vector<std::string>& pending,
                               std::vector<std::string>& out) const
{
    if (pending.empty()) return;

    if (mFallback == Fallback::Characters || pending.size() == 1) {
        for (auto& c : pending) out.push_back(std::move(c));
    } else {
        for (std::size_t k = 0; k + 1 < pending.size(); ++k) {
            out.push_back(pending[k] + pending[k + 1]);
        }
    }
    pending.clear();
}

} // namespace bili_trends
