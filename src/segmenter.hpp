#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace bili_trends {

/// Decode one UTF-8 sequence starting at @p pos.  Returns the code point and
/// advances @p pos; malformed bytes decode as U+FFFD one byte at a time.
char32_t decodeUtf8(const std::string& s, std::size_t& pos);

bool isCjk(char32_t cp);

/// Number of code points in a UTF-8 string.
std::size_t utf8Length(const std::string& s);

/// Language-aware tokenizer.
///
/// Latin/digit runs become lower-cased word tokens.  CJK runs are segmented
/// by forward maximum matching against the dictionary; stretches that match
/// nothing fall back to overlapping bigrams (or single characters).
class Segmenter {
public:
    enum class Fallback { Bigrams, Characters };

    explicit Segmenter(Fallback fallback = Fallback::Bigrams);

    /// Add a word to the CJK dictionary.  Words containing non-CJK code
    /// points are ignored; Latin words are always whole tokens anyway.
    void addWord(const std::string& word);

    template <typename Range>
    void addWords(const Range& words) {
        for (const auto& w : words) addWord(w);
    }

    std::size_t dictionarySize() const { return mDictionary.size(); }

    std::vector<std::string> segment(const std::string& text) const;

private:
    Fallback                        mFallback;
    std::unordered_set<std::string> mDictionary;
    std::size_t                     mMaxWordLength = 1;   // in code points

    void segmentCjkRun(const std::vector<std::string>& chars,
                       std::vector<std::string>& out) const;
    void flushUnmatched(std::vector<std::string>& pending,
                        std::vector<std::string>& out) const;
};

} // namespace bili_trends
