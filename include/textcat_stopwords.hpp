#pragma once

#include <string>
#include <vector>

namespace textcat {

// Sorted, immutable stopword list with binary-search lookup.
//
// Notes:
// - Input words are lowercased, sorted by byte order and de-duplicated at
//   construction, so callers may pass them in any order and case.
// - Lookups lowercase the query before searching.
class StopwordTable {
public:
    StopwordTable() = default;
    explicit StopwordTable(std::vector<std::string> words);

    bool contains(const std::string& word) const;

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }
    const std::vector<std::string>& words() const { return words_; }

    // Built-in table, constructed once on first use
    static const StopwordTable& default_table();

    // Raw built-in word list (unsorted data asset)
    static const std::vector<std::string>& default_words();

private:
    std::vector<std::string> words_;
};

// Membership test against the built-in table
bool is_stop_word(const std::string& word);

// Negation of is_stop_word, the tokenizer's default filter
bool is_not_stop_word(const std::string& word);

} // namespace textcat
