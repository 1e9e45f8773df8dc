#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "textcat_types.hpp"

namespace textcat {

// Queue capacity of the word scanner's output
static constexpr size_t DEFAULT_SOURCE_BUFFER_SIZE = 100;
// Queue capacity of the filter and transform stages' outputs
static constexpr size_t DEFAULT_RELAY_BUFFER_SIZE = 50;

using Predicate = std::function<bool(const std::string&)>;
using Mapper = std::function<std::string(const std::string&)>;

// Tokenizer settings. A default-constructed value drops stopwords and lowercases.
struct TokenizerOptions {
    size_t source_buffer_size = DEFAULT_SOURCE_BUFFER_SIZE;
    size_t relay_buffer_size = DEFAULT_RELAY_BUFFER_SIZE;
    std::vector<Predicate> filters;   // a word failing any filter is dropped
    std::vector<Mapper> transforms;   // applied in order to surviving words

    TokenizerOptions();
};

// Lazy, finite, single-pass sequence of tokens.
//
// A stream produced by StdTokenizer is backed by running pipeline threads.
// Destroying the stream (or calling cancel()) before it is exhausted stops
// and joins them. Exceptions thrown by filters or transforms are rethrown
// from next().
class TokenStream {
public:
    TokenStream();
    ~TokenStream();

    TokenStream(TokenStream&& other) noexcept;
    TokenStream& operator=(TokenStream&& other) noexcept;
    TokenStream(const TokenStream&) = delete;
    TokenStream& operator=(const TokenStream&) = delete;

    // Stream over already-computed tokens (for custom tokenizers)
    static TokenStream from_vector(std::vector<std::string> tokens);

    // Fetch the next token; false once the stream has ended
    bool next(std::string& out);

    // Stop producing tokens and release the pipeline
    void cancel();

    // Collect every remaining token
    std::vector<std::string> drain();

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(TokenStream* s) : stream_(s) { advance(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& o) const { return stream_ == o.stream_; }
        bool operator!=(const iterator& o) const { return stream_ != o.stream_; }

    private:
        void advance() {
            if (stream_ && !stream_->next(current_)) stream_ = nullptr;
        }

        TokenStream* stream_ = nullptr;
        std::string current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    friend class StdTokenizer;
    struct State;
    std::unique_ptr<State> state_;
};

// Turns raw text into a token stream
class Tokenizer {
public:
    virtual ~Tokenizer() = default;
    virtual TokenStream tokenize(const std::string& text) const = 0;
};

// Whitespace tokenizer running scan -> filter -> transform as concurrent stages
class StdTokenizer : public Tokenizer {
public:
    StdTokenizer();
    explicit StdTokenizer(TokenizerOptions opts);

    TokenStream tokenize(const std::string& text) const override;

    const TokenizerOptions& options() const { return opts_; }

private:
    TokenizerOptions opts_;
};

// Token frequencies of a document
std::map<Token, int> word_counts(const Tokenizer& tokenizer, const std::string& text);

} // namespace textcat
