#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "textcat_textutil.hpp"
#include "textcat_tokenizer.hpp"

using namespace textcat;

using Tokens = std::vector<std::string>;

TEST(StdTokenizer, DefaultLowercasesAndCounts) {
    StdTokenizer tok;
    EXPECT_EQ(tok.tokenize("A b A").drain(), (Tokens{"a", "b", "a"}));

    std::map<Token, int> expected = {{"a", 2}, {"b", 1}};
    EXPECT_EQ(word_counts(tok, "A b A"), expected);
}

TEST(StdTokenizer, DropsStopwordsCaseInsensitively) {
    StdTokenizer tok;
    EXPECT_EQ(tok.tokenize("the и cat").drain(), (Tokens{"the", "cat"}));
    EXPECT_EQ(tok.tokenize("И собака").drain(), (Tokens{"собака"}));
}

TEST(StdTokenizer, KeepsAttachedPunctuation) {
    StdTokenizer tok;
    EXPECT_EQ(tok.tokenize("Hello, World!").drain(), (Tokens{"hello,", "world!"}));
}

TEST(StdTokenizer, EmptyInputEndsImmediately) {
    StdTokenizer tok;
    TokenStream s = tok.tokenize("");
    std::string t;
    EXPECT_FALSE(s.next(t));
    EXPECT_FALSE(s.next(t));

    EXPECT_TRUE(tok.tokenize(" \n\t ").drain().empty());
}

TEST(StdTokenizer, PreservesOrderWithTinyBuffers) {
    TokenizerOptions opts;
    opts.source_buffer_size = 1;
    opts.relay_buffer_size = 1;
    StdTokenizer tok(opts);

    std::string text;
    Tokens expected;
    for (int i = 0; i < 2000; i++) {
        std::string w = "w" + std::to_string(i);
        text += w + " ";
        expected.push_back(w);
    }
    EXPECT_EQ(tok.tokenize(text).drain(), expected);
}

TEST(StdTokenizer, RangeForIteration) {
    StdTokenizer tok;
    TokenStream s = tok.tokenize("one two three");
    Tokens got;
    for (const auto& t : s) got.push_back(t);
    EXPECT_EQ(got, (Tokens{"one", "two", "three"}));
}

TEST(StdTokenizer, NoFiltersNoTransformsPassesRawWords) {
    TokenizerOptions opts;
    opts.filters.clear();
    opts.transforms.clear();
    StdTokenizer tok(opts);

    EXPECT_EQ(tok.tokenize("И Собака").drain(), (Tokens{"И", "Собака"}));
}

TEST(StdTokenizer, TransformsApplyInOrder) {
    TokenizerOptions opts;
    opts.filters.clear();
    opts.transforms = {
        [](const std::string& w) { return to_lower(w); },
        [](const std::string& w) { return w + "_X"; },
    };
    EXPECT_EQ(StdTokenizer(opts).tokenize("AB").drain(), (Tokens{"ab_X"}));

    opts.transforms = {
        [](const std::string& w) { return w + "_X"; },
        [](const std::string& w) { return to_lower(w); },
    };
    EXPECT_EQ(StdTokenizer(opts).tokenize("AB").drain(), (Tokens{"ab_x"}));
}

TEST(StdTokenizer, AnyFailingFilterDropsWord) {
    TokenizerOptions opts;
    opts.filters = {
        [](const std::string& w) { return w.size() > 1; },
        [](const std::string& w) { return w != "skip"; },
    };
    StdTokenizer tok(opts);
    EXPECT_EQ(tok.tokenize("a keep skip ok").drain(), (Tokens{"keep", "ok"}));
}

TEST(StdTokenizer, FiltersSeeWordsBeforeTransforms) {
    TokenizerOptions opts;
    opts.filters = {[](const std::string& w) { return w != "a"; }};
    StdTokenizer tok(opts);
    // "A" passes the filter and is lowercased afterwards
    EXPECT_EQ(tok.tokenize("A a").drain(), (Tokens{"a"}));
}

TEST(StdTokenizer, ZeroBufferSizeRejected) {
    TokenizerOptions opts;
    opts.source_buffer_size = 0;
    EXPECT_THROW(StdTokenizer{opts}, std::invalid_argument);

    TokenizerOptions relay;
    relay.relay_buffer_size = 0;
    EXPECT_THROW(StdTokenizer{relay}, std::invalid_argument);
}

TEST(TokenStream, AbandonedStreamReleasesPipeline) {
    TokenizerOptions opts;
    opts.source_buffer_size = 1;
    opts.relay_buffer_size = 1;
    StdTokenizer tok(opts);

    std::string text;
    for (int i = 0; i < 10000; i++) text += "word ";

    for (int round = 0; round < 20; round++) {
        TokenStream s = tok.tokenize(text);
        std::string t;
        ASSERT_TRUE(s.next(t));
        EXPECT_EQ(t, "word");
        // s goes out of scope with stages blocked on full queues
    }
}

TEST(TokenStream, CancelEndsStream) {
    StdTokenizer tok;
    TokenStream s = tok.tokenize("a b c d e f");
    s.cancel();
    std::string t;
    EXPECT_FALSE(s.next(t));
}

TEST(TokenStream, FilterExceptionReachesConsumer) {
    TokenizerOptions opts;
    opts.filters = {[](const std::string& w) -> bool {
        if (w == "boom") throw std::runtime_error("filter failed");
        return true;
    }};
    StdTokenizer tok(opts);

    TokenStream s = tok.tokenize("one two boom three");
    EXPECT_THROW(s.drain(), std::runtime_error);
}

TEST(TokenStream, MoveKeepsPosition) {
    StdTokenizer tok;
    TokenStream a = tok.tokenize("x y z");
    std::string t;
    ASSERT_TRUE(a.next(t));
    EXPECT_EQ(t, "x");

    TokenStream b = std::move(a);
    EXPECT_EQ(b.drain(), (Tokens{"y", "z"}));
    EXPECT_FALSE(a.next(t));
}

TEST(TokenStream, FromVector) {
    TokenStream s = TokenStream::from_vector({"p", "q"});
    EXPECT_EQ(s.drain(), (Tokens{"p", "q"}));

    TokenStream empty = TokenStream::from_vector({});
    std::string t;
    EXPECT_FALSE(empty.next(t));
}
