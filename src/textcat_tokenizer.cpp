#include "textcat_tokenizer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "textcat_channel.hpp"
#include "textcat_stopwords.hpp"
#include "textcat_textutil.hpp"

namespace textcat {

using Channel = BoundedChannel<std::string>;

TokenizerOptions::TokenizerOptions()
    : filters{Predicate(is_not_stop_word)},
      transforms{Mapper(static_cast<std::string (*)(const std::string&)>(to_lower))} {}

// Shared pipeline state: channels in stage order and the threads feeding them
struct TokenStream::State {
    std::vector<std::unique_ptr<Channel>> channels;
    std::vector<std::thread> workers;

    std::mutex err_mtx;
    std::exception_ptr error;

    Channel& output() { return *channels.back(); }

    Channel* add_channel(size_t capacity) {
        channels.push_back(std::make_unique<Channel>(capacity));
        return channels.back().get();
    }

    // Record the first stage failure and stop the whole pipeline
    void fail(std::exception_ptr ep) {
        {
            std::lock_guard<std::mutex> lock(err_mtx);
            if (!error) error = ep;
        }
        for (auto& ch : channels) ch->cancel();
    }

    void rethrow_if_failed() {
        std::exception_ptr ep;
        {
            std::lock_guard<std::mutex> lock(err_mtx);
            ep = error;
        }
        if (ep) std::rethrow_exception(ep);
    }

    // Wake every blocked stage and wait for all of them to exit
    void shutdown() {
        for (auto& ch : channels) ch->cancel();
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
        workers.clear();
    }

    // Start a stage thread; exceptions from body cancel the pipeline
    template <typename Body>
    void spawn(const char* stage, Body body) {
        workers.emplace_back([this, stage, body]() mutable {
            try {
                body();
            } catch (const std::exception& e) {
                std::cerr << "[tokenizer] " << stage << " stage failed: " << e.what() << "\n";
                fail(std::current_exception());
            } catch (...) {
                std::cerr << "[tokenizer] " << stage << " stage failed: unknown exception\n";
                fail(std::current_exception());
            }
        });
    }
};

TokenStream::TokenStream() = default;

TokenStream::~TokenStream() {
    cancel();
}

TokenStream::TokenStream(TokenStream&& other) noexcept = default;

TokenStream& TokenStream::operator=(TokenStream&& other) noexcept {
    if (this != &other) {
        cancel();
        state_ = std::move(other.state_);
    }
    return *this;
}

TokenStream TokenStream::from_vector(std::vector<std::string> tokens) {
    TokenStream s;
    s.state_ = std::make_unique<State>();
    Channel* ch = s.state_->add_channel(std::max<size_t>(1, tokens.size()));
    for (auto& t : tokens) ch->push(std::move(t));
    ch->close();
    return s;
}

bool TokenStream::next(std::string& out) {
    if (!state_) return false;
    if (state_->output().pop(out)) return true;

    state_->rethrow_if_failed();
    return false;
}

void TokenStream::cancel() {
    if (state_) state_->shutdown();
}

std::vector<std::string> TokenStream::drain() {
    std::vector<std::string> out;
    std::string t;
    while (next(t)) out.push_back(std::move(t));
    return out;
}

StdTokenizer::StdTokenizer() = default;

StdTokenizer::StdTokenizer(TokenizerOptions opts) : opts_(std::move(opts)) {
    if (opts_.source_buffer_size == 0 || opts_.relay_buffer_size == 0) {
        throw std::invalid_argument("tokenizer buffer sizes must be positive");
    }
}

TokenStream StdTokenizer::tokenize(const std::string& text) const {
    TokenStream stream;
    // Nothing to scan: hand back an already finished stream
    if (text.empty()) return stream;

    stream.state_ = std::make_unique<TokenStream::State>();
    TokenStream::State* st = stream.state_.get();

    Channel* words = st->add_channel(opts_.source_buffer_size);
    Channel* kept = st->add_channel(opts_.relay_buffer_size);
    Channel* tokens = st->add_channel(opts_.relay_buffer_size);

    st->spawn("scan", [words, text]() {
        scan_words(text, [&](std::string w) { return words->push(std::move(w)); });
        words->close();
    });

    std::vector<Predicate> filters = opts_.filters;
    st->spawn("filter", [words, kept, filters]() {
        std::string w;
        while (words->pop(w)) {
            bool pass = true;
            for (const auto& f : filters) {
                if (!f(w)) { pass = false; break; }
            }
            if (pass && !kept->push(std::move(w))) return;
        }
        kept->close();
    });

    std::vector<Mapper> transforms = opts_.transforms;
    st->spawn("transform", [kept, tokens, transforms]() {
        std::string w;
        while (kept->pop(w)) {
            for (const auto& fn : transforms) w = fn(w);
            if (!tokens->push(std::move(w))) return;
        }
        tokens->close();
    });

    return stream;
}

std::map<Token, int> word_counts(const Tokenizer& tokenizer, const std::string& text) {
    std::map<Token, int> wc;
    TokenStream stream = tokenizer.tokenize(text);
    for (const auto& t : stream) wc[t]++;
    return wc;
}

} // namespace textcat
