#include "textcat_classifier.hpp"

#include <stdexcept>

#include "textcat_estimator.hpp"

namespace textcat {

Classifier::Classifier() : tokenizer_(std::make_shared<StdTokenizer>()) {}

Classifier::Classifier(std::shared_ptr<const Tokenizer> tokenizer)
    : tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) throw std::invalid_argument("classifier needs a tokenizer");
}

ErrorCode Classifier::train(const std::string& document, const Category& category) {
    // One exclusive scope for all token records and the category event
    FrequencyModel::Writer w = model_.write();

    // Drain first: a failing tokenizer must leave the model untouched
    std::vector<Token> tokens = tokenizer_->tokenize(document).drain();
    for (const auto& t : tokens) w.record(t, category);

    w.record_category(category);
    return ErrorCode::None;
}

ClassifyResult Classifier::classify(const std::string& document) const {
    if (document.empty()) {
        ClassifyResult r;
        r.error = ErrorCode::EmptyInput;
        return r;
    }

    FrequencyModel::Reader snapshot = model_.read();
    if (snapshot.category_count() == 0) {
        ClassifyResult r;
        r.error = ErrorCode::NoMatch;
        return r;
    }

    std::vector<Token> tokens = tokenizer_->tokenize(document).drain();
    return Estimator(snapshot).classify(tokens);
}

ProbResult Classifier::get_prob(const std::string& document) const {
    FrequencyModel::Reader snapshot = model_.read();
    if (snapshot.category_count() == 0) return ProbResult{};

    std::vector<Token> tokens = tokenizer_->tokenize(document).drain();
    return Estimator(snapshot).get_prob(tokens);
}

std::map<Token, int> Classifier::word_counts(const std::string& document) const {
    return textcat::word_counts(*tokenizer_, document);
}

json Classifier::stats() const {
    FrequencyModel::Reader snapshot = model_.read();

    json out;
    out["category_count"] = snapshot.category_count();
    out["vocabulary_size"] = snapshot.vocabulary_size();

    int64_t total = 0;
    json per_category = json::object();
    for (const auto& kv : snapshot.training_counts()) {
        per_category[kv.first] = kv.second;
        total += kv.second;
    }
    out["training_events"] = total;
    out["training_counts"] = per_category;
    return out;
}

} // namespace textcat
