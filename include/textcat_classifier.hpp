#pragma once

#include <map>
#include <memory>
#include <string>

#include "textcat_model.hpp"
#include "textcat_tokenizer.hpp"
#include "textcat_types.hpp"

namespace textcat {

// Capability set shared by classifiers
class ClassifierInterface {
public:
    virtual ~ClassifierInterface() = default;

    virtual ErrorCode train(const std::string& document, const Category& category) = 0;
    virtual ClassifyResult classify(const std::string& document) const = 0;
    virtual ProbResult get_prob(const std::string& document) const = 0;
};

// Word-frequency classifier.
//
// train() is an exclusive writer; classify(), get_prob() and stats() are
// readers and may run concurrently with each other. Each call works on one
// consistent snapshot of the model.
class Classifier : public ClassifierInterface {
public:
    Classifier();
    explicit Classifier(std::shared_ptr<const Tokenizer> tokenizer);

    // Record every token of document under category; never fails
    ErrorCode train(const std::string& document, const Category& category) override;

    // EmptyInput for "", NoMatch when no category scores above zero
    ClassifyResult classify(const std::string& document) const override;

    ProbResult get_prob(const std::string& document) const override;

    // Token frequencies of document using this classifier's tokenizer
    std::map<Token, int> word_counts(const std::string& document) const;

    // Snapshot of model size and per-category training counts
    json stats() const;

    const Tokenizer& tokenizer() const { return *tokenizer_; }
    const FrequencyModel& model() const { return model_; }

private:
    std::shared_ptr<const Tokenizer> tokenizer_;
    FrequencyModel model_;
};

} // namespace textcat
