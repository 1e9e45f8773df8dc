#pragma once

#include <vector>

#include "textcat_model.hpp"
#include "textcat_types.hpp"

namespace textcat {

// Scores documents against one consistent snapshot of a FrequencyModel.
//
// Notes:
// - The estimator borrows a Reader; the snapshot stays locked while it is used.
// - Documents are passed as already tokenized sequences.
// - Categories are visited in lexicographic order and only a strictly greater
//   score replaces the current best, so ties go to the smallest label.
class Estimator {
public:
    explicit Estimator(const FrequencyModel::Reader& model) : model_(model) {}

    // count(token, category) / training_count(category), 0 for untrained categories
    double token_prob(const Token& token, const Category& category) const;

    // Token rate in category blended with the token's overall weight under a uniform prior
    double weighted_prob(const Token& token, const Category& category) const;

    // Product of weighted_prob over tokens; 1.0 for an empty sequence
    double text_prob(const std::vector<Token>& tokens, const Category& category) const;

    // text_prob times the uniform category prior
    double score(const std::vector<Token>& tokens, const Category& category) const;

    // Best category with a positive score, or NoMatch
    ClassifyResult classify(const std::vector<Token>& tokens) const;

    // Positive scores per category and the best one
    ProbResult get_prob(const std::vector<Token>& tokens) const;

private:
    double uniform_prior() const;

    const FrequencyModel::Reader& model_;
};

} // namespace textcat
