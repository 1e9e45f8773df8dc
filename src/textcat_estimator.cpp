#include "textcat_estimator.hpp"

namespace textcat {

// 1 / number of known categories, 0 when nothing is trained
double Estimator::uniform_prior() const {
    size_t n = model_.category_count();
    return n == 0 ? 0.0 : 1.0 / (double)n;
}

double Estimator::token_prob(const Token& token, const Category& category) const {
    int64_t trained = model_.training_count(category);
    if (trained == 0) return 0.0;
    return (double)model_.count_in_category(token, category) / (double)trained;
}

double Estimator::weighted_prob(const Token& token, const Category& category) const {
    if (model_.category_count() == 0) return 0.0;

    const double assumed = uniform_prior();
    const double seen = (double)model_.total_seen(token);
    const double weight = model_.total_weight(token);

    // weight acts as the prior strength; the category rate takes over as seen grows
    return (weight * 1.0 * assumed + seen * token_prob(token, category)) / (1.0 + seen);
}

double Estimator::text_prob(const std::vector<Token>& tokens, const Category& category) const {
    double prob = 1.0;
    for (const auto& t : tokens) prob *= weighted_prob(t, category);
    return prob;
}

double Estimator::score(const std::vector<Token>& tokens, const Category& category) const {
    return text_prob(tokens, category) * uniform_prior();
}

ClassifyResult Estimator::classify(const std::vector<Token>& tokens) const {
    ClassifyResult r;
    bool found = false;

    for (const auto& cat : model_.categories()) {
        double s = score(tokens, cat);
        if (s > r.confidence) {
            r.confidence = s;
            r.category = cat;
            found = true;
        }
    }

    // The empty string is a legal category, so track the match separately
    if (!found) {
        r.category.clear();
        r.confidence = 0.0;
        r.error = ErrorCode::NoMatch;
    }
    return r;
}

ProbResult Estimator::get_prob(const std::vector<Token>& tokens) const {
    ProbResult r;
    double best = 0.0;

    for (const auto& cat : model_.categories()) {
        double s = score(tokens, cat);
        if (s > 0) r.probs[cat] = s;
        if (s > best) {
            best = s;
            r.best = cat;
        }
    }
    return r;
}

} // namespace textcat
