#include "textcat_model.hpp"

namespace textcat {

int64_t FrequencyModel::Reader::count_in_category(const Token& token, const Category& category) const {
    auto it = m_.token_counts_.find(token);
    if (it == m_.token_counts_.end()) return 0;

    auto cit = it->second.find(category);
    return cit == it->second.end() ? 0 : cit->second;
}

int64_t FrequencyModel::Reader::total_seen(const Token& token) const {
    auto it = m_.token_counts_.find(token);
    if (it == m_.token_counts_.end()) return 0;

    // Only categories with at least one train() call count
    int64_t sum = 0;
    for (const auto& kv : it->second) {
        if (m_.training_counts_.count(kv.first)) sum += kv.second;
    }
    return sum;
}

double FrequencyModel::Reader::total_weight(const Token& token) const {
    int64_t seen = total_seen(token);
    return seen > 0 ? (double)seen : MIN_TOKEN_WEIGHT;
}

int64_t FrequencyModel::Reader::training_count(const Category& category) const {
    auto it = m_.training_counts_.find(category);
    return it == m_.training_counts_.end() ? 0 : it->second;
}

std::vector<Category> FrequencyModel::Reader::categories() const {
    std::vector<Category> out;
    out.reserve(m_.training_counts_.size());
    for (const auto& kv : m_.training_counts_) out.push_back(kv.first);
    return out;
}

void FrequencyModel::Writer::record(const Token& token, const Category& category) {
    m_.token_counts_[token][category]++;
}

void FrequencyModel::Writer::record_category(const Category& category) {
    m_.training_counts_[category]++;
}

} // namespace textcat
