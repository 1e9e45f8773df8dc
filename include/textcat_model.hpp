#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "textcat_types.hpp"

namespace textcat {

// Weight reported for a token no category has seen
static constexpr double MIN_TOKEN_WEIGHT = 0.001;

// Token/category statistics shared between trainers and classifiers.
//
// Notes:
// - Token counts and per-category training counts sit behind ONE shared_mutex
//   and are always read or written together; do not split the lock.
// - The maps are only reachable through Reader (shared lock) and Writer
//   (exclusive lock), each holding its lock for its whole lifetime.
// - Training counts count train() calls per category, not tokens.
class FrequencyModel {
public:
    class Reader {
    public:
        explicit Reader(const FrequencyModel& m) : m_(m), lock_(m.mtx_) {}

        int64_t count_in_category(const Token& token, const Category& category) const;

        // Sum of the token's counts over known categories, floored to MIN_TOKEN_WEIGHT
        double total_weight(const Token& token) const;

        // Sum of the token's counts over known categories, without the floor
        int64_t total_seen(const Token& token) const;

        int64_t training_count(const Category& category) const;

        // Known categories in lexicographic order
        std::vector<Category> categories() const;

        // Copy of the per-category training counts
        std::map<Category, int64_t> training_counts() const { return m_.training_counts_; }

        size_t category_count() const { return m_.training_counts_.size(); }
        size_t vocabulary_size() const { return m_.token_counts_.size(); }

    private:
        const FrequencyModel& m_;
        std::shared_lock<std::shared_mutex> lock_;
    };

    class Writer {
    public:
        explicit Writer(FrequencyModel& m) : m_(m), lock_(m.mtx_) {}

        void record(const Token& token, const Category& category);
        void record_category(const Category& category);

    private:
        FrequencyModel& m_;
        std::unique_lock<std::shared_mutex> lock_;
    };

    FrequencyModel() = default;
    FrequencyModel(const FrequencyModel&) = delete;
    FrequencyModel& operator=(const FrequencyModel&) = delete;

    Reader read() const { return Reader(*this); }
    Writer write() { return Writer(*this); }

private:
    mutable std::shared_mutex mtx_;
    std::unordered_map<Token, std::map<Category, int64_t>> token_counts_;
    std::map<Category, int64_t> training_counts_;
};

} // namespace textcat
