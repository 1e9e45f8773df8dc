#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace textcat {

using json = nlohmann::json;

using Token = std::string;
using Category = std::string;

// Status returned by classifier operations
enum class ErrorCode {
    None = 0,
    EmptyInput,  // classify() called with an empty document
    NoMatch,     // no category scored above zero
};

// Human readable message for an error code
const char* error_message(ErrorCode code);

// Result of Classifier::classify
struct ClassifyResult {
    Category category;
    double confidence = 0.0;  // raw score of the winning category
    ErrorCode error = ErrorCode::None;

    bool ok() const { return error == ErrorCode::None; }
};

// Result of Classifier::get_prob
struct ProbResult {
    std::map<Category, double> probs;  // only categories with score > 0
    Category best;                     // empty when nothing scored
};

json to_json(const ClassifyResult& r);
json to_json(const ProbResult& r);

} // namespace textcat
