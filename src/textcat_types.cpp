#include "textcat_types.hpp"

namespace textcat {

const char* error_message(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "ok";
    case ErrorCode::EmptyInput:
        return "text is empty";
    case ErrorCode::NoMatch:
        return "could not determine the text category";
    }
    return "unknown error";
}

json to_json(const ClassifyResult& r) {
    json out;
    out["ok"] = r.ok();
    if (!r.ok()) {
        out["error"] = error_message(r.error);
        return out;
    }
    out["category"] = r.category;
    out["confidence"] = r.confidence;
    return out;
}

json to_json(const ProbResult& r) {
    json out;
    out["best"] = r.best;
    out["probs"] = json::object();
    for (const auto& kv : r.probs) out["probs"][kv.first] = kv.second;
    return out;
}

} // namespace textcat
