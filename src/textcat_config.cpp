#include "textcat_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "textcat_stopwords.hpp"
#include "textcat_textutil.hpp"

namespace textcat {

bool is_known_filter(const std::string& name) {
    return name == "not_stopword" || name == "non_empty";
}

bool is_known_transform(const std::string& name) {
    return name == "lowercase" || name == "identity";
}

// Read a positive integer field, leaving dst unchanged if the key is absent
static bool read_size(const json& j, const char* key, size_t& dst) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        std::cerr << "[config] " << key << " must be a positive integer\n";
        return false;
    }
    dst = (size_t)v.get<long long>();
    return true;
}

// Read an array of strings, leaving dst unchanged if the key is absent
static bool read_names(const json& j, const char* key, std::vector<std::string>& dst) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_array()) {
        std::cerr << "[config] " << key << " must be an array of strings\n";
        return false;
    }

    std::vector<std::string> names;
    for (const auto& e : v) {
        if (!e.is_string()) {
            std::cerr << "[config] " << key << " must be an array of strings\n";
            return false;
        }
        names.push_back(e.get<std::string>());
    }
    dst = std::move(names);
    return true;
}

bool tokenizer_config_from_json(const json& j, TokenizerConfig& out) {
    if (!j.is_object()) {
        std::cerr << "[config] tokenizer config must be a JSON object\n";
        return false;
    }

    TokenizerConfig cfg = out;
    if (!read_size(j, "source_buffer_size", cfg.source_buffer_size)) return false;
    if (!read_size(j, "relay_buffer_size", cfg.relay_buffer_size)) return false;
    if (!read_names(j, "filters", cfg.filters)) return false;
    if (!read_names(j, "transforms", cfg.transforms)) return false;
    if (!read_names(j, "stopwords", cfg.stopwords)) return false;

    for (const auto& f : cfg.filters) {
        if (!is_known_filter(f)) {
            std::cerr << "[config] unknown filter: " << f << "\n";
            return false;
        }
    }
    for (const auto& t : cfg.transforms) {
        if (!is_known_transform(t)) {
            std::cerr << "[config] unknown transform: " << t << "\n";
            return false;
        }
    }

    out = std::move(cfg);
    return true;
}

bool load_tokenizer_config(const fs::path& path, TokenizerConfig& out) {
    if (!fs::exists(path)) {
        std::cerr << "[config] No config file found at: " << path << "\n";
        return false;
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "[config] Failed to open file: " << path << "\n";
        return false;
    }

    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error& e) {
        std::cerr << "[config] Error parsing " << path << ": " << e.what() << "\n";
        return false;
    }

    if (!tokenizer_config_from_json(j, out)) return false;

    std::cout << "[config] Loaded tokenizer config from " << path
              << " (source buffer: " << out.source_buffer_size
              << ", relay buffer: " << out.relay_buffer_size << ")\n";
    return true;
}

// Parse a positive size from an environment variable
static void env_size(const char* var, size_t& dst) {
    const char* p = std::getenv(var);
    if (!p || !*p) return;

    try {
        size_t used = 0;
        long long v = std::stoll(p, &used);
        if (used != std::string(p).size() || v <= 0) {
            std::cerr << "[config] Ignoring " << var << "=" << p << " (not a positive integer)\n";
            return;
        }
        dst = (size_t)v;
        std::cout << "[config] " << var << " set to: " << v << "\n";
    } catch (const std::logic_error&) {
        std::cerr << "[config] Ignoring " << var << "=" << p << " (not a positive integer)\n";
    }
}

void apply_env_overrides(TokenizerConfig& cfg) {
    env_size(ENV_SOURCE_BUFFER_SIZE, cfg.source_buffer_size);
    env_size(ENV_RELAY_BUFFER_SIZE, cfg.relay_buffer_size);
}

TokenizerOptions make_tokenizer_options(const TokenizerConfig& cfg) {
    if (cfg.source_buffer_size == 0 || cfg.relay_buffer_size == 0) {
        throw std::invalid_argument("tokenizer buffer sizes must be positive");
    }

    TokenizerOptions opts;
    opts.source_buffer_size = cfg.source_buffer_size;
    opts.relay_buffer_size = cfg.relay_buffer_size;
    opts.filters.clear();
    opts.transforms.clear();

    // Extra stopwords get their own table; otherwise share the built-in one
    std::shared_ptr<const StopwordTable> table;
    if (!cfg.stopwords.empty()) {
        std::vector<std::string> words = StopwordTable::default_words();
        words.insert(words.end(), cfg.stopwords.begin(), cfg.stopwords.end());
        table = std::make_shared<const StopwordTable>(std::move(words));
    }

    for (const auto& name : cfg.filters) {
        if (name == "not_stopword") {
            if (table) {
                opts.filters.push_back([table](const std::string& w) { return !table->contains(w); });
            } else {
                opts.filters.push_back(is_not_stop_word);
            }
        } else if (name == "non_empty") {
            opts.filters.push_back([](const std::string& w) { return !w.empty(); });
        } else {
            throw std::invalid_argument("unknown filter: " + name);
        }
    }

    for (const auto& name : cfg.transforms) {
        if (name == "lowercase") {
            opts.transforms.push_back([](const std::string& w) { return to_lower(w); });
        } else if (name == "identity") {
            opts.transforms.push_back([](const std::string& w) { return w; });
        } else {
            throw std::invalid_argument("unknown transform: " + name);
        }
    }
    return opts;
}

json to_json(const TokenizerConfig& cfg) {
    json out;
    out["source_buffer_size"] = cfg.source_buffer_size;
    out["relay_buffer_size"] = cfg.relay_buffer_size;
    out["filters"] = cfg.filters;
    out["transforms"] = cfg.transforms;
    out["stopwords"] = cfg.stopwords;
    return out;
}

} // namespace textcat
