#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "textcat_tokenizer.hpp"
#include "textcat_types.hpp"

namespace textcat {

namespace fs = std::filesystem;

// Environment variables overriding buffer sizes
static constexpr const char* ENV_SOURCE_BUFFER_SIZE = "TEXTCAT_SOURCE_BUFFER_SIZE";
static constexpr const char* ENV_RELAY_BUFFER_SIZE = "TEXTCAT_RELAY_BUFFER_SIZE";

// Tokenizer settings by name, as stored in a JSON config file:
//
//   {
//     "source_buffer_size": 100,
//     "relay_buffer_size": 50,
//     "filters": ["not_stopword"],
//     "transforms": ["lowercase"],
//     "stopwords": ["extra", "words"]
//   }
//
// Every key is optional. Filters: not_stopword, non_empty.
// Transforms: lowercase, identity.
struct TokenizerConfig {
    size_t source_buffer_size = DEFAULT_SOURCE_BUFFER_SIZE;
    size_t relay_buffer_size = DEFAULT_RELAY_BUFFER_SIZE;
    std::vector<std::string> filters{"not_stopword"};
    std::vector<std::string> transforms{"lowercase"};
    std::vector<std::string> stopwords;  // added to the built-in list
};

bool is_known_filter(const std::string& name);
bool is_known_transform(const std::string& name);

// Parse config fields from j into out; out is untouched on failure
bool tokenizer_config_from_json(const json& j, TokenizerConfig& out);

// Read a JSON config file; out is untouched on failure
bool load_tokenizer_config(const fs::path& path, TokenizerConfig& out);

// Apply TEXTCAT_* buffer size variables; invalid values are logged and ignored
void apply_env_overrides(TokenizerConfig& cfg);

// Resolve names into callable filters and transforms.
// Throws std::invalid_argument for unknown names or zero buffer sizes.
TokenizerOptions make_tokenizer_options(const TokenizerConfig& cfg);

json to_json(const TokenizerConfig& cfg);

} // namespace textcat
