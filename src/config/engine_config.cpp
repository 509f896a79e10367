// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for motionrank

#include "config/engine_config.hpp"
#include "storage/memory_store.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace motionrank {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Double-quoted YAML scalar with backslash escapes
static std::string QuoteScalar(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string quoted = "\"";
    for (char c : value) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    quoted += "\\x";
                    quoted += kHex[(c >> 4) & 0x0F];
                    quoted += kHex[c & 0x0F];
                } else {
                    quoted += c;
                }
        }
    }
    quoted += '"';
    return quoted;
}

// Apply one key/value pair; numeric conversions throw on malformed values
static void ApplySetting(EngineConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
    if (section == "storage") {
        if (key == "backend") config.storage.backend = value;
        else if (key == "db_path") config.storage.db_path = value;
        else if (key == "enable_wal") config.storage.enable_wal = ParseBool(value);
        else if (key == "synchronous") config.storage.synchronous = value;
        else if (key == "busy_timeout_ms") config.storage.busy_timeout_ms = std::stoi(value);
    }
    else if (section == "evaluation") {
        if (key == "auto_evaluate") config.evaluation.auto_evaluate = ParseBool(value);
        else if (key == "max_analyzed_bytes") config.evaluation.max_analyzed_bytes = std::stoul(value);
        else if (key == "log_failures") config.evaluation.log_failures = ParseBool(value);
    }
    else if (section == "behavior") {
        if (key == "recent_window_days") config.behavior.recent_window_days = std::stoi(value);
        else if (key == "recent_share_threshold") config.behavior.recent_share_threshold = std::stof(value);
    }
    else if (section == "recommendation") {
        if (key == "cache_ttl_seconds") config.recommendation.cache_ttl_seconds = std::stoll(value);
        else if (key == "cache_capacity") config.recommendation.cache_capacity = std::stoul(value);
        else if (key == "default_limit") config.recommendation.default_limit = std::stoul(value);
        else if (key == "trending_window_days") config.recommendation.trending_window_days = std::stoi(value);
        else if (key == "similar_limit") config.recommendation.similar_limit = std::stoul(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error: "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplySetting(config, current_section, current_key, value);
                        } catch (const std::logic_error&) {
                            // std::invalid_argument and std::out_of_range from the conversions
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": \"" << value << "\"" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# motionrank configuration\n\n";

    ss << "storage:\n";
    ss << "  backend: " << QuoteScalar(storage.backend) << "\n";
    ss << "  db_path: " << QuoteScalar(storage.db_path) << "\n";
    ss << "  enable_wal: " << (storage.enable_wal ? "true" : "false") << "\n";
    ss << "  synchronous: " << QuoteScalar(storage.synchronous) << "\n";
    ss << "  busy_timeout_ms: " << storage.busy_timeout_ms << "\n\n";

    ss << "evaluation:\n";
    ss << "  auto_evaluate: " << (evaluation.auto_evaluate ? "true" : "false") << "\n";
    ss << "  max_analyzed_bytes: " << evaluation.max_analyzed_bytes << "\n";
    ss << "  log_failures: " << (evaluation.log_failures ? "true" : "false") << "\n\n";

    ss << "behavior:\n";
    ss << "  recent_window_days: " << behavior.recent_window_days << "\n";
    ss << "  recent_share_threshold: " << behavior.recent_share_threshold << "\n\n";

    ss << "recommendation:\n";
    ss << "  cache_ttl_seconds: " << recommendation.cache_ttl_seconds << "\n";
    ss << "  cache_capacity: " << recommendation.cache_capacity << "\n";
    ss << "  default_limit: " << recommendation.default_limit << "\n";
    ss << "  trending_window_days: " << recommendation.trending_window_days << "\n";
    ss << "  similar_limit: " << recommendation.similar_limit << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Storage
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("backend must be one of: memory, sqlite");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("db_path must be set for the sqlite backend");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("synchronous must be one of: FULL, NORMAL, OFF");
    }
    if (storage.busy_timeout_ms < 0) {
        errors.push_back("busy_timeout_ms must be non-negative");
    }

    // Evaluation
    if (evaluation.max_analyzed_bytes == 0) {
        errors.push_back("max_analyzed_bytes must be greater than 0");
    }

    // Behavior
    if (behavior.recent_window_days < 0) {
        errors.push_back("recent_window_days must be non-negative");
    }
    if (behavior.recent_share_threshold < 0.0f || behavior.recent_share_threshold > 1.0f) {
        errors.push_back("recent_share_threshold must be between 0.0 and 1.0");
    }

    // Recommendation
    if (recommendation.cache_ttl_seconds <= 0) {
        errors.push_back("cache_ttl_seconds must be greater than 0");
    }
    if (recommendation.cache_capacity == 0) {
        errors.push_back("cache_capacity must be greater than 0");
    }
    if (recommendation.default_limit == 0) {
        errors.push_back("default_limit must be greater than 0");
    }
    if (recommendation.trending_window_days <= 0) {
        errors.push_back("trending_window_days must be greater than 0");
    }
    if (recommendation.similar_limit == 0) {
        errors.push_back("similar_limit must be greater than 0");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

// ============================================================================
// Component settings
// ============================================================================

SqliteStore::Config EngineConfig::GetSqliteConfig() const {
    SqliteStore::Config result;
    result.db_path = storage.db_path;
    result.enable_wal = storage.enable_wal;
    result.synchronous = storage.synchronous;
    result.busy_timeout_ms = storage.busy_timeout_ms;
    return result;
}

SolutionEvaluator::Config EngineConfig::GetEvaluatorConfig() const {
    SolutionEvaluator::Config result;
    result.max_analyzed_bytes = evaluation.max_analyzed_bytes;
    result.log_failures = evaluation.log_failures;
    return result;
}

PreferenceModel::Config EngineConfig::GetPreferenceConfig() const {
    PreferenceModel::Config result;
    result.recent_window_days = behavior.recent_window_days;
    result.recent_share_threshold = behavior.recent_share_threshold;
    return result;
}

RecommendationEngine::Config EngineConfig::GetRecommendationConfig() const {
    RecommendationEngine::Config result;
    result.cache_ttl_seconds = recommendation.cache_ttl_seconds;
    result.cache_capacity = recommendation.cache_capacity;
    result.default_limit = recommendation.default_limit;
    result.trending_window_days = recommendation.trending_window_days;
    result.similar_limit = recommendation.similar_limit;
    return result;
}

std::unique_ptr<SolutionStore> CreateSolutionStore(const EngineConfig& config) {
    if (config.storage.backend == "memory") {
        return std::make_unique<MemoryStore>();
    }
    return std::make_unique<SqliteStore>(config.GetSqliteConfig());
}

} // namespace motionrank
