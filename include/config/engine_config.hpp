// File: include/config/engine_config.hpp
//
// YAML Configuration Support for motionrank
// Collects storage, evaluation, behavior and recommendation settings

#ifndef MOTIONRANK_ENGINE_CONFIG_HPP
#define MOTIONRANK_ENGINE_CONFIG_HPP

#include "behavior/preference_model.hpp"
#include "evaluation/solution_evaluator.hpp"
#include "recommendation/recommendation_engine.hpp"
#include "storage/solution_store.hpp"
#include "storage/sqlite_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace motionrank {

/// Configuration structure for a motionrank session
struct EngineConfig {
    // === Storage Settings ===
    struct Storage {
        std::string backend = "sqlite";      // "memory" or "sqlite"
        std::string db_path = "motionrank.db";
        bool enable_wal = true;
        std::string synchronous = "NORMAL";  // FULL, NORMAL or OFF
        int busy_timeout_ms = 5000;
    } storage;

    // === Evaluation Settings ===
    struct Evaluation {
        bool auto_evaluate = true;
        size_t max_analyzed_bytes = 1 << 20;
        bool log_failures = true;
    } evaluation;

    // === Behavior Settings ===
    struct Behavior {
        int recent_window_days = 7;
        float recent_share_threshold = 0.7f;
    } behavior;

    // === Recommendation Settings ===
    struct Recommendation {
        int64_t cache_ttl_seconds = 3600;   // 1 hour
        size_t cache_capacity = 128;
        size_t default_limit = 10;
        int trending_window_days = 7;
        size_t similar_limit = 5;
    } recommendation;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static EngineConfig Default();

    // === Component settings ===
    SqliteStore::Config GetSqliteConfig() const;
    SolutionEvaluator::Config GetEvaluatorConfig() const;
    PreferenceModel::Config GetPreferenceConfig() const;
    RecommendationEngine::Config GetRecommendationConfig() const;
};

/// Open the store selected by storage.backend
/// @throws std::runtime_error if the SQLite database cannot be opened
std::unique_ptr<SolutionStore> CreateSolutionStore(const EngineConfig& config);

} // namespace motionrank

#endif // MOTIONRANK_ENGINE_CONFIG_HPP
