#pragma once

#include "copy/copy_options.hpp"
#include "core/row.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gpcopy {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
};

struct CopyConfig {
    std::string table;
    char delimiter = '\t';
    std::chrono::milliseconds copy_timeout{std::chrono::hours(1)};
    bool transaction_on = false;
    std::string create_table_options;
    std::string create_table_column_types;
    std::filesystem::path local_dir;
    bool match_table_columns = true;
};

struct ExecutionConfig {
    // 0 = hardware concurrency
    size_t max_parallel_partitions = 0;
};

struct InputConfig {
    char field_separator = ',';
    std::string null_token = "\\N";
};

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

struct LoaderConfig {
    DatabaseConfig database;
    CopyConfig copy;
    ExecutionConfig execution;
    InputConfig input;
    LoggingConfig logging;
    TableSchema schema;

    /// Copy options for this config, connecting through @p factory
    [[nodiscard]] CopyOptions to_copy_options(std::shared_ptr<IConnectionFactory> factory) const;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        LoaderConfig config;

        static LoadResult ok(LoaderConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gpcopy.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config
     * @return Error messages (empty if valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const LoaderConfig& config);
};

} // namespace gpcopy
