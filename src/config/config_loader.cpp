#include "config/config_loader.hpp"
#include "copy/table_identifier.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <string_view>
#include <format>
#include <stdexcept>
#include <algorithm>
#include <unordered_set>

using namespace std::string_literals;

namespace gpcopy {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace each ${NAME} in @p input with the environment value (empty if unset)
 * @throws std::runtime_error on an unterminated ${
 */
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        out.append(input.substr(pos, open == std::string_view::npos ? input.npos : open - pos));
        if (open == std::string_view::npos) break;

        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    return out;
}

// Every string value, at any depth of tables and arrays
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, value] : *tbl) expand_env_vars_in(value);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_env_vars_in(elem);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_in(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

char single_char(const std::string& value, std::string_view key) {
    if (value.size() != 1) {
        throw std::invalid_argument(
            std::format("{} must be exactly one character, got \"{}\"", key, value));
    }
    return value[0];
}

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    if (const auto* d = root["database"].as_table()) {
        cfg.connection_string = (*d)["connection_string"].value_or(""s);
    }
    return cfg;
}

CopyConfig extract_copy(const toml::table& root) {
    CopyConfig cfg;
    const auto* c = root["copy"].as_table();
    if (!c) return cfg;

    cfg.table = (*c)["table"].value_or(""s);
    if (const auto delim = (*c)["delimiter"].value<std::string>()) {
        cfg.delimiter = single_char(*delim, "copy.delimiter");
    }
    if (const auto timeout = (*c)["copy_timeout"].value<std::string>()) {
        const auto parsed = utils::parse_duration(*timeout);
        if (!parsed) {
            throw std::invalid_argument(std::format(
                "copy.copy_timeout \"{}\" is not a duration (e.g. \"90s\", \"100min\", \"2h\")",
                *timeout));
        }
        cfg.copy_timeout = *parsed;
    }
    cfg.transaction_on = (*c)["transaction_on"].value_or(cfg.transaction_on);
    cfg.create_table_options = (*c)["create_table_options"].value_or(""s);
    cfg.create_table_column_types = (*c)["create_table_column_types"].value_or(""s);
    cfg.local_dir = (*c)["local_dir"].value_or(""s);
    cfg.match_table_columns = (*c)["match_table_columns"].value_or(cfg.match_table_columns);
    return cfg;
}

ExecutionConfig extract_execution(const toml::table& root) {
    ExecutionConfig cfg;
    if (const auto* e = root["execution"].as_table()) {
        const int64_t n = (*e)["max_parallel_partitions"].value_or(int64_t{0});
        if (n < 0) {
            throw std::invalid_argument("execution.max_parallel_partitions must be >= 0");
        }
        cfg.max_parallel_partitions = static_cast<size_t>(n);
    }
    return cfg;
}

InputConfig extract_input(const toml::table& root) {
    InputConfig cfg;
    if (const auto* i = root["input"].as_table()) {
        if (const auto sep = (*i)["field_separator"].value<std::string>()) {
            cfg.field_separator = single_char(*sep, "input.field_separator");
        }
        cfg.null_token = (*i)["null_token"].value_or(cfg.null_token);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        const std::string level = (*l)["level"].value_or("info"s);
        const auto parsed = utils::log::parse_level(level);
        if (!parsed) {
            throw std::invalid_argument(std::format(
                "logging.level must be debug, info, warn or error, got \"{}\"", level));
        }
        cfg.level = *parsed;
    }
    return cfg;
}

ColumnType column_type_from(const toml::table& col, const std::string& name) {
    const std::string type_name = col["type"].value_or("text"s);
    auto type = parse_column_type(type_name);
    if (!type) {
        throw std::invalid_argument(
            std::format("columns.{}: malformed type \"{}\"", name, type_name));
    }

    if (type->kind == ValueKind::DECIMAL) {
        if (const auto p = col["precision"].value<int64_t>()) {
            type->precision = static_cast<uint8_t>(std::clamp<int64_t>(*p, 1, 38));
        }
        if (const auto s = col["scale"].value<int64_t>()) {
            type->scale = static_cast<uint8_t>(std::clamp<int64_t>(*s, 0, type->precision));
        }
    }

    if (const auto underlying = col["underlying"].value<std::string>()) {
        const auto storage = parse_column_type(*underlying);
        if (!storage) {
            throw std::invalid_argument(
                std::format("columns.{}: malformed underlying type \"{}\"", name, *underlying));
        }
        return ColumnType::user_defined(type_name, *storage);
    }
    return *type;
}

TableSchema extract_columns(const toml::table& root) {
    TableSchema schema;
    const auto* arr = root["columns"].as_array();
    if (!arr) return schema;

    for (const auto& elem : *arr) {
        const auto* col = elem.as_table();
        if (!col) {
            throw std::invalid_argument("columns entries must be tables");
        }
        ColumnSchema column;
        column.name = (*col)["name"].value_or(""s);
        column.type = column_type_from(*col, column.name);
        column.nullable = (*col)["nullable"].value_or(true);
        schema.columns.push_back(std::move(column));
    }
    return schema;
}

LoaderConfig extract_all_sections(const toml::table& root) {
    LoaderConfig config;
    config.database = extract_database(root);
    config.copy = extract_copy(root);
    config.execution = extract_execution(root);
    config.input = extract_input(root);
    config.logging = extract_logging(root);
    config.schema = extract_columns(root);
    return config;
}

ConfigLoader::LoadResult validate_and_return(LoaderConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// LoaderConfig
// ============================================================================

CopyOptions LoaderConfig::to_copy_options(std::shared_ptr<IConnectionFactory> factory) const {
    CopyOptions options;
    options.table = copy.table;
    options.connection_string = database.connection_string;
    options.connection_factory = std::move(factory);
    options.delimiter = copy.delimiter;
    options.copy_timeout = copy.copy_timeout;
    options.transaction_on = copy.transaction_on;
    options.create_table_options = copy.create_table_options;
    options.create_table_column_types = copy.create_table_column_types;
    options.local_dir = copy.local_dir;
    options.match_table_columns = copy.match_table_columns;
    return options;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const LoaderConfig& config) {
    std::vector<std::string> errors;

    if (config.database.connection_string.empty()) {
        errors.emplace_back("database.connection_string must not be empty");
    }

    if (config.copy.table.empty()) {
        errors.emplace_back("copy.table must not be empty");
    } else if (const auto parsed = TableIdentifier::try_parse(config.copy.table); parsed.is_error()) {
        errors.push_back("copy.table: " + parsed.error_message());
    }

    if (!is_valid_delimiter(config.copy.delimiter)) {
        errors.push_back(std::format(
            "copy.delimiter 0x{:02x} is not allowed",
            static_cast<unsigned>(static_cast<unsigned char>(config.copy.delimiter))));
    }

    if (config.copy.copy_timeout <= std::chrono::milliseconds::zero()) {
        errors.emplace_back("copy.copy_timeout must be > 0");
    } else if (config.copy.copy_timeout > kMaxCopyTimeout) {
        errors.push_back(std::format("copy.copy_timeout must be at most {}h",
            std::chrono::duration_cast<std::chrono::hours>(kMaxCopyTimeout).count()));
    }

    if (config.input.field_separator == '\\' || config.input.field_separator == '\n') {
        errors.emplace_back("input.field_separator must not be a backslash or newline");
    }
    if (config.input.null_token.empty()) {
        errors.emplace_back("input.null_token must not be empty");
    }

    if (config.schema.empty()) {
        errors.emplace_back("at least one [[columns]] entry is required");
    }
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.schema.columns.size(); ++i) {
        const auto& col = config.schema.columns[i];
        if (col.name.empty()) {
            errors.push_back(std::format("columns[{}].name must not be empty", i));
        } else if (!seen.insert(utils::to_lower(col.name)).second) {
            errors.push_back(std::format("columns[{}]: duplicate column name '{}'", i, col.name));
        }
    }

    return errors;
}

} // namespace gpcopy
