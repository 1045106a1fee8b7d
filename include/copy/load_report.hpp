#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace gpcopy {

/**
 * @brief Summary of one finished copy job
 */
struct LoadReport {
    std::string target_table;
    std::string staging_table;   // empty in non-transactional mode
    bool transactional = false;
    size_t total_partitions = 0;
    size_t successful_partitions = 0;
    uint64_t rows_copied = 0;
    std::chrono::milliseconds elapsed{0};
    bool committed = false;
};

[[nodiscard]] nlohmann::json to_json(const LoadReport& report);

} // namespace gpcopy
