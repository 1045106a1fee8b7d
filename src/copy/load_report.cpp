#include "copy/load_report.hpp"

namespace gpcopy {

nlohmann::json to_json(const LoadReport& report) {
    nlohmann::json j;
    j["target_table"] = report.target_table;
    j["mode"] = report.transactional ? "transactional" : "non_transactional";
    if (!report.staging_table.empty()) {
        j["staging_table"] = report.staging_table;
    }
    j["partitions"] = {
        {"total", report.total_partitions},
        {"successful", report.successful_partitions},
        {"failed", report.total_partitions - report.successful_partitions}
    };
    j["rows_copied"] = report.rows_copied;
    j["elapsed_ms"] = report.elapsed.count();
    j["committed"] = report.committed;
    return j;
}

} // namespace gpcopy
