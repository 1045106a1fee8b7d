#include "config/config_loader.hpp"
#include "copy/load_orchestrator.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "exec/threaded_partition_executor.hpp"
#include "io/delimited_file_row_source.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace gpcopy;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCopyFailed = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <config.toml> <partition-file>...\n"
        "\n"
        "Loads each partition file into the table named by [copy] table.\n"
        "Every file is one partition; partitions are uploaded in parallel.\n",
        argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string config_file = argv[1];
    utils::log::info(std::format("Loading configuration from {}", config_file));
    const auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitUsage;
    }
    const LoaderConfig& cfg = config_result.config;
    utils::log::set_level(cfg.logging.level);

    std::vector<std::string> files(argv + 2, argv + argc);
    std::vector<ThreadedPartitionExecutor::SourceFactory> partitions;
    partitions.reserve(files.size());
    for (const auto& file : files) {
        partitions.emplace_back([&cfg, file]() -> std::unique_ptr<IRowSource> {
            return std::make_unique<io::DelimitedFileRowSource>(
                file, cfg.schema, cfg.input.field_separator, cfg.input.null_token);
        });
    }
    ThreadedPartitionExecutor executor(std::move(partitions), cfg.execution.max_parallel_partitions);

    try {
        const CopyOptions options = cfg.to_copy_options(std::make_shared<PgConnectionFactory>());
        utils::log::info(std::format("Copying {} partition(s) into {} ({} mode, {} workers)",
                                     executor.partition_count(), options.table,
                                     options.transaction_on ? "transactional" : "non-transactional",
                                     executor.max_parallelism()));

        LoadOrchestrator orchestrator(options, cfg.schema);
        const LoadReport report = orchestrator.copy(executor);
        std::cout << to_json(report).dump(2) << std::endl;
        return kExitOk;
    } catch (const InvalidOptionsError& e) {
        utils::log::error(e.what());
        return kExitUsage;
    } catch (const MalformedIdentifierError& e) {
        utils::log::error(e.what());
        return kExitUsage;
    } catch (const CopyError& e) {
        utils::log::error(std::format("Copy failed [{}]: {}",
                                      error_category_to_string(e.category()), e.what()));
        return kExitCopyFailed;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Copy failed: {}", e.what()));
        return kExitCopyFailed;
    }
}
