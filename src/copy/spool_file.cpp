#include "copy/spool_file.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <system_error>

namespace gpcopy {

SpoolFile::SpoolFile(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw PartitionUploadError(std::format(
            "Failed to create local spool directory {}: {}", dir.string(), ec.message()));
    }
    path_ = dir / utils::generate_uuid();
}

SpoolFile::~SpoolFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        utils::log::warn(std::format("Failed to remove spool file {}: {}",
                                     path_.string(), ec.message()));
    }
}

} // namespace gpcopy
