#pragma once

#include <filesystem>

namespace gpcopy {

/**
 * @brief Uniquely named local file that is deleted when the object dies
 *
 * Creates the parent directory if needed; the file itself is created by
 * whoever opens path() for writing.
 */
class SpoolFile {
public:
    /**
     * @throws PartitionUploadError if @p dir cannot be created
     */
    explicit SpoolFile(const std::filesystem::path& dir);
    ~SpoolFile();

    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace gpcopy
