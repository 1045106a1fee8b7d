#pragma once

#include "core/row.hpp"
#include "exec/irow_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace gpcopy::io {

/**
 * @brief One partition read from a delimited text file
 *
 * One row per line; fields are split on unescaped @p separator, backslash
 * escapes (\\, \n, \r, \t, \<separator>) are undone and a field equal to
 * @p null_token becomes NULL. Each field is typed by its schema column.
 */
class DelimitedFileRowSource : public IRowSource {
public:
    /**
     * @throws PartitionUploadError if the file cannot be opened
     */
    DelimitedFileRowSource(const std::filesystem::path& path,
                           const TableSchema& schema,
                           char separator = ',',
                           std::string null_token = "\\N");

    /**
     * @throws RowEncodingError on a malformed line (wrong field count, bad value,
     *         NULL in a NOT NULL column)
     */
    bool next(Row& row) override;

    [[nodiscard]] uint64_t line_number() const { return line_number_; }

private:
    std::filesystem::path path_;
    const TableSchema& schema_;
    char separator_;
    std::string null_token_;
    std::ifstream in_;
    std::string line_;
    uint64_t line_number_ = 0;
};

} // namespace gpcopy::io
