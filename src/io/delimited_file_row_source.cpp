#include "io/delimited_file_row_source.hpp"
#include "copy/row_encoder.hpp"
#include "core/error.hpp"
#include "io/value_parser.hpp"

#include <format>

namespace gpcopy::io {

DelimitedFileRowSource::DelimitedFileRowSource(const std::filesystem::path& path,
                                               const TableSchema& schema,
                                               char separator,
                                               std::string null_token)
    : path_(path),
      schema_(schema),
      separator_(separator),
      null_token_(std::move(null_token)),
      in_(path, std::ios::binary) {
    if (!in_) {
        throw PartitionUploadError(std::format("Cannot open input file {}", path.string()));
    }
}

bool DelimitedFileRowSource::next(Row& row) {
    if (!std::getline(in_, line_)) {
        return false;
    }
    ++line_number_;

    const auto fields = RowEncoder::decode_line(line_, separator_, null_token_);
    if (fields.size() != schema_.size()) {
        throw RowEncodingError(std::format("{}:{}: expected {} fields, found {}",
                                           path_.string(), line_number_,
                                           schema_.size(), fields.size()));
    }

    row.clear();
    row.reserve(fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& column = schema_.columns[i];
        if (!fields[i]) {
            if (!column.nullable) {
                throw RowEncodingError(std::format("{}:{}: NULL in NOT NULL column {}",
                                                   path_.string(), line_number_, column.name));
            }
            row.emplace_back();
            continue;
        }
        auto parsed = parse_value(*fields[i], column.type);
        if (parsed.is_error()) {
            throw RowEncodingError(std::format("{}:{}: column {}: {}",
                                               path_.string(), line_number_, column.name,
                                               parsed.error_message()));
        }
        row.push_back(std::move(parsed.value()));
    }
    return true;
}

} // namespace gpcopy::io
