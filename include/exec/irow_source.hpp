#pragma once

#include "core/error.hpp"
#include "core/row.hpp"

#include <format>
#include <memory>
#include <vector>

namespace gpcopy {

/**
 * @brief Single-pass sequence of rows (one partition)
 */
class IRowSource {
public:
    virtual ~IRowSource() = default;

    /**
     * @brief Fetch the next row into @p row
     * @return false once the source is exhausted
     */
    [[nodiscard]] virtual bool next(Row& row) = 0;
};

/**
 * @brief Rows held in memory
 */
class VectorRowSource : public IRowSource {
public:
    explicit VectorRowSource(std::vector<Row> rows) : rows_(std::move(rows)) {}

    bool next(Row& row) override {
        if (pos_ >= rows_.size()) return false;
        row = std::move(rows_[pos_++]);
        return true;
    }

private:
    std::vector<Row> rows_;
    size_t pos_ = 0;
};

/**
 * @brief Reorders every row of another source
 *
 * Output column i is input column mapping[i].
 * @throws RowEncodingError for an input row too short for the mapping
 */
class ProjectingRowSource : public IRowSource {
public:
    ProjectingRowSource(IRowSource& inner, std::vector<size_t> mapping)
        : inner_(inner), mapping_(std::move(mapping)) {}

    bool next(Row& row) override {
        if (!inner_.next(buffer_)) return false;
        row.clear();
        row.reserve(mapping_.size());
        for (const size_t idx : mapping_) {
            if (idx >= buffer_.size()) {
                throw RowEncodingError(std::format(
                    "Row has {} value(s), column {} of the input is missing",
                    buffer_.size(), idx));
            }
            row.push_back(std::move(buffer_[idx]));
        }
        return true;
    }

private:
    IRowSource& inner_;
    std::vector<size_t> mapping_;
    Row buffer_;
};

} // namespace gpcopy
