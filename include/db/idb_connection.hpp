#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace gpcopy {

/**
 * @brief Result of a statement execution
 *
 * Returned by IDbConnection::execute(). The loader only issues DDL and
 * zero-row existence checks, so a result carries column names but no row data.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
};

/**
 * @brief Result of a COPY ... FROM STDIN transfer
 */
struct CopyInResult {
    bool success = false;
    std::string error_message;
    uint64_t rows_copied = 0;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Not thread-safe, with one exception: cancel() may be called from another
 * thread while execute() or copy_in() is running.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     * @param sql SQL text
     * @return Success flag, error message and result column names
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Run a COPY ... FROM STDIN command, streaming @p input as its data
     *
     * Blocks until the server acknowledges the end of data, the transfer
     * fails, or cancel() interrupts it.
     */
    [[nodiscard]] virtual CopyInResult copy_in(const std::string& copy_sql, std::istream& input) = 0;

    /**
     * @brief Ask an in-flight execute()/copy_in() to stop
     *
     * Safe to call from any thread. Returns false if the request could not
     * be sent; the running call may still finish normally.
     */
    virtual bool cancel() = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace gpcopy
