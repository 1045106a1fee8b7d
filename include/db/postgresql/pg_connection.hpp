#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <atomic>
#include <mutex>
#include <string>

namespace gpcopy {

/**
 * @brief PostgreSQL / Greenplum connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    CopyInResult copy_in(const std::string& copy_sql, std::istream& input) override;
    bool cancel() override;
    void close() override;

    static constexpr size_t kCopyChunkSize = 64 * 1024;

private:
    /**
     * @brief Column names of a SELECT result (PGRES_TUPLES_OK)
     */
    DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Send end-of-data (or an abort message) and collect the final status
     */
    CopyInResult finish_copy(const char* abort_message);

    PGconn* conn_;

    // Guards cancel_ against close() racing a cross-thread cancel()
    std::mutex cancel_mutex_;
    PGcancel* cancel_ = nullptr;
    std::atomic<bool> cancel_requested_{false};
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace gpcopy
