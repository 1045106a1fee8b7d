#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <vector>

namespace gpcopy {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {
    if (conn_) {
        cancel_ = PQgetCancel(conn_);
    }
}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {false, "Connection is null", {}};
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return {false, PQerrorMessage(conn_), {}};
    }

    ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        PQclear(res);
        return {true, {}, {}};
    }

    // Error case
    std::string error = PQerrorMessage(conn_);
    PQclear(res);
    return {false, error, {}};
}

CopyInResult PgConnection::copy_in(const std::string& copy_sql, std::istream& input) {
    CopyInResult result;
    if (!conn_) {
        result.error_message = "Connection is null";
        return result;
    }

    PGresult* res = PQexec(conn_, copy_sql.c_str());
    if (!res) {
        result.error_message = PQerrorMessage(conn_);
        return result;
    }
    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    if (status != PGRES_COPY_IN) {
        result.error_message = std::format("COPY did not enter COPY_IN state: {}",
                                           PQerrorMessage(conn_));
        return result;
    }

    std::vector<char> buffer(kCopyChunkSize);
    while (true) {
        if (cancel_requested_.load(std::memory_order_acquire)) {
            return finish_copy("canceled by client");
        }

        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = input.gcount();
        if (n > 0 && PQputCopyData(conn_, buffer.data(), static_cast<int>(n)) <= 0) {
            const std::string error = PQerrorMessage(conn_);
            result = finish_copy("aborted because of send failure");
            result.success = false;
            result.error_message = std::format("COPY data failed: {}", error);
            return result;
        }

        if (input.bad()) {
            result = finish_copy("aborted because of read failure");
            result.success = false;
            result.error_message = "Failed to read COPY input stream";
            return result;
        }
        if (input.eof() || n == 0) {
            break;
        }
    }

    return finish_copy(nullptr);
}

CopyInResult PgConnection::finish_copy(const char* abort_message) {
    CopyInResult result;

    if (PQputCopyEnd(conn_, abort_message) <= 0) {
        result.error_message = std::format("COPY end failed: {}", PQerrorMessage(conn_));
        return result;
    }

    // Drain every result; the first one carries the COPY status
    bool first = true;
    while (PGresult* res = PQgetResult(conn_)) {
        if (first) {
            if (PQresultStatus(res) == PGRES_COMMAND_OK) {
                result.success = true;
                const char* affected = PQcmdTuples(res);
                if (affected && std::strlen(affected) > 0) {
                    result.rows_copied = std::stoull(affected);
                }
            } else {
                result.error_message = PQresultErrorMessage(res);
            }
            first = false;
        }
        PQclear(res);
    }
    return result;
}

bool PgConnection::cancel() {
    cancel_requested_.store(true, std::memory_order_release);

    std::lock_guard<std::mutex> lock(cancel_mutex_);
    if (!cancel_) {
        return false;
    }

    char errbuf[256] = {};
    if (PQcancel(cancel_, errbuf, sizeof(errbuf)) == 0) {
        utils::log::warn(std::format("Failed to send cancel request: {}", errbuf));
        return false;
    }
    return true;
}

void PgConnection::close() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (cancel_) {
            PQfreeCancel(cancel_);
            cancel_ = nullptr;
        }
    }
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace gpcopy
