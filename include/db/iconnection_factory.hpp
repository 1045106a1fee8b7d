#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace gpcopy {

/**
 * @brief Abstract factory for creating database connections
 *
 * Every partition upload and the job coordinator each open their own
 * connection through this factory; it must be callable from many threads.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace gpcopy
