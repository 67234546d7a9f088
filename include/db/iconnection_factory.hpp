#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace querygate {

/**
 * @brief Abstract factory for creating external database connections
 *
 * Each backend provides its own factory that wraps the native
 * connection function (sqlite3_open_v2, PQconnectdb, mysql_real_connect).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure (logged)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace querygate
