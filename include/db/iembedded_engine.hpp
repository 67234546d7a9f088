#pragma once

#include "db/idb_connection.hpp"

#include <string>

namespace querygate {

/**
 * @brief In-process engine that can host an in-memory frame as a table
 *
 * Each instance is a private, in-memory database; two instances never
 * share state.
 */
class IEmbeddedEngine : public IDbConnection {
public:
    ~IEmbeddedEngine() override = default;

    /**
     * @brief Create table_name and copy every row of frame into it
     */
    [[nodiscard]] virtual DbResultSet load_frame(const std::string& table_name,
                                                 const DataFrame& frame) = 0;

    /**
     * @brief Disable file, network and extension access from SQL
     *
     * Called once after load_frame(); configuration cannot be relaxed
     * afterwards by user SQL.
     */
    [[nodiscard]] virtual DbResultSet lock_down() = 0;
};

} // namespace querygate
