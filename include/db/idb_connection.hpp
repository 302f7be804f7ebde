#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace seedgen {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute() and IDbConnection::copy_in().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT. SQL NULL is an empty optional.
    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML / COPY
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet result;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Not thread-safe; one run owns one connection.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement
     * @param sql SQL text
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Stream rows into a table through COPY ... FROM STDIN
     * @param copy_sql Full COPY statement (table + ordered column list + format)
     * @param data Payload in the format named by copy_sql
     * @return affected_rows = rows committed by the server
     */
    [[nodiscard]] virtual DbResultSet copy_in(const std::string& copy_sql, std::istream& data) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace seedgen
