#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "generator/reference_key_pool.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace seedgen {

/**
 * @brief Loads CSV artifacts into the database and refreshes key pools
 *
 * Every statement is scoped to one table of the configured schema. No
 * transaction spans tables: a table committed before a failure stays
 * committed.
 *
 * Usage:
 *   BulkLoader loader(conn, "public");
 *   loader.truncate_all(plan.order);
 *   auto rows = loader.load("hotel", columns, "out/hotel.csv");
 *   loader.reload_keys("hotel", "hotel_id", ctx.key_pool());
 */
class BulkLoader {
public:
    BulkLoader(IDbConnection& conn, std::string schema);

    /**
     * @brief TRUNCATE ... RESTART IDENTITY CASCADE, in reverse of `order`
     * @return Number of tables truncated
     */
    [[nodiscard]] Result<size_t> truncate_all(const std::vector<std::string>& order);

    /**
     * @brief Stream a CSV artifact through COPY ... FROM STDIN (FORMAT CSV)
     *
     * The artifact's header line is skipped; `columns` gives the explicit
     * column list in the artifact's column order.
     *
     * @return Rows committed by the server
     */
    [[nodiscard]] Result<uint64_t> load(const std::string& table,
                                        const std::vector<std::string>& columns,
                                        const std::filesystem::path& csv_path);

    /**
     * @brief Re-read committed primary keys and replace the table's pool entry
     * @return Number of keys now in the pool
     */
    [[nodiscard]] Result<size_t> reload_keys(const std::string& table,
                                             const std::string& pk_column,
                                             ReferenceKeyPool& pool);

    /**
     * @brief Advance a serial/identity sequence behind `pk_column` to MAX(pk)
     * @return false when the column has no backing sequence
     */
    [[nodiscard]] Result<bool> sync_sequence(const std::string& table,
                                             const std::string& pk_column);

    [[nodiscard]] const std::string& schema() const { return schema_; }

private:
    IDbConnection& conn_;
    std::string schema_;
};

} // namespace seedgen
