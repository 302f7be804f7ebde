#include "loader/bulk_loader.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_sql.hpp"
#include <format>
#include <fstream>

namespace seedgen {

BulkLoader::BulkLoader(IDbConnection& conn, std::string schema)
    : conn_(conn), schema_(std::move(schema)) {}

Result<size_t> BulkLoader::truncate_all(const std::vector<std::string>& order) {
    size_t truncated = 0;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const std::string sql = std::format("TRUNCATE TABLE {} RESTART IDENTITY CASCADE",
                                            pg::qualified_name(schema_, *it));
        const auto result = conn_.execute(sql);
        if (!result.success) {
            return Result<size_t>::error(ErrorCategory::LOAD_ERROR,
                std::format("Truncate of '{}' failed: {}", *it, result.error_message));
        }
        ++truncated;
    }
    utils::log::info(std::format("Truncated {} tables", truncated));
    return Result<size_t>::ok(truncated);
}

Result<uint64_t> BulkLoader::load(const std::string& table,
                                  const std::vector<std::string>& columns,
                                  const std::filesystem::path& csv_path) {
    std::ifstream in(csv_path, std::ios::binary);
    if (!in) {
        return Result<uint64_t>::error(ErrorCategory::LOAD_ERROR,
            std::format("Cannot open artifact {}", csv_path.string()));
    }

    std::string header;
    if (!std::getline(in, header)) {
        return Result<uint64_t>::error(ErrorCategory::LOAD_ERROR,
            std::format("Artifact {} has no header row", csv_path.string()));
    }

    const std::string sql = std::format("COPY {} ({}) FROM STDIN WITH (FORMAT CSV)",
                                        pg::qualified_name(schema_, table),
                                        pg::column_list(columns));
    const auto result = conn_.copy_in(sql, in);
    if (!result.success) {
        return Result<uint64_t>::error(ErrorCategory::LOAD_ERROR,
            std::format("COPY into '{}' failed: {}", table, result.error_message));
    }
    return Result<uint64_t>::ok(result.affected_rows);
}

Result<size_t> BulkLoader::reload_keys(const std::string& table,
                                       const std::string& pk_column,
                                       ReferenceKeyPool& pool) {
    const std::string pk = pg::quote_identifier(pk_column);
    const std::string sql = std::format("SELECT {} FROM {} ORDER BY {}",
                                        pk, pg::qualified_name(schema_, table), pk);
    const auto result = conn_.execute(sql);
    if (!result.success) {
        return Result<size_t>::error(ErrorCategory::LOAD_ERROR,
            std::format("Key re-read for '{}' failed: {}", table, result.error_message));
    }

    std::vector<std::string> keys;
    keys.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (!row.empty() && row[0]) keys.push_back(*row[0]);
    }
    const size_t count = keys.size();
    pool.set(table, std::move(keys));
    return Result<size_t>::ok(count);
}

Result<bool> BulkLoader::sync_sequence(const std::string& table, const std::string& pk_column) {
    // Second argument is a plain column name, not an identifier
    const std::string lookup = std::format("SELECT pg_get_serial_sequence({}, {})",
        pg::quote_literal(pg::qualified_name(schema_, table)),
        pg::quote_literal(pk_column));
    const auto seq = conn_.execute(lookup);
    if (!seq.success) {
        return Result<bool>::error(ErrorCategory::LOAD_ERROR,
            std::format("Sequence lookup for '{}.{}' failed: {}", table, pk_column, seq.error_message));
    }
    if (seq.rows.empty() || seq.rows[0].empty() || !seq.rows[0][0]) {
        return Result<bool>::ok(false);
    }

    const std::string pk = pg::quote_identifier(pk_column);
    const std::string source = pg::qualified_name(schema_, table);
    // Empty table: setval(seq, 1, false) so the next value is 1
    const std::string sql = std::format(
        "SELECT setval({}, COALESCE((SELECT MAX({}) FROM {}), 1), "
        "(SELECT MAX({}) IS NOT NULL FROM {}))",
        pg::quote_literal(*seq.rows[0][0]), pk, source, pk, source);
    const auto result = conn_.execute(sql);
    if (!result.success) {
        return Result<bool>::error(ErrorCategory::LOAD_ERROR,
            std::format("Sequence sync for '{}.{}' failed: {}", table, pk_column, result.error_message));
    }
    utils::log::debug(std::format("Synced sequence {} for {}.{}", *seq.rows[0][0], table, pk_column));
    return Result<bool>::ok(true);
}

} // namespace seedgen
