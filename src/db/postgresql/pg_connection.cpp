#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <array>
#include <cstring>
#include <format>

namespace seedgen {

namespace {

// COPY payload is pushed to the server in chunks of this size
constexpr size_t kCopyChunkBytes = 64 * 1024;

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    std::string error = PQerrorMessage(conn_);
    PQclear(res);
    return DbResultSet::failure(std::move(error));
}

DbResultSet PgConnection::copy_in(const std::string& copy_sql, std::istream& data) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }

    PGresult* res = PQexec(conn_, copy_sql.c_str());
    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    if (status != PGRES_COPY_IN) {
        // Server refused the COPY before any data was sent
        std::string error = PQerrorMessage(conn_);
        [[maybe_unused]] const auto drained = finish_copy();
        return DbResultSet::failure(std::move(error));
    }

    std::array<char, kCopyChunkBytes> buffer;
    while (data) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = data.gcount();
        if (n <= 0) break;

        if (PQputCopyData(conn_, buffer.data(), static_cast<int>(n)) != 1) {
            std::string error = std::format("COPY data send failed: {}", PQerrorMessage(conn_));
            abort_copy("client send failure");
            return DbResultSet::failure(std::move(error));
        }
    }

    if (data.bad()) {
        abort_copy("client read failure");
        return DbResultSet::failure("COPY source stream read failed");
    }

    if (PQputCopyEnd(conn_, nullptr) != 1) {
        std::string error = std::format("COPY end failed: {}", PQerrorMessage(conn_));
        [[maybe_unused]] const auto drained = finish_copy();
        return DbResultSet::failure(std::move(error));
    }

    return finish_copy();
}

void PgConnection::abort_copy(const char* reason) {
    if (PQputCopyEnd(conn_, reason) != 1) {
        utils::log::warn(std::format("COPY abort not delivered: {}", PQerrorMessage(conn_)));
    }
    // The server answers an aborted COPY with an error result; it is
    // drained here and the caller reports its own message instead.
    [[maybe_unused]] const auto drained = finish_copy();
}

DbResultSet PgConnection::finish_copy() {
    DbResultSet result;
    result.success = true;

    // PQgetResult must be called until it returns null before the
    // connection accepts another command.
    while (PGresult* res = PQgetResult(conn_)) {
        const ExecStatusType status = PQresultStatus(res);
        if (status == PGRES_COMMAND_OK) {
            const char* affected = PQcmdTuples(res);
            result.affected_rows = utils::parse_int<uint64_t>(affected, 0);
        } else if (result.success) {
            result.success = false;
            const char* msg = PQresultErrorMessage(res);
            result.error_message = (msg && *msg) ? msg : PQerrorMessage(conn_);
        }
        PQclear(res);
    }

    return result;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(PQgetvalue(res, i, j));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected, 0);
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

} // namespace seedgen
