#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <ostream>
#include <string>

namespace seedgen {

/**
 * @brief CSV artifact writer (RFC 4180, PostgreSQL COPY ... CSV dialect)
 *
 * NULL is written as an empty unquoted field, the empty string as "".
 * Fields containing a delimiter, quote, CR or LF are quoted with inner
 * quotes doubled. A lone \. is quoted too, since COPY reads it as the
 * end-of-data marker.
 */
class CsvWriter {
public:
    [[nodiscard]] static std::string encode_field(const Cell& cell);

    // Header row, then one line per row, each terminated by \n
    static void write(std::ostream& out, const GeneratedTable& table);

    /**
     * @brief Write `<dir>/<table>.csv`, creating `dir` if needed
     * @return Path of the written file
     */
    [[nodiscard]] static Result<std::filesystem::path> write_file(const std::filesystem::path& dir,
                                                                  const GeneratedTable& table);
};

} // namespace seedgen
