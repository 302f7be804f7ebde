#include "loader/csv_writer.hpp"
#include <format>
#include <fstream>
#include <system_error>

namespace seedgen {

std::string CsvWriter::encode_field(const Cell& cell) {
    if (!cell) return {};

    const std::string& value = *cell;
    const bool needs_quotes = value.empty() || value == "\\." ||
        value.find_first_of(",\"\r\n") != std::string::npos;
    if (!needs_quotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (const char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void CsvWriter::write(std::ostream& out, const GeneratedTable& table) {
    for (size_t i = 0; i < table.column_names.size(); ++i) {
        if (i > 0) out << ',';
        out << encode_field(table.column_names[i]);
    }
    out << '\n';

    for (const auto& row : table.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << ',';
            out << encode_field(row[i]);
        }
        out << '\n';
    }
}

Result<std::filesystem::path> CsvWriter::write_file(const std::filesystem::path& dir,
                                                    const GeneratedTable& table) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Result<std::filesystem::path>::error(ErrorCategory::LOAD_ERROR,
            std::format("Cannot create output directory {}: {}", dir.string(), ec.message()));
    }

    const auto path = dir / (table.table + ".csv");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<std::filesystem::path>::error(ErrorCategory::LOAD_ERROR,
            std::format("Cannot open {} for writing", path.string()));
    }

    write(out, table);
    out.flush();
    if (!out) {
        return Result<std::filesystem::path>::error(ErrorCategory::LOAD_ERROR,
            std::format("Write to {} failed", path.string()));
    }
    return Result<std::filesystem::path>::ok(path);
}

} // namespace seedgen
