#pragma once

#include "DataFrame.hpp"
#include <string>
#include <memory>
#include <stdexcept>
#include <vector>
#include <iosfwd>

namespace dataframe {

/**
 * The file could not be opened or read
 */
class CsvReadError : public std::runtime_error {
public:
    explicit CsvReadError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * The file was read but its content is not a well-formed table
 */
class CsvParseError : public std::runtime_error {
public:
    CsvParseError(const std::string& message, size_t lineNumber)
        : std::runtime_error(lineNumber > 0
              ? "line " + std::to_string(lineNumber) + ": " + message
              : message)
        , m_lineNumber(lineNumber) {}

    size_t lineNumber() const { return m_lineNumber; }

private:
    size_t m_lineNumber;
};

/**
 * CSV input for DataFrame
 */
class DataFrameIO {
public:
    /**
     * Load a delimited file into a DataFrame.
     *
     * - first non-blank line is the header (or col0..colN without header)
     * - blank lines are skipped
     * - empty cells are null; a short row is padded with nulls
     * - a row with more fields than the header is a parse error
     * - column types are inferred over every row: INT if all non-null cells
     *   are integers, DOUBLE if all are numbers, STRING otherwise
     *
     * @throws CsvReadError  when the file cannot be opened
     * @throws CsvParseError when the content is malformed
     */
    static std::shared_ptr<DataFrame> readCSV(
        const std::string& filepath,
        char delimiter = ',',
        bool hasHeader = true
    );

    /**
     * Same as readCSV, from an in-memory string
     */
    static std::shared_ptr<DataFrame> parseCSV(
        const std::string& content,
        char delimiter = ',',
        bool hasHeader = true
    );

    // Public for tests
    static std::vector<std::string> parseCSVLine(
        const std::string& line,
        char delimiter,
        size_t lineNumber = 0
    );

    static ColumnType detectType(const std::string& value);

private:
    static std::shared_ptr<DataFrame> read(
        std::istream& input,
        char delimiter,
        bool hasHeader
    );
};

} // namespace dataframe
