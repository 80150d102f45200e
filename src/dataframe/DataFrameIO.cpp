#include "DataFrameIO.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <unordered_set>

namespace dataframe {

namespace {

// INT < DOUBLE < STRING: a column takes the widest type seen in any cell
ColumnType widen(ColumnType current, ColumnType cell) {
    if (current == ColumnType::STRING || cell == ColumnType::STRING) {
        return ColumnType::STRING;
    }
    if (current == ColumnType::DOUBLE || cell == ColumnType::DOUBLE) {
        return ColumnType::DOUBLE;
    }
    return ColumnType::INT;
}

std::string trim(const std::string& field) {
    size_t start = field.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = field.find_last_not_of(" \t\r\n");
    return field.substr(start, end - start + 1);
}

} // namespace

std::shared_ptr<DataFrame> DataFrameIO::readCSV(
    const std::string& filepath,
    char delimiter,
    bool hasHeader
) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw CsvReadError("Cannot open file: " + filepath);
    }

    auto df = read(file, delimiter, hasHeader);

    if (file.bad()) {
        throw CsvReadError("Error while reading file: " + filepath);
    }
    return df;
}

std::shared_ptr<DataFrame> DataFrameIO::parseCSV(
    const std::string& content,
    char delimiter,
    bool hasHeader
) {
    std::istringstream input(content);
    return read(input, delimiter, hasHeader);
}

std::shared_ptr<DataFrame> DataFrameIO::read(
    std::istream& input,
    char delimiter,
    bool hasHeader
) {
    std::string line;
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    bool headerSeen = false;
    size_t lineNumber = 0;

    while (std::getline(input, line)) {
        lineNumber++;

        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto fields = parseCSVLine(line, delimiter, lineNumber);

        if (!headerSeen) {
            headerSeen = true;
            if (hasHeader) {
                headers = fields;
                continue;
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                headers.push_back("col" + std::to_string(i));
            }
        }

        if (fields.size() > headers.size()) {
            throw CsvParseError(
                "expected " + std::to_string(headers.size()) + " fields, got " +
                std::to_string(fields.size()), lineNumber);
        }
        fields.resize(headers.size());
        rows.push_back(std::move(fields));
    }

    if (!headerSeen) {
        throw CsvParseError("empty input: no header row", 0);
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : headers) {
        if (!seen.insert(name).second) {
            throw CsvParseError("duplicate column name '" + name + "'", 1);
        }
    }

    // Infer each column type from every non-null cell
    std::vector<ColumnType> types(headers.size(), ColumnType::INT);
    std::vector<bool> anyValue(headers.size(), false);
    for (const auto& row : rows) {
        for (size_t i = 0; i < headers.size(); ++i) {
            if (row[i].empty()) continue;
            anyValue[i] = true;
            types[i] = widen(types[i], detectType(row[i]));
        }
    }

    auto df = std::make_shared<DataFrame>();

    for (size_t i = 0; i < headers.size(); ++i) {
        ColumnType type = anyValue[i] ? types[i] : ColumnType::STRING;
        IColumnPtr col;

        if (type == ColumnType::INT) {
            auto intCol = std::make_shared<IntColumn>(headers[i]);
            intCol->reserve(rows.size());
            for (const auto& row : rows) {
                if (row[i].empty()) {
                    intCol->pushNull();
                } else {
                    intCol->push_back(static_cast<int64_t>(std::stoll(row[i])));
                }
            }
            col = intCol;
        } else if (type == ColumnType::DOUBLE) {
            auto doubleCol = std::make_shared<DoubleColumn>(headers[i]);
            doubleCol->reserve(rows.size());
            for (const auto& row : rows) {
                if (row[i].empty()) {
                    doubleCol->pushNull();
                } else {
                    doubleCol->push_back(std::strtod(row[i].c_str(), nullptr));
                }
            }
            col = doubleCol;
        } else {
            auto stringCol = std::make_shared<StringColumn>(headers[i]);
            stringCol->reserve(rows.size());
            for (const auto& row : rows) {
                if (row[i].empty()) {
                    stringCol->pushNull();
                } else {
                    stringCol->push_back(row[i]);
                }
            }
            col = stringCol;
        }

        df->addColumn(col);
    }

    return df;
}

std::vector<std::string> DataFrameIO::parseCSVLine(
    const std::string& line,
    char delimiter,
    size_t lineNumber
) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
        } else if (c == delimiter && !inQuotes) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }

    if (inQuotes) {
        throw CsvParseError("unterminated quoted field", lineNumber);
    }

    // Last field
    fields.push_back(trim(field));

    return fields;
}

ColumnType DataFrameIO::detectType(const std::string& value) {
    std::string trimmed = trim(value);

    if (trimmed.empty()) {
        return ColumnType::STRING;
    }

    size_t startIdx = 0;
    if (trimmed[0] == '-' || trimmed[0] == '+') {
        startIdx = 1;
    }

    if (startIdx >= trimmed.size()) {
        return ColumnType::STRING;
    }

    bool allDigits = true;
    for (size_t i = startIdx; i < trimmed.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            allDigits = false;
            break;
        }
    }

    if (allDigits) {
        try {
            std::stoll(trimmed);
            return ColumnType::INT;
        } catch (const std::out_of_range&) {
            return ColumnType::DOUBLE;  // Too wide for int64
        }
    }

    // Plain decimal or exponent notation only; strtod also accepts
    // "inf", "nan" and hex floats, which stay text here
    for (size_t i = startIdx; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) &&
            c != '.' && c != 'e' && c != 'E' && c != '-' && c != '+') {
            return ColumnType::STRING;
        }
    }

    char* end = nullptr;
    std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) {
        return ColumnType::STRING;
    }

    return ColumnType::DOUBLE;
}

} // namespace dataframe
