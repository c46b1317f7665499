/* csv_row.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

*/

#include "csv_row.h"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <ctype.h>


using namespace std;


namespace STAGGER {

std::vector<std::string>
parseCsvRow(const std::string & line, char delimiter, char enclosure)
{
    size_t n = line.size();
    while (n > 0 && (line[n - 1] == '\n' || line[n - 1] == '\r'))
        --n;

    vector<string> result;
    if (n == 0)
        return result;

    size_t i = 0;
    for (;;) {
        string field;
        bool another = false;

        if (i < n && line[i] == enclosure) {
            ++i;
            bool closed = false;
            while (i < n) {
                if (line[i] == enclosure) {
                    if (i + 1 < n && line[i + 1] == enclosure) {
                        field += enclosure;
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                field += line[i++];
            }
            if (!closed)
                throw CsvUnclosedEnclosure
                    ("row finished inside a field enclosed by "
                     + string(1, enclosure));
        }

        // Unquoted text, or what follows the closing enclosure
        while (i < n) {
            if (line[i] == delimiter) {
                another = true;
                ++i;
                break;
            }
            field += line[i++];
        }

        result.emplace_back(std::move(field));
        if (!another)
            break;
    }

    return result;
}

std::string addSlashes(const std::string & str)
{
    string result;
    result.reserve(str.size() + 8);
    for (char c: str) {
        switch (c) {
        case '\'':
        case '"':
        case '\\':
            result += '\\';
            result += c;
            break;
        case 0:
            result += "\\0";
            break;
        default:
            result += c;
        }
    }
    return result;
}

bool isSafeTableName(const std::string & table)
{
    if (table.empty())
        return false;
    for (char c: table) {
        if (!(isalnum((unsigned char)c) || c == '_' || c == '$'))
            return false;
    }
    return true;
}

bool isCsvDataLine(const std::string & line)
{
    string trimmed = boost::algorithm::trim_copy(line);
    return !trimmed.empty() && trimmed[0] != '#';
}

std::string csvToInsert(const std::string & line, const std::string & table,
                        const CsvOptions & options)
{
    if (!isSafeTableName(table))
        throw Exception("invalid table name for CSV import: '" + table + "'");

    vector<string> fields
        = parseCsvRow(line, options.delimiter, options.enclosure);
    if (fields.empty())
        throw Exception("empty CSV row");

    for (auto & field: fields) {
        if (options.addSlashes)
            field = addSlashes(field);
        if (options.addQuotes)
            field = "'" + field + "'";
    }

    return "INSERT INTO `" + table + "` VALUES ("
        + boost::algorithm::join(fields, ",") + ")";
}

} // namespace STAGGER
