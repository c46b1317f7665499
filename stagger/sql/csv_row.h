/* csv_row.h                                                       -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Turning the rows of a CSV file into INSERT statements.
*/

#pragma once

#include "stagger/arch/exception.h"
#include <string>
#include <vector>

namespace STAGGER {


/*****************************************************************************/
/* CSV OPTIONS                                                               */
/*****************************************************************************/

struct CsvOptions {
    char delimiter = ',';
    char enclosure = '"';

    /// Wrap each value in single quotes
    bool addQuotes = true;

    /// Backslash-escape ', ", \ and NUL in each value
    bool addSlashes = true;
};

/** Thrown when a row ends inside an enclosed field. */
struct CsvUnclosedEnclosure: public Exception {
    CsvUnclosedEnclosure(const std::string & msg)
        : Exception(msg)
    {
    }
};


/*****************************************************************************/
/* FUNCTIONS                                                                 */
/*****************************************************************************/

/** Split one line into fields.  An enclosure only counts at the start of a
    field; inside an enclosed field a doubled enclosure stands for one.
    Trailing line terminators are ignored and an empty line has no fields.
*/
std::vector<std::string>
parseCsvRow(const std::string & line, char delimiter = ',',
            char enclosure = '"');

std::string addSlashes(const std::string & str);

/** Letters, digits, _ and $ only, and not empty. */
bool isSafeTableName(const std::string & table);

/** Is this line a row, rather than blank or a # comment? */
bool isCsvDataLine(const std::string & line);

/** INSERT INTO `table` VALUES (...) with the fields of line.  Throws if the
    table name is not safe or the row is malformed.
*/
std::string csvToInsert(const std::string & line, const std::string & table,
                        const CsvOptions & options = CsvOptions());

} // namespace STAGGER
