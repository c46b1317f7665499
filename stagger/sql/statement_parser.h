/* statement_parser.h                                              -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Assembles complete SQL statements from the lines of a dump file.
*/

#pragma once

#include "statement.h"
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>

namespace STAGGER {


/*****************************************************************************/
/* PARSER STATE                                                              */
/*****************************************************************************/

/** Everything the parser carries from one line to the next.  Restoring a
    parser from an exported state gives exactly the output the original
    parser would have given for the following lines.
*/

struct ParserState {
    std::string delimiter = ";";
    std::string pending;          ///< unterminated statement text
    bool inString = false;
    char activeQuote = 0;         ///< ', " or ` when inString
    bool escapePending = false;   ///< line ended on a backslash in a string
    uint64_t pendingLines = 0;    ///< lines that contributed to pending
};


/*****************************************************************************/
/* PARSE RESULT                                                              */
/*****************************************************************************/

struct ParseResult {
    /// Statements completed on this line, in order
    std::vector<ParsedStatement> statements;

    /// A DELIMITER directive changed the delimiter
    bool delimiterChanged = false;

    /// Blank or comment line, skipped without scanning
    bool skipped = false;

    /// Statement too large, or malformed DELIMITER directive
    std::string error;

    /// Text pending from earlier lines that went into the first statement
    /// completed on this line; empty if there was none
    std::string carriedOver;

    bool hasError() const { return !error.empty(); }
};


/*****************************************************************************/
/* STATEMENT PARSER                                                          */
/*****************************************************************************/

struct StatementParserOptions {
    uint64_t maxStatementLines = 10000;
    uint64_t maxStatementBytes = 10 * 1024 * 1024;

    /// More prefixes of lines to skip between statements, such as "/*!"
    /// for MySQL version comments
    std::vector<std::string> commentMarkers;
};

/** Character scanning state machine over the lines of a dump.

    Outside of a string the parser is in NORMAL state; a ', " or ` opens a
    string that is closed by the same character.  Inside ' and " strings a
    backslash escapes the next character, even across a line end.  The
    delimiter only ends a statement in NORMAL state.

    Blank lines and lines starting with # or "-- " are skipped without
    scanning when no statement is in progress, as are lines starting with
    one of the extra comment markers.  A DELIMITER directive is only
    recognized there too; inside a string or a statement both are
    ordinary text.
*/

struct StatementParser {

    StatementParser(StatementParserOptions options = StatementParserOptions());

    /** Feed one line (with its terminator).  Each statement completed on
        this line records the number of the line it started on, counting
        back from lineNumber.
    */
    ParseResult parseLine(const std::string & line, uint64_t lineNumber = 0);

    /** Text accumulated but not yet terminated, trimmed; empty optional if
        none.
    */
    std::optional<std::string> getPendingStatement() const;

    /** Remove and return the pending statement, without a trailing
        delimiter.  Used at the end of the file.
    */
    std::optional<std::string> takePendingStatement();

    bool hasPendingStatement() const { return !state.pending.empty(); }
    bool isInString() const { return state.inString; }
    char getActiveQuote() const { return state.activeQuote; }
    const std::string & getDelimiter() const { return state.delimiter; }

    const ParserState & exportState() const { return state; }
    void restoreState(ParserState newState);

    /** Back to the initial state with the default delimiter. */
    void reset();

    const StatementParserOptions & options() const { return options_; }

private:
    /** Append line[start, end) to the pending text. */
    void appendPending(const std::string & line, size_t start, size_t end);

    StatementParserOptions options_;
    ParserState state;
    bool pendingHasText = false;
};

} // namespace STAGGER
