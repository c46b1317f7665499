/* statement.h                                                     -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   A complete SQL statement as produced by the statement parser, and the
   textual classification of INSERT statements used by the batcher.
*/

#pragma once

#include <optional>
#include <string>
#include <stdint.h>

namespace STAGGER {


/*****************************************************************************/
/* STATEMENT KIND                                                            */
/*****************************************************************************/

enum class StatementKind {
    INSERT,            ///< INSERT with a single value tuple
    INSERT_IGNORE,     ///< INSERT IGNORE with a single value tuple
    EXTENDED_INSERT,   ///< INSERT [IGNORE] with two or more value tuples
    OTHER              ///< anything else
};

const char * kindName(StatementKind kind);


/*****************************************************************************/
/* PARSED STATEMENT                                                          */
/*****************************************************************************/

struct ParsedStatement {
    std::string text;                        ///< trimmed, without delimiter
    StatementKind kind = StatementKind::OTHER;
    bool ignore = false;                     ///< INSERT IGNORE (any kind)
    uint64_t line = 0;                       ///< 1-based line it started on

    bool isInsert() const { return kind != StatementKind::OTHER; }
    bool isInsertIgnore() const { return isInsert() && ignore; }
    bool isExtendedInsert() const
    {
        return kind == StatementKind::EXTENDED_INSERT;
    }
};

/** Classify the given statement text.  The text is stored as given. */
ParsedStatement classifyStatement(std::string text, uint64_t line = 0);


/*****************************************************************************/
/* INSERT PARTS                                                              */
/*****************************************************************************/

/** A single-row INSERT split into the part that can be shared between
    rows and the row's value tuple.
*/
struct InsertParts {
    std::string prefix;   ///< "INSERT [IGNORE] INTO <target> [(cols)] VALUES"
    std::string values;   ///< "(...)", without trailing delimiter
    std::string table;    ///< target table, lower case, quotes kept
    bool ignore = false;
};

/** Split an INSERT statement into prefix and value tuple.  Returns an
    empty optional for anything that cannot be split with confidence:
    ON DUPLICATE KEY UPDATE, INSERT ... SELECT, INSERT ... SET, a value
    part that is not bracketed, or a comment outside of a string (a line
    comment would swallow the tuples joined after it).
*/
std::optional<InsertParts> splitSimpleInsert(const std::string & text);

/** Position of the first comment ("#", "-- " or a block comment) that is
    not inside a quoted string or identifier, or npos.
*/
size_t findComment(const std::string & text);

/** Does the last line of the text end inside a "#" or "-- " comment, so
    that anything appended to it would be commented out?
*/
bool endsInLineComment(const std::string & text);

/** Does the text after VALUES contain the sequence ")" "," "(" (with
    optional whitespace)?  This is textual: string data that contains the
    sequence also matches, which only costs a batching opportunity.
*/
bool hasMultipleValueTuples(const std::string & text);

/** Does the text start with a SQL keyword or a comment opener?  Used to
    decide whether leftover text is worth executing or restoring.
*/
bool looksLikeStatement(const std::string & text);

} // namespace STAGGER
