/* statement_parser.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Assembles complete SQL statements from the lines of a dump file.
*/

#include "statement_parser.h"
#include "stagger/arch/format.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <ctype.h>


using namespace std;


namespace STAGGER {

namespace {

bool isSpace(char c)
{
    return isspace((unsigned char)c);
}

bool allSpace(const std::string & str, size_t start, size_t end)
{
    return std::all_of(str.begin() + start, str.begin() + end, isSpace);
}

/** Convert CRLF and lone CR line endings to LF. */
std::string normalizeLineEndings(const std::string & line)
{
    std::string result;
    result.reserve(line.size());
    for (size_t i = 0;  i < line.size();  ++i) {
        if (line[i] == '\r') {
            result += '\n';
            if (i + 1 < line.size() && line[i + 1] == '\n')
                ++i;
        }
        else result += line[i];
    }
    return result;
}

/** Does a "--" comment start at position i?  MySQL requires whitespace
    (or the end of the line) after the two dashes.
*/
bool dashCommentAt(const std::string & line, size_t i)
{
    return line[i] == '-'
        && i + 1 < line.size() && line[i + 1] == '-'
        && (i + 2 == line.size() || isSpace(line[i + 2]));
}

} // file scope

StatementParser::
StatementParser(StatementParserOptions options)
    : options_(std::move(options))
{
}

void
StatementParser::
appendPending(const std::string & line, size_t start, size_t end)
{
    if (start >= end)
        return;
    if (!pendingHasText && !allSpace(line, start, end))
        pendingHasText = true;
    state.pending.append(line, start, end - start);
}

ParseResult
StatementParser::
parseLine(const std::string & rawLine, uint64_t lineNumber)
{
    ParseResult result;

    const std::string * linePtr = &rawLine;
    std::string normalized;
    if (rawLine.find('\r') != string::npos) {
        normalized = normalizeLineEndings(rawLine);
        linePtr = &normalized;
    }
    const std::string & line = *linePtr;

    // Fast path for lines between statements
    if (!state.inString && state.pending.empty()) {
        size_t first = 0;
        while (first < line.size() && isSpace(line[first]))
            ++first;

        if (first == line.size() || line[first] == '#'
            || dashCommentAt(line, first)) {
            result.skipped = true;
            return result;
        }

        if (boost::algorithm::istarts_with(line.c_str() + first, "DELIMITER")
            && (first + 9 == line.size() || isSpace(line[first + 9]))) {
            std::string newDelimiter
                = boost::algorithm::trim_copy(line.substr(first + 9));
            if (newDelimiter.empty()) {
                result.error = format("line %llu: DELIMITER directive without "
                                      "a delimiter",
                                      (unsigned long long)lineNumber);
            }
            else {
                state.delimiter = newDelimiter;
                result.delimiterChanged = true;
            }
            return result;
        }

        for (auto & marker: options_.commentMarkers) {
            if (!marker.empty()
                && line.compare(first, marker.size(), marker) == 0) {
                result.skipped = true;
                return result;
            }
        }
    }

    const std::string & delimiter = state.delimiter;
    const size_t carriedLength = state.pending.size();
    bool completedAny = false;
    size_t start = 0;
    size_t i = 0;
    const size_t n = line.size();

    while (i < n) {
        char c = line[i];

        if (state.inString) {
            if (state.escapePending) {
                state.escapePending = false;
            }
            else if (c == '\\' && state.activeQuote != '`') {
                state.escapePending = true;
            }
            else if (c == state.activeQuote) {
                // A doubled quote closes and immediately reopens
                state.inString = false;
                state.activeQuote = 0;
            }
            ++i;
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            state.inString = true;
            state.activeQuote = c;
            ++i;
            continue;
        }

        if (c == '#' || dashCommentAt(line, i)) {
            // Comment to the end of the line; not scanned for quotes or
            // delimiters
            appendPending(line, start, i);
            if (pendingHasText)
                appendPending(line, i, n);
            else {
                state.pending.clear();
            }
            start = i = n;
            break;
        }

        if (c == delimiter[0] && line.compare(i, delimiter.size(), delimiter) == 0) {
            appendPending(line, start, i);
            if (!completedAny && carriedLength > 0)
                result.carriedOver = state.pending.substr(0, carriedLength);
            completedAny = true;
            std::string text = boost::algorithm::trim_copy(state.pending);
            uint64_t startLine = lineNumber > state.pendingLines
                ? lineNumber - state.pendingLines : lineNumber;
            state.pending.clear();
            state.pendingLines = 0;
            pendingHasText = false;
            if (!text.empty())
                result.statements.emplace_back
                    (classifyStatement(std::move(text), startLine));
            i += delimiter.size();
            start = i;
            continue;
        }

        ++i;
    }

    appendPending(line, start, n);

    if (!pendingHasText && !state.inString) {
        state.pending.clear();
        state.pendingLines = 0;
        return result;
    }

    ++state.pendingLines;

    if (state.pendingLines > options_.maxStatementLines) {
        result.error = format("line %llu: statement is longer than %llu lines; "
                              "the dump may contain an unterminated string "
                              "or be missing a delimiter",
                              (unsigned long long)lineNumber,
                              (unsigned long long)options_.maxStatementLines);
    }
    else if (state.pending.size() > options_.maxStatementBytes) {
        result.error = format("line %llu: statement is larger than %llu bytes; "
                              "the dump may contain an unterminated string "
                              "or be missing a delimiter",
                              (unsigned long long)lineNumber,
                              (unsigned long long)options_.maxStatementBytes);
    }

    return result;
}

std::optional<std::string>
StatementParser::
getPendingStatement() const
{
    if (state.pending.empty())
        return std::nullopt;
    std::string result = boost::algorithm::trim_copy(state.pending);
    if (result.empty())
        return std::nullopt;
    return result;
}

std::optional<std::string>
StatementParser::
takePendingStatement()
{
    auto result = getPendingStatement();
    state.pending.clear();
    state.pendingLines = 0;
    pendingHasText = false;

    if (result && boost::algorithm::ends_with(*result, state.delimiter)) {
        result->resize(result->size() - state.delimiter.size());
        boost::algorithm::trim_right(*result);
        if (result->empty())
            return std::nullopt;
    }
    return result;
}

void
StatementParser::
restoreState(ParserState newState)
{
    if (newState.delimiter.empty())
        newState.delimiter = ";";
    if (!newState.inString) {
        newState.activeQuote = 0;
        newState.escapePending = false;
    }
    if (newState.pendingLines == 0 && !newState.pending.empty())
        newState.pendingLines = std::count(newState.pending.begin(),
                                           newState.pending.end(), '\n');
    state = std::move(newState);
    pendingHasText = !state.pending.empty()
        && !allSpace(state.pending, 0, state.pending.size());
}

void
StatementParser::
reset()
{
    state = ParserState();
    pendingHasText = false;
}

} // namespace STAGGER
