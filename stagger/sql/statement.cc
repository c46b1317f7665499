/* statement.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Classification of SQL statements.
*/

#include "statement.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/regex.hpp>
#include <ctype.h>
#include <string.h>


using namespace std;


namespace STAGGER {

namespace {

bool isSpace(char c)
{
    return isspace((unsigned char)c);
}

bool isWordChar(char c)
{
    return isalnum((unsigned char)c) || c == '_' || c == '$';
}

/** Is there a keyword (case insensitive, upper case argument) at pos of
    the text, delimited by non-word characters?
*/
bool keywordAt(const std::string & upper, size_t pos, const char * keyword)
{
    size_t len = strlen(keyword);
    if (upper.compare(pos, len, keyword) != 0)
        return false;
    if (pos > 0 && isWordChar(upper[pos - 1]))
        return false;
    if (pos + len < upper.size() && isWordChar(upper[pos + len]))
        return false;
    return true;
}

/** Position of the VALUES keyword as a whole word outside of any quoted
    identifier, or npos.
*/
size_t findValuesKeyword(const std::string & upper)
{
    char quote = 0;
    for (size_t i = 0;  i < upper.size();  ++i) {
        char c = upper[i];
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '`' || c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (c == 'V' && keywordAt(upper, i, "VALUES"))
            return i;
    }
    return string::npos;
}

/** Skip the INSERT keyword, and IGNORE if present.  Returns the position
    after them; sets ignore.
*/
size_t skipInsertKeywords(const std::string & upper, bool & ignore)
{
    size_t pos = 6;  // "INSERT"
    while (pos < upper.size() && isSpace(upper[pos]))
        ++pos;
    ignore = keywordAt(upper, pos, "IGNORE");
    if (ignore) {
        pos += 6;
        while (pos < upper.size() && isSpace(upper[pos]))
            ++pos;
    }
    return pos;
}

/** Does a "--" comment start at position i?  MySQL requires whitespace
    (or the end of the text) after the two dashes.
*/
bool dashCommentAt(const std::string & text, size_t i)
{
    return text[i] == '-'
        && i + 1 < text.size() && text[i + 1] == '-'
        && (i + 2 == text.size() || isSpace(text[i + 2]));
}

/** Scan text outside of quotes, calling onComment with the position and
    kind ('#' for a line comment, '*' for a block comment) of each comment.
    Comments are skipped over; stops early when onComment returns false.
*/
template<typename OnComment>
void scanComments(const std::string & text, OnComment onComment)
{
    char quote = 0;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        char c = text[i];

        if (quote) {
            if (c == '\\' && quote != '`')
                ++i;
            else if (c == quote)
                quote = 0;
            ++i;
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            ++i;
            continue;
        }

        if (c == '#' || dashCommentAt(text, i)) {
            if (!onComment(i, '#'))
                return;
            i = text.find('\n', i);
            if (i == string::npos)
                return;
            continue;
        }

        if (c == '/' && i + 1 < n && text[i + 1] == '*') {
            if (!onComment(i, '*'))
                return;
            i = text.find("*/", i + 2);
            if (i == string::npos)
                return;
            i += 2;
            continue;
        }

        ++i;
    }
}

bool startsWithInsert(const std::string & text)
{
    return text.size() > 6
        && boost::algorithm::istarts_with(text, "INSERT")
        && isSpace(text[6]);
}

} // file scope

size_t findComment(const std::string & text)
{
    size_t result = string::npos;
    scanComments(text, [&] (size_t pos, char kind)
                 {
                     result = pos;
                     return false;
                 });
    return result;
}

bool endsInLineComment(const std::string & text)
{
    size_t lastLineComment = string::npos;
    scanComments(text, [&] (size_t pos, char kind)
                 {
                     if (kind == '#')
                         lastLineComment = pos;
                     return true;
                 });
    return lastLineComment != string::npos
        && text.find('\n', lastLineComment) == string::npos;
}

const char * kindName(StatementKind kind)
{
    switch (kind) {
    case StatementKind::INSERT:          return "INSERT";
    case StatementKind::INSERT_IGNORE:   return "INSERT_IGNORE";
    case StatementKind::EXTENDED_INSERT: return "EXTENDED_INSERT";
    case StatementKind::OTHER:           return "OTHER";
    }
    return "OTHER";
}

bool hasMultipleValueTuples(const std::string & text)
{
    std::string upper = boost::algorithm::to_upper_copy(text);
    size_t start = findValuesKeyword(upper);
    if (start == string::npos)
        start = 0;

    for (size_t i = text.find(')', start);  i != string::npos;
         i = text.find(')', i + 1)) {
        size_t j = i + 1;
        while (j < text.size() && isSpace(text[j]))
            ++j;
        if (j == text.size() || text[j] != ',')
            continue;
        ++j;
        while (j < text.size() && isSpace(text[j]))
            ++j;
        if (j < text.size() && text[j] == '(')
            return true;
    }

    return false;
}

ParsedStatement classifyStatement(std::string text, uint64_t line)
{
    ParsedStatement result;
    result.line = line;

    if (startsWithInsert(text)) {
        std::string upper = boost::algorithm::to_upper_copy(text.substr(0, 64));
        skipInsertKeywords(upper, result.ignore);

        if (hasMultipleValueTuples(text))
            result.kind = StatementKind::EXTENDED_INSERT;
        else if (result.ignore)
            result.kind = StatementKind::INSERT_IGNORE;
        else result.kind = StatementKind::INSERT;
    }

    result.text = std::move(text);
    return result;
}

std::optional<InsertParts> splitSimpleInsert(const std::string & text)
{
    if (!startsWithInsert(text))
        return std::nullopt;

    std::string upper = boost::algorithm::to_upper_copy(text);

    if (upper.find("ON DUPLICATE") != string::npos
        || upper.find(" SELECT ") != string::npos)
        return std::nullopt;

    if (findComment(text) != string::npos)
        return std::nullopt;

    size_t valuesPos = findValuesKeyword(upper);
    if (valuesPos == string::npos)
        return std::nullopt;

    size_t openParen = text.find('(', valuesPos);
    if (openParen == string::npos)
        return std::nullopt;

    // Only whitespace may separate VALUES from its tuple
    for (size_t i = valuesPos + 6;  i < openParen;  ++i) {
        if (!isSpace(text[i]))
            return std::nullopt;
    }

    InsertParts result;
    result.prefix
        = boost::algorithm::trim_right_copy(text.substr(0, valuesPos))
        + " VALUES";

    size_t pos = skipInsertKeywords(upper, result.ignore);
    if (keywordAt(upper, pos, "INTO")) {
        pos += 4;
        while (pos < upper.size() && isSpace(upper[pos]))
            ++pos;
    }

    size_t tableEnd = pos;
    while (tableEnd < valuesPos
           && (isWordChar(text[tableEnd]) || text[tableEnd] == '`'
               || text[tableEnd] == '.'))
        ++tableEnd;
    if (tableEnd == pos)
        return std::nullopt;
    result.table = boost::algorithm::to_lower_copy(text.substr(pos, tableEnd - pos));

    result.values = boost::algorithm::trim_right_copy_if
        (text.substr(openParen), boost::algorithm::is_any_of(" \t\n\r;"));

    if (result.values.size() < 2
        || result.values.front() != '('
        || result.values.back() != ')')
        return std::nullopt;

    return result;
}

bool looksLikeStatement(const std::string & text)
{
    static const boost::regex keywords
        ("\\A\\s*(INSERT|UPDATE|DELETE|CREATE|ALTER|DROP|SET|LOCK|UNLOCK|START"
         "|COMMIT|ROLLBACK|REPLACE|TRUNCATE|USE|GRANT|REVOKE|SHOW|DESCRIBE"
         "|EXPLAIN|CALL|DELIMITER|/\\*|--)",
         boost::regex::perl | boost::regex::icase);
    return boost::regex_search(text, keywords);
}

} // namespace STAGGER
