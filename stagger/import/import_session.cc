/* import_session.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Import session state and its serialized forms.
*/

#include "import_session.h"
#include "stagger/arch/exception.h"
#include "stagger/arch/format.h"
#include <boost/lexical_cast.hpp>
#include <json/json.h>
#include <algorithm>


using namespace std;


namespace STAGGER {

namespace {

constexpr size_t MAX_STATEMENT_DISPLAY = 500;

std::string truncateStatement(const std::string & statement)
{
    if (statement.size() <= MAX_STATEMENT_DISPLAY)
        return statement;
    return statement.substr(0, MAX_STATEMENT_DISPLAY) + "...";
}

template<typename T>
T getField(const ImportSession::Fields & fields,
           const std::string & key, T defaultValue)
{
    auto it = fields.find(key);
    if (it == fields.end() || it->second.empty())
        return defaultValue;
    T result;
    if (!boost::conversion::try_lexical_convert(it->second, result))
        throw Exception("session field '" + key + "' has invalid value '"
                        + it->second + "'");
    return result;
}

std::string getString(const ImportSession::Fields & fields,
                      const std::string & key,
                      const std::string & defaultValue = "")
{
    auto it = fields.find(key);
    if (it == fields.end())
        return defaultValue;
    return it->second;
}

bool getFlag(const ImportSession::Fields & fields, const std::string & key)
{
    return getString(fields, key) == "1";
}

std::string flag(bool value)
{
    return value ? "1" : "0";
}

std::string quoteString(char quote)
{
    return quote ? std::string(1, quote) : std::string();
}

Json::Value parseJson(const std::string & text, const std::string & what)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value result;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(),
                       &result, &errors))
        throw Exception("invalid JSON in session field '" + what + "': "
                        + errors);
    return result;
}

std::string writeJson(const Json::Value & value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // file scope


/*****************************************************************************/
/* IMPORT STATUS                                                             */
/*****************************************************************************/

std::string statusName(ImportStatus status)
{
    switch (status) {
    case ImportStatus::NOT_STARTED: return "not_started";
    case ImportStatus::RUNNING:     return "running";
    case ImportStatus::FINISHED:    return "finished";
    case ImportStatus::ERROR:       return "error";
    case ImportStatus::STOPPED:     return "stopped";
    }
    STAGGER_THROW_LOGIC_ERROR("unknown import status");
}

ImportStatus parseImportStatus(const std::string & name)
{
    if (name == "not_started") return ImportStatus::NOT_STARTED;
    if (name == "running")     return ImportStatus::RUNNING;
    if (name == "finished")    return ImportStatus::FINISHED;
    if (name == "error")       return ImportStatus::ERROR;
    if (name == "stopped")     return ImportStatus::STOPPED;
    throw Exception("unknown import status '" + name + "'");
}


/*****************************************************************************/
/* IMPORT ERROR                                                              */
/*****************************************************************************/

std::string errorKindName(ImportErrorKind kind)
{
    switch (kind) {
    case ImportErrorKind::EXECUTION: return "execution";
    case ImportErrorKind::PARSE:     return "parse";
    case ImportErrorKind::IO:        return "io";
    }
    STAGGER_THROW_LOGIC_ERROR("unknown error kind");
}

ImportErrorKind parseErrorKind(const std::string & name)
{
    if (name == "execution") return ImportErrorKind::EXECUTION;
    if (name == "parse")     return ImportErrorKind::PARSE;
    if (name == "io")        return ImportErrorKind::IO;
    throw Exception("unknown import error kind '" + name + "'");
}

std::string
ImportError::
format() const
{
    if (kind != ImportErrorKind::EXECUTION)
        return message;

    return STAGGER::format("SQL Error at line %llu:\nQuery: %s\n"
                           "Database Error: %s",
                           (unsigned long long)line,
                           truncateStatement(statement).c_str(),
                           databaseError.c_str());
}

Json::Value
ImportError::
toJson() const
{
    Json::Value result;
    result["kind"] = errorKindName(kind);
    result["message"] = message;
    result["statement"] = statement;
    result["line"] = Json::UInt64(line);
    result["database_error"] = databaseError;
    result["error_code"] = errorCode;
    result["target_exists"] = targetExists;
    result["target_table"] = targetTable;
    return result;
}

ImportError
ImportError::
fromJson(const Json::Value & value)
{
    ImportError result;
    result.kind = parseErrorKind(value.get("kind", "execution").asString());
    result.message = value.get("message", "").asString();
    result.statement = value.get("statement", "").asString();
    result.line = value.get("line", Json::Value(Json::UInt64(0))).asUInt64();
    result.databaseError = value.get("database_error", "").asString();
    result.errorCode = value.get("error_code", 0).asInt();
    result.targetExists = value.get("target_exists", false).asBool();
    result.targetTable = value.get("target_table", "").asString();
    return result;
}


/*****************************************************************************/
/* IMPORT SESSION                                                            */
/*****************************************************************************/

ImportSession::
ImportSession(const std::string & filename)
    : filename(filename),
      codec(codecForFilename(filename))
{
}

double
ImportSession::
percentDone() const
{
    if (fileSize == 0 || codec != Codec::NONE)
        return 0.0;
    return std::min(100.0, 100.0 * currentOffset / fileSize);
}

ImportSession::Fields
ImportSession::
toFields() const
{
    Fields result;
    result["filename"] = filename;
    result["current_line"] = std::to_string(currentLine);
    result["current_offset"] = std::to_string(currentOffset);
    result["line_statements_done"] = std::to_string(lineStatementsDone);
    result["total_statements"] = std::to_string(totalStatementsExecuted);
    result["file_size"] = std::to_string(fileSize);
    result["codec"] = codecName(codec);
    result["delimiter"] = parser.delimiter;
    result["pending_statement"] = parser.pending;
    result["pending_lines"] = std::to_string(parser.pendingLines);
    result["in_string"] = flag(parser.inString);
    result["active_quote"] = quoteString(parser.activeQuote);
    result["escape_pending"] = flag(parser.escapePending);
    result["row_sample_count"] = std::to_string(rowSample.count);
    result["row_sample_bytes"] = std::to_string(rowSample.totalBytes);
    result["status"] = statusName(status);
    if (error)
        result["error"] = writeJson(error->toJson());
    result["invocations"] = std::to_string(invocations);
    result["batch_size"] = std::to_string(batchSize);
    result["memory_usage"] = std::to_string(memoryUsage);
    result["memory_percentage"] = boost::lexical_cast<std::string>(memoryPercentage);
    result["speed_lps"] = boost::lexical_cast<std::string>(speedLps);
    result["auto_tune_adjustment"] = autoTuneAdjustment;
    if (fileAnalysis)
        result["file_analysis"] = writeJson(fileAnalysis->toJson());
    return result;
}

ImportSession
ImportSession::
fromFields(const Fields & fields)
{
    ImportSession result;
    result.filename = getString(fields, "filename");
    if (result.filename.empty())
        throw Exception("session has no filename");

    result.currentLine = getField<uint64_t>(fields, "current_line", 0);
    result.currentOffset = getField<uint64_t>(fields, "current_offset", 0);
    result.lineStatementsDone
        = getField<uint64_t>(fields, "line_statements_done", 0);
    result.totalStatementsExecuted
        = getField<uint64_t>(fields, "total_statements", 0);
    result.fileSize = getField<uint64_t>(fields, "file_size", 0);

    std::string codec = getString(fields, "codec");
    result.codec = codec.empty()
        ? codecForFilename(result.filename) : parseCodecName(codec);

    result.parser.delimiter = getString(fields, "delimiter", ";");
    if (result.parser.delimiter.empty())
        result.parser.delimiter = ";";
    result.parser.pending = getString(fields, "pending_statement");
    result.parser.pendingLines = getField<uint64_t>(fields, "pending_lines", 0);
    result.parser.inString = getFlag(fields, "in_string");
    std::string quote = getString(fields, "active_quote");
    result.parser.activeQuote = quote.empty() ? 0 : quote[0];
    result.parser.escapePending = getFlag(fields, "escape_pending");
    if (result.parser.inString && result.parser.activeQuote == 0)
        throw Exception("session for " + result.filename
                        + " is inside a string but has no quote character");

    result.rowSample.count = getField<uint64_t>(fields, "row_sample_count", 0);
    result.rowSample.totalBytes
        = getField<uint64_t>(fields, "row_sample_bytes", 0);

    result.status = parseImportStatus(getString(fields, "status", "not_started"));
    std::string error = getString(fields, "error");
    if (!error.empty())
        result.error = ImportError::fromJson(parseJson(error, "error"));

    result.invocations = getField<uint64_t>(fields, "invocations", 0);
    result.batchSize = getField<uint64_t>(fields, "batch_size", 0);
    result.memoryUsage = getField<uint64_t>(fields, "memory_usage", 0);
    result.memoryPercentage = getField<double>(fields, "memory_percentage", 0.0);
    result.speedLps = getField<double>(fields, "speed_lps", 0.0);
    result.autoTuneAdjustment = getString(fields, "auto_tune_adjustment");

    std::string analysis = getString(fields, "file_analysis");
    if (!analysis.empty())
        result.fileAnalysis = FileAnalysisResult::fromJson
            (parseJson(analysis, "file_analysis"));

    return result;
}

Json::Value
ImportSession::
toJson() const
{
    Json::Value result(Json::objectValue);
    for (auto & field: toFields())
        result[field.first] = field.second;
    return result;
}

ImportSession
ImportSession::
fromJson(const Json::Value & value)
{
    if (!value.isObject())
        throw Exception("import session must be a JSON object");
    Fields fields;
    for (auto it = value.begin();  it != value.end();  ++it)
        fields[it.name()] = it->asString();
    return fromFields(fields);
}

} // namespace STAGGER
