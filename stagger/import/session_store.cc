/* session_store.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Session stores.
*/

#include "session_store.h"
#include "stagger/arch/exception.h"
#include "stagger/utils/log.h"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <stdio.h>
#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("session");
    return result;
}

} // file scope


/*****************************************************************************/
/* IN MEMORY SESSION STORE                                                   */
/*****************************************************************************/

std::optional<ImportSession>
InMemorySessionStore::
load(const std::string & filename)
{
    std::unique_lock<std::mutex> guard(mutex);
    auto it = sessions.find(filename);
    if (it == sessions.end())
        return std::nullopt;
    return ImportSession::fromFields(it->second);
}

void
InMemorySessionStore::
save(const ImportSession & session)
{
    std::unique_lock<std::mutex> guard(mutex);
    sessions[session.filename] = session.toFields();
}

void
InMemorySessionStore::
remove(const std::string & filename)
{
    std::unique_lock<std::mutex> guard(mutex);
    sessions.erase(filename);
}

size_t
InMemorySessionStore::
size() const
{
    std::unique_lock<std::mutex> guard(mutex);
    return sessions.size();
}


/*****************************************************************************/
/* JSON FILE SESSION STORE                                                   */
/*****************************************************************************/

JsonFileSessionStore::
JsonFileSessionStore(std::string path)
    : path_(std::move(path))
{
}

Json::Value
JsonFileSessionStore::
readAll() const
{
    struct stat st;
    if (::stat(path_.c_str(), &st) == -1) {
        if (errno == ENOENT)
            return Json::Value(Json::objectValue);
        throw Exception(errno, "stat of session file " + path_, "readAll");
    }

    std::ifstream stream(path_);
    if (!stream)
        throw Exception("cannot open session file " + path_);

    Json::CharReaderBuilder builder;
    Json::Value result;
    std::string errors;
    if (!Json::parseFromStream(builder, stream, &result, &errors))
        throw Exception("session file " + path_ + " is not valid JSON: "
                        + errors);
    if (!result.isObject())
        throw Exception("session file " + path_ + " must hold a JSON object");
    return result;
}

void
JsonFileSessionStore::
writeAll(const Json::Value & sessions) const
{
    std::string tmpPath = path_ + ".tmp";
    {
        std::ofstream stream(tmpPath, std::ios::trunc);
        if (!stream)
            throw Exception(errno, "creating session file " + tmpPath,
                            "writeAll");
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(sessions, &stream);
        stream << "\n";
        stream.flush();
        if (!stream)
            throw Exception("error writing session file " + tmpPath);
    }

    if (::rename(tmpPath.c_str(), path_.c_str()) == -1) {
        int err = errno;
        ::unlink(tmpPath.c_str());
        throw Exception(err, "renaming " + tmpPath + " to " + path_,
                        "writeAll");
    }
}

std::optional<ImportSession>
JsonFileSessionStore::
load(const std::string & filename)
{
    std::unique_lock<std::mutex> guard(mutex);
    Json::Value sessions = readAll();
    if (!sessions.isMember(filename))
        return std::nullopt;
    return ImportSession::fromJson(sessions[filename]);
}

void
JsonFileSessionStore::
save(const ImportSession & session)
{
    std::unique_lock<std::mutex> guard(mutex);
    Json::Value sessions = readAll();
    sessions[session.filename] = session.toJson();
    writeAll(sessions);
    TRACE_MSG(logger()) << "saved session for " << session.filename
                        << " at line " << session.currentLine;
}

void
JsonFileSessionStore::
remove(const std::string & filename)
{
    std::unique_lock<std::mutex> guard(mutex);
    Json::Value sessions = readAll();
    if (!sessions.isMember(filename))
        return;
    sessions.removeMember(filename);
    writeAll(sessions);
}

} // namespace STAGGER
