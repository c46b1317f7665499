/* statement_executor.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Statement executors and execution errors.
*/

#include "statement_executor.h"
#include "import_session.h"
#include "stagger/sql/statement.h"
#include "stagger/vfs/compressor.h"
#include "stagger/utils/log.h"
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("executor");
    return result;
}

std::string describeError(const std::string & statement, uint64_t line,
                          const std::string & databaseError)
{
    ImportError error;
    error.statement = statement;
    error.line = line;
    error.databaseError = databaseError;
    return error.format();
}

} // file scope


/*****************************************************************************/
/* STATEMENT EXECUTION ERROR                                                 */
/*****************************************************************************/

bool isTargetExistsError(const std::string & databaseError, int errorCode,
                         std::string & table)
{
    static const boost::regex tableExists
        ("Table\\s+['\"`]([^'\"`]+)['\"`]\\s+already\\s+exists",
         boost::regex::icase);

    boost::smatch match;
    bool matched = boost::regex_search(databaseError, match, tableExists);
    if (matched)
        table = match[1].str();

    return matched || errorCode == ER_TABLE_EXISTS_ERROR;
}

StatementExecutionError::
StatementExecutionError(std::string statement,
                        uint64_t line,
                        std::string databaseError,
                        int errorCode)
    : Exception(describeError(statement, line, databaseError)),
      statement(std::move(statement)),
      line(line),
      databaseError(std::move(databaseError)),
      errorCode(errorCode),
      targetExists(false)
{
    targetExists = isTargetExistsError(this->databaseError, errorCode,
                                       targetTable);
}

StatementExecutionError::
StatementExecutionError(const ImportError & error)
    : Exception(error.format()),
      statement(error.statement),
      line(error.line),
      databaseError(error.databaseError),
      errorCode(error.errorCode),
      targetExists(error.targetExists),
      targetTable(error.targetTable)
{
}


/*****************************************************************************/
/* SQL FILE WRITER                                                           */
/*****************************************************************************/

SqlFileWriter::
SqlFileWriter(const std::string & filename, bool overwrite)
    : filename_(filename)
{
    compression_ = Compressor::filenameToCompression(filename);
    if (compression_.empty())
        compression_ = "none";
    compressor_ = Compressor::create(compression_);

    int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    if (!overwrite)
        flags |= O_EXCL;

    fd_ = ::open(filename.c_str(), flags, 0644);
    if (fd_ == -1) {
        if (errno == EEXIST)
            throw Exception("output file " + filename + " already exists; "
                            "use --force to overwrite it");
        throw Exception(errno, "opening output file " + filename,
                        "SqlFileWriter");
    }

    DEBUG_MSG(logger()) << "writing " << filename << " with compression "
                        << compression_;
}

SqlFileWriter::
~SqlFileWriter()
{
    closeFd();
}

void
SqlFileWriter::
closeFd()
{
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

size_t
SqlFileWriter::
write(const char * data, size_t len)
{
    size_t done = 0;
    while (done < len) {
        ssize_t res = ::write(fd_, data + done, len - done);
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw Exception(errno, "writing to " + filename_, "write");
        }
        done += res;
    }
    bytesWritten_ += len;
    return len;
}

ExecutionResult
SqlFileWriter::
execute(const std::string & statement)
{
    if (fd_ == -1)
        throw Exception("output file " + filename_ + " is already closed");

    std::string text = boost::algorithm::trim_copy(statement);
    if (text.empty())
        return ExecutionResult();
    // A trailing line comment would swallow the delimiter
    if (endsInLineComment(text))
        text += "\n;";
    else if (text.back() != ';')
        text += ';';
    text += '\n';

    auto onData = [&] (const char * data, size_t len)
        {
            return write(data, len);
        };
    compressor_->compress(text.data(), text.size(), onData);

    ++statementsWritten_;
    return ExecutionResult();
}

void
SqlFileWriter::
finish()
{
    if (fd_ == -1)
        return;

    auto onData = [&] (const char * data, size_t len)
        {
            return write(data, len);
        };
    compressor_->finish(onData);

    if (::fsync(fd_) == -1 && errno != EINVAL)
        throw Exception(errno, "syncing " + filename_, "finish");

    if (::close(fd_) == -1) {
        fd_ = -1;
        throw Exception(errno, "closing " + filename_, "finish");
    }
    fd_ = -1;
}

void
SqlFileWriter::
abandon()
{
    closeFd();
    if (::unlink(filename_.c_str()) == -1 && errno != ENOENT) {
        WARNING_MSG(logger()) << "could not remove partial output "
                              << filename_ << ": " << strerror(errno);
    }
}

} // namespace STAGGER
