/* statement_executor.h                                            -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Where the statements of an import end up: a database connection, or a
   file for the command line optimizer.
*/

#pragma once

#include "stagger/arch/exception.h"
#include <memory>
#include <string>
#include <stdint.h>

namespace STAGGER {

struct Compressor;
struct ImportError;


/*****************************************************************************/
/* EXECUTION RESULT                                                          */
/*****************************************************************************/

struct ExecutionResult {
    bool success = true;
    uint64_t rowsAffected = 0;
    std::string error;
    int errorCode = 0;

    static ExecutionResult failure(std::string error, int errorCode = 0)
    {
        ExecutionResult result;
        result.success = false;
        result.error = std::move(error);
        result.errorCode = errorCode;
        return result;
    }
};


/*****************************************************************************/
/* STATEMENT EXECUTOR                                                        */
/*****************************************************************************/

struct StatementExecutor {
    virtual ~StatementExecutor() {}

    /** Execute one complete statement.  A statement the database rejects
        is reported in the result; exceptions are reserved for failures of
        the executor itself.
    */
    virtual ExecutionResult execute(const std::string & statement) = 0;
};


/*****************************************************************************/
/* STATEMENT EXECUTION ERROR                                                 */
/*****************************************************************************/

/** MySQL's error code for CREATE TABLE on an existing table. */
constexpr int ER_TABLE_EXISTS_ERROR = 1050;

/** If the error says the target table already exists, return true and put
    the name of the table into table.
*/
bool isTargetExistsError(const std::string & databaseError, int errorCode,
                         std::string & table);

struct StatementExecutionError: public Exception {
    StatementExecutionError(std::string statement,
                            uint64_t line,
                            std::string databaseError,
                            int errorCode = 0);

    /** Rebuild from the error recorded on a session. */
    explicit StatementExecutionError(const ImportError & error);

    std::string statement;
    uint64_t line;
    std::string databaseError;
    int errorCode;
    bool targetExists;
    std::string targetTable;
};


/*****************************************************************************/
/* SQL FILE WRITER                                                           */
/*****************************************************************************/

/** Executor that writes each statement, terminated by a semicolon and a
    newline, to a file.  The compression comes from the extension of the
    filename.
*/

struct SqlFileWriter: public StatementExecutor {
    SqlFileWriter(const std::string & filename, bool overwrite = false);
    ~SqlFileWriter();

    virtual ExecutionResult execute(const std::string & statement) override;

    /** Flush the compressor and close the file. */
    void finish();

    /** Close and delete the partial output. */
    void abandon();

    const std::string & filename() const { return filename_; }
    const std::string & compression() const { return compression_; }
    uint64_t statementsWritten() const { return statementsWritten_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

private:
    size_t write(const char * data, size_t len);
    void closeFd();

    std::string filename_;
    std::string compression_;
    std::unique_ptr<Compressor> compressor_;
    int fd_ = -1;
    uint64_t statementsWritten_ = 0;
    uint64_t bytesWritten_ = 0;
};

} // namespace STAGGER
