/* session_store.h                                                 -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Persistence of import sessions between invocations.
*/

#pragma once

#include "stagger/import/import_session.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace STAGGER {


/*****************************************************************************/
/* SESSION STORE                                                             */
/*****************************************************************************/

/** Stores the flat field set of an import session keyed by its filename. */

struct SessionStore {
    virtual ~SessionStore() {}

    virtual std::optional<ImportSession> load(const std::string & filename) = 0;
    virtual void save(const ImportSession & session) = 0;
    virtual void remove(const std::string & filename) = 0;
};


/*****************************************************************************/
/* IN MEMORY SESSION STORE                                                   */
/*****************************************************************************/

struct InMemorySessionStore: public SessionStore {
    virtual std::optional<ImportSession> load(const std::string & filename) override;
    virtual void save(const ImportSession & session) override;
    virtual void remove(const std::string & filename) override;

    size_t size() const;

private:
    mutable std::mutex mutex;
    std::map<std::string, ImportSession::Fields> sessions;
};


/*****************************************************************************/
/* JSON FILE SESSION STORE                                                   */
/*****************************************************************************/

/** Keeps every session in one JSON file, an object keyed by filename.  The
    file is replaced atomically on each save so that a crash leaves either
    the old or the new contents.
*/

struct JsonFileSessionStore: public SessionStore {
    JsonFileSessionStore(std::string path);

    virtual std::optional<ImportSession> load(const std::string & filename) override;
    virtual void save(const ImportSession & session) override;
    virtual void remove(const std::string & filename) override;

    const std::string & path() const { return path_; }

private:
    Json::Value readAll() const;
    void writeAll(const Json::Value & sessions) const;

    std::string path_;
    std::mutex mutex;
};

} // namespace STAGGER
