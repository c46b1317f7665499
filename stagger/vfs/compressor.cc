/* compressor.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Implementation of compressor abstraction.
*/

#include "compressor.h"
#include "stagger/base/exc_assert.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <mutex>
#include <map>


using namespace std;

namespace STAGGER {

namespace {

// Function-local so that codecs registering from other translation units
// during static initialization always find the tables constructed.
struct Registry {
    std::mutex mutex;
    std::map<std::string, std::string> extensions;
    std::map<std::string, Compressor::Info> compressors;
    std::map<std::string, Decompressor::Info> decompressors;
};

Registry & registry()
{
    static Registry result;
    return result;
}

} // file scope


/*****************************************************************************/
/* COMPRESSOR                                                                */
/*****************************************************************************/

Compressor::
~Compressor()
{
}

std::string
Compressor::
filenameToCompression(const std::string & filename)
{
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);

    string::size_type pos = filename.rfind('.');
    if (pos == string::npos || pos == 0)
        return std::string();

    std::string extension(filename, pos + 1);

    while (!extension.empty() && extension[extension.size() - 1] == '~') {
        extension = string(extension, 0, extension.size() - 1);
    }

    boost::algorithm::to_lower(extension);

    auto it = reg.extensions.find(extension);
    if (it != reg.extensions.end())
        return it->second;

    return std::string();
}

std::unique_ptr<Compressor>
Compressor::
create(const std::string & compression,
       int level)
{
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);
    auto it = reg.compressors.find(compression);
    if (it == reg.compressors.end()) {
        throw Exception("unknown compression %s:%d", compression.c_str(),
                        level);
    }
    return std::unique_ptr<Compressor>(it->second.create(level));
}

std::shared_ptr<void>
Compressor::
registerCompressor(const std::string & name,
                   const std::vector<std::string> & compressorExtensions,
                   std::function<Compressor * (int level)> create)
{
    if (!create)
        throw Exception("Attempt to register compressor " + name
                        + " without a create function");

    Info info{ name, compressorExtensions, std::move(create)};
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);
    if (!reg.compressors.emplace(name, info).second) {
        throw Exception("Attempt to double register compressor " + name);
    }

    for (auto & ex: compressorExtensions) {
        reg.extensions.emplace(ex, name);
    }

    return nullptr;
}


/*****************************************************************************/
/* DECOMPRESSOR                                                              */
/*****************************************************************************/

Decompressor::
~Decompressor()
{
}

std::unique_ptr<Decompressor>
Decompressor::
create(const std::string & compression)
{
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);
    auto it = reg.decompressors.find(compression);
    if (it == reg.decompressors.end()) {
        throw Exception("unknown decompressor " + compression);
    }
    return std::unique_ptr<Decompressor>(it->second.create());
}

bool
Decompressor::
isRegistered(const std::string & compression)
{
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);
    return reg.decompressors.count(compression);
}

std::shared_ptr<void>
Decompressor::
registerDecompressor(const std::string & name,
                     const std::vector<std::string> & decompressorExtensions,
                     std::function<Decompressor * ()> create)
{
    if (!create)
        throw Exception("Attempt to register decompressor " + name
                        + " without a create function");

    Info info{ name, decompressorExtensions, std::move(create) };
    Registry & reg = registry();
    std::unique_lock<std::mutex> guard(reg.mutex);
    if (!reg.decompressors.emplace(name, info).second) {
        throw Exception("Attempt to double register decompressor " + name);
    }

    for (auto & ex: decompressorExtensions) {
        reg.extensions.emplace(ex, name);
    }

    return nullptr;
}


/*****************************************************************************/
/* NULL COMPRESSOR                                                           */
/*****************************************************************************/

struct NullCompressor : public Compressor {

    NullCompressor(int level = 0)
    {
    }

    virtual void compress(const char * data, size_t len,
                          const OnData & onData) override
    {
        size_t done = 0;

        while (done < len)
            done += onData(data + done, len - done);

        ExcAssertEqual(done, len);
    }

    virtual void flush(FlushLevel flushLevel, const OnData & onData) override
    {
    }

    virtual void finish(const OnData & onData) override
    {
    }
};

static Compressor::Register<NullCompressor>
registerNoneCompressor("none", {});


/*****************************************************************************/
/* NULL DECOMPRESSOR                                                         */
/*****************************************************************************/

struct NullDecompressor : public Decompressor {

    virtual void decompress(const char * data, size_t len,
                            const OnData & onData) override
    {
        size_t done = 0;

        while (done < len)
            done += onData(data + done, len - done);

        ExcAssertEqual(done, len);
    }

    virtual void finish(const OnData & onData) override
    {
    }
};

static Decompressor::Register<NullDecompressor>
registerNoneDecompressor("none", {});

} // namespace STAGGER
