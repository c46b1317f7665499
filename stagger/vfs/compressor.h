/* compressor.h                                                    -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Interface to compressor and decompressor objects.

   Codecs register themselves by name and by file extension when the
   library that contains them is loaded; a codec whose library was not
   built in is simply absent from the registry.
*/

#pragma once

#include <memory>
#include <functional>
#include <string>
#include <vector>

namespace STAGGER {


/*****************************************************************************/
/* COMPRESSOR                                                                */
/*****************************************************************************/

struct Compressor {

    virtual ~Compressor();

    typedef std::function<size_t (const char * data, size_t len)> OnData;

    /** Flush levels. */
    enum FlushLevel {
        FLUSH_NONE,     ///< No flushing of compressor
        FLUSH_AVAILABLE,///< Flush all data would be available on decompression
        FLUSH_SYNC,     ///< Flush so that we can find our point in the file
        FLUSH_RESTART,  ///< Flush so we could restart the decompression here
    };

    /** Compress the given data block.  This will call onData zero or more
        times with compressed output.
    */
    virtual void compress(const char * data, size_t len,
                          const OnData & onData) = 0;

    /** Flush the stream at the given flush level.  This will call onData
        zero or more times.
    */
    virtual void flush(FlushLevel flushLevel, const OnData & onData) = 0;

    /** Finish the stream... no more data can be written to it afterwards,
        and everything will be put into the compression
    */
    virtual void finish(const OnData & onData) = 0;

    /** Convert a filename to a compression scheme.  Extensions are matched
        case insensitively.  Returns the empty string if it isn't found.
    */
    static std::string filenameToCompression(const std::string & filename);

    /** Create a compressor with the given scheme.  Throws if the given
        compression scheme isn't registered.
    */
    static std::unique_ptr<Compressor>
    create(const std::string & compression, int level = -1);

    /** Describes a compressor. */
    struct Info {
        std::string name;
        std::vector<std::string> extensions;
        std::function<Compressor * (int level)> create;
    };

    /** Register a compressor.  Throws if the name is already used or the
        create function is null.
    */
    static std::shared_ptr<void>
    registerCompressor(const std::string & name,
                       const std::vector<std::string> & extensions,
                       std::function<Compressor * (int level)> create);

    template<typename T>
    struct Register {
        Register(std::string name,
                 std::vector<std::string> extensions)
        {
            auto create = [] (int level) { return new T(level); };
            handle = registerCompressor(std::move(name),
                                        std::move(extensions),
                                        std::move(create));
        }

        std::shared_ptr<void> handle;
    };
};


/*****************************************************************************/
/* DECOMPRESSOR                                                              */
/*****************************************************************************/

struct Decompressor {

    virtual ~Decompressor();

    typedef std::function<size_t (const char * data, size_t len)> OnData;

    /** Decompress the given data block.  This will call onData zero or
        more times with decompressed output.  Throws on corrupt input.
    */
    virtual void decompress(const char * data, size_t len,
                            const OnData & onData) = 0;

    /** Finish decompressing the stream... no more data can be read from
        it afterwards.  Throws if the stream was truncated.
    */
    virtual void finish(const OnData & onData) = 0;

    /** Create a decompressor with the given scheme.  Throws if the given
        compression scheme isn't registered.
    */
    static std::unique_ptr<Decompressor>
    create(const std::string & compression);

    /** Is there a decompressor registered under the given name? */
    static bool isRegistered(const std::string & compression);

    /** Describes a decompressor. */
    struct Info {
        std::string name;
        std::vector<std::string> extensions;
        std::function<Decompressor * ()> create;
    };

    /** Register a decompressor.  Throws if the name is already used or the
        create function is null.
    */
    static std::shared_ptr<void>
    registerDecompressor(const std::string & name,
                         const std::vector<std::string> & extensions,
                         std::function<Decompressor * ()> create);

    template<typename T>
    struct Register {
        Register(std::string name,
                 std::vector<std::string> extensions)
        {
            auto create = [] () { return new T(); };
            handle = registerDecompressor(std::move(name),
                                          std::move(extensions),
                                          std::move(create));
        }

        std::shared_ptr<void> handle;
    };
};

} // namespace STAGGER
