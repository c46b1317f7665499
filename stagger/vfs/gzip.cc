/* gzip.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Implementation of the gzip compression format on top of zlib.
*/

#include "compressor.h"
#include <zlib.h>
#include "stagger/base/exc_assert.h"
#include <vector>


using namespace std;


namespace STAGGER {

/*****************************************************************************/
/* ZLIB STREAM COMMON                                                        */
/*****************************************************************************/

struct ZlibStreamCommon: public z_stream {

    typedef Compressor::OnData OnData;
    typedef Compressor::FlushLevel FlushLevel;

    ZlibStreamCommon()
        : output(131072)
    {
        zalloc = nullptr;
        zfree = nullptr;
        opaque = nullptr;
        next_in = nullptr;
        avail_in = 0;
    }

    int (*process) (z_streamp stream, int flush) = nullptr;

    std::vector<char> output;

    /** Run the available input through the stream.  Returns Z_STREAM_END
        if the end of a stream was reached (there may be input left over),
        or Z_OK otherwise.
    */
    int pump(const char * data, size_t len, const OnData & onData,
             int flushLevel)
    {
        if (data) {
            next_in = (Bytef *)data;
            avail_in = len;
        }

        do {
            next_out = (Bytef *)output.data();
            avail_out = output.size();

            int res = process(this, flushLevel);

            size_t bytesWritten = (const char *)next_out - output.data();
            if (bytesWritten)
                onData(output.data(), bytesWritten);

            switch (res) {
            case Z_OK:
                break;

            case Z_BUF_ERROR:
                // No progress was possible; more input is needed
                return Z_OK;

            case Z_STREAM_END:
                return Z_STREAM_END;

            case Z_STREAM_ERROR:
                throw Exception("Stream error on zlib");

            default:
                throw Exception("zlib error: "
                                + string(msg ? msg : zError(res)));
            };
        } while (avail_in != 0 || avail_out == 0);

        return Z_OK;
    }

    void flush(FlushLevel flushLevel, const OnData & onData)
    {
        int zlibFlushLevel;
        switch (flushLevel) {
        case Compressor::FLUSH_NONE:       zlibFlushLevel = Z_NO_FLUSH;       break;
        case Compressor::FLUSH_AVAILABLE:  zlibFlushLevel = Z_PARTIAL_FLUSH;  break;
        case Compressor::FLUSH_SYNC:       zlibFlushLevel = Z_SYNC_FLUSH;     break;
        case Compressor::FLUSH_RESTART:    zlibFlushLevel = Z_FULL_FLUSH;     break;
        default:
            throw Exception("bad flush level");
        }

        pump(nullptr, 0, onData, zlibFlushLevel);
    }
};


/*****************************************************************************/
/* GZIP COMPRESSOR                                                           */
/*****************************************************************************/

struct GzipCompressor : public Compressor, public ZlibStreamCommon {

    typedef Compressor::OnData OnData;
    typedef Compressor::FlushLevel FlushLevel;

    GzipCompressor(int compressionLevel)
    {
        if (compressionLevel == -1)
            compressionLevel = Z_DEFAULT_COMPRESSION;
        int res = deflateInit2(this, compressionLevel, Z_DEFLATED, 15 + 16, 9,
                               Z_DEFAULT_STRATEGY);
        if (res != Z_OK)
            throw Exception("deflateInit2 failed");

        this->process = &deflate;
    }

    virtual ~GzipCompressor()
    {
        deflateEnd(this);
    }

    virtual void compress(const char * data, size_t len,
                          const OnData & onData) override
    {
        pump(data, len, onData, Z_NO_FLUSH);
    }

    virtual void flush(FlushLevel flushLevel, const OnData & onData) override
    {
        ZlibStreamCommon::flush(flushLevel, onData);
    }

    virtual void finish(const OnData & onData) override
    {
        if (pump(nullptr, 0, onData, Z_FINISH) != Z_STREAM_END)
            throw Exception("finished without getting to Z_STREAM_END");
    }
};

static Compressor::Register<GzipCompressor>
registerGzipCompressor("gzip", {"gz", "gzip"});


/*****************************************************************************/
/* GZIP DECOMPRESSOR                                                         */
/*****************************************************************************/

/** Gzip decompressor.  Handles concatenated members (as produced by
    `cat a.gz b.gz` or parallel gzip tools) by resetting the inflater
    each time a member ends and there is more input.
*/

struct GzipDecompressor: public Decompressor, public ZlibStreamCommon {

    typedef Decompressor::OnData OnData;

    bool memberEnded = false;
    bool anyMember = false;

    GzipDecompressor()
    {
        // 15 window bits + 32 to detect and parse the gzip header
        int res = inflateInit2(this, 15 + 32);
        if (res != Z_OK)
            throw Exception("inflateInit2 failed");
        this->process = &inflate;
    }

    ~GzipDecompressor()
    {
        inflateEnd(this);
    }

    virtual void decompress(const char * data, size_t len,
                            const OnData & onData) override
    {
        next_in = (Bytef *)data;
        avail_in = len;

        while (avail_in != 0) {
            if (memberEnded) {
                int res = inflateReset(this);
                if (res != Z_OK)
                    throw Exception("inflateReset failed");
                memberEnded = false;
            }

            anyMember = true;
            if (pump(nullptr, 0, onData, Z_NO_FLUSH) == Z_STREAM_END)
                memberEnded = true;
            else ExcAssertEqual(avail_in, 0);
        }
    }

    virtual void finish(const OnData & onData) override
    {
        if (!anyMember)
            throw Exception("gzip stream is empty");
        if (!memberEnded)
            throw Exception("gzip stream is truncated");
    }
};

static Decompressor::Register<GzipDecompressor>
registerGzipDecompressor("gzip", {"gz", "gzip"});

} // namespace STAGGER
