/* bzip2.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Implementation of the bzip2 compression format on top of libbz2.
*/

#include "compressor.h"
#include <bzlib.h>
#include "stagger/base/exc_assert.h"
#include <vector>


using namespace std;


namespace STAGGER {

/*****************************************************************************/
/* BZLIB STREAM COMMON                                                       */
/*****************************************************************************/

struct BzlibStreamCommon: public bz_stream {

    typedef Compressor::OnData OnData;
    typedef Compressor::FlushLevel FlushLevel;

    static std::string bzerror(int code)
    {
        switch (code) {
        case BZ_OK: return "OK";
        case BZ_RUN_OK: return "RUN_OK";
        case BZ_FLUSH_OK: return "FLUSH_OK";
        case BZ_FINISH_OK: return "FINISH_OK";
        case BZ_STREAM_END: return "STREAM_END";
        case BZ_SEQUENCE_ERROR: return "SEQUENCE_ERROR";
        case BZ_PARAM_ERROR: return "PARAM_ERROR";
        case BZ_MEM_ERROR: return "MEM_ERROR";
        case BZ_DATA_ERROR: return "DATA_ERROR";
        case BZ_DATA_ERROR_MAGIC: return "DATA_ERROR_MAGIC";
        case BZ_IO_ERROR: return "IO_ERROR";
        case BZ_UNEXPECTED_EOF: return "UNEXPECTED_EOF";
        case BZ_OUTBUFF_FULL: return "OUTBUFF_FULL";
        case BZ_CONFIG_ERROR: return "CONFIG_ERROR";
        default: return "UNKNOWN ERROR";
        }
    }

    BzlibStreamCommon()
        : output(131072)
    {
        bzalloc = nullptr;
        bzfree = nullptr;
        opaque = nullptr;
        next_in = nullptr;
        avail_in = 0;
    }

    int (*process) (bz_stream * stream, int flush) = nullptr;

    std::vector<char> output;

    /** Run the available input through the stream.  Returns BZ_STREAM_END
        when the end of a stream was reached (input may be left over).
    */
    int pump(const OnData & onData, int flushLevel)
    {
        do {
            next_out = output.data();
            avail_out = output.size();

            int res = process(this, flushLevel);

            size_t bytesWritten = next_out - output.data();
            if (bytesWritten)
                onData(output.data(), bytesWritten);

            switch (res) {
            case BZ_OK:
            case BZ_RUN_OK:
            case BZ_FLUSH_OK:
            case BZ_FINISH_OK:
                break;

            case BZ_STREAM_END:
                return BZ_STREAM_END;

            default:
                throw Exception("bzip2 error: " + bzerror(res));
            };

            // Decompression may stall with no input and room left
            if (avail_in == 0 && avail_out != 0 && flushLevel == BZ_RUN)
                break;
        } while (true);

        return BZ_OK;
    }
};


/*****************************************************************************/
/* BZIP COMPRESSOR                                                           */
/*****************************************************************************/

struct BzipCompressor : public Compressor, public BzlibStreamCommon {

    typedef Compressor::OnData OnData;
    typedef Compressor::FlushLevel FlushLevel;

    BzipCompressor(int compressionLevel)
    {
        if (compressionLevel == -1)
            compressionLevel = 9; // speed is unaffected by block size, from doc
        int res = BZ2_bzCompressInit(this, compressionLevel, 0 /* verbosity */,
                                     0 /* default work factor */);
        if (res != BZ_OK)
            throw Exception("BZ2_bzCompressInit failed: " + bzerror(res));

        this->process = &BZ2_bzCompress;
    }

    virtual ~BzipCompressor()
    {
        BZ2_bzCompressEnd(this);
    }

    virtual void compress(const char * data, size_t len,
                          const OnData & onData) override
    {
        next_in = (char *)data;
        avail_in = len;
        pump(onData, BZ_RUN);
    }

    virtual void flush(FlushLevel flushLevel, const OnData & onData) override
    {
        // Only a sync flush maps onto bzip2; a restart would end the stream
        if (flushLevel == Compressor::FLUSH_SYNC) {
            next_in = nullptr;
            avail_in = 0;
            // BZ_FLUSH reports BZ_RUN_OK once the flush completes
            int res;
            do {
                next_out = output.data();
                avail_out = output.size();
                res = BZ2_bzCompress(this, BZ_FLUSH);
                size_t bytesWritten = next_out - output.data();
                if (bytesWritten)
                    onData(output.data(), bytesWritten);
            } while (res == BZ_FLUSH_OK);
            if (res != BZ_RUN_OK)
                throw Exception("bzip2 flush error: " + bzerror(res));
        }
    }

    virtual void finish(const OnData & onData) override
    {
        next_in = nullptr;
        avail_in = 0;
        if (pump(onData, BZ_FINISH) != BZ_STREAM_END)
            throw Exception("finished without getting to BZ_STREAM_END");
    }
};

static Compressor::Register<BzipCompressor>
registerBzipCompressor("bzip2", {"bz2", "bzip2"});


/*****************************************************************************/
/* BZIP DECOMPRESSOR                                                         */
/*****************************************************************************/

/** Bzip2 decompressor.  Files written by parallel bzip2 tools are a
    concatenation of streams; the decompressor is re-initialized at each
    stream end for which more input follows.
*/

struct BzipDecompressor: public Decompressor, public BzlibStreamCommon {

    typedef Decompressor::OnData OnData;

    bool streamEnded = false;
    bool anyStream = false;

    static int bz_decompress(bz_stream * stream, int flush)
    {
        return BZ2_bzDecompress(stream);
    }

    BzipDecompressor()
    {
        init();
        this->process = &bz_decompress;
    }

    ~BzipDecompressor()
    {
        BZ2_bzDecompressEnd(this);
    }

    void init()
    {
        int res = BZ2_bzDecompressInit(this, 0 /* verbosity */, 0 /* small */);
        if (res != BZ_OK)
            throw Exception("BZ2_bzDecompressInit failed: " + bzerror(res));
    }

    virtual void decompress(const char * data, size_t len,
                            const OnData & onData) override
    {
        const char * p = data;
        size_t remaining = len;

        while (remaining != 0) {
            if (streamEnded) {
                BZ2_bzDecompressEnd(this);
                init();
                streamEnded = false;
            }

            anyStream = true;
            next_in = (char *)p;
            avail_in = remaining;

            int res = pump(onData, BZ_RUN);

            p = next_in;
            remaining = avail_in;

            if (res == BZ_STREAM_END)
                streamEnded = true;
            else ExcAssertEqual(remaining, 0);
        }
    }

    virtual void finish(const OnData & onData) override
    {
        if (!anyStream)
            throw Exception("bzip2 stream is empty");
        if (!streamEnded)
            throw Exception("bzip2 stream is truncated");
    }
};

static Decompressor::Register<BzipDecompressor>
registerBzipDecompressor("bzip2", {"bz2", "bzip2"});

} // namespace STAGGER
