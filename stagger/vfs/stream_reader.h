/* stream_reader.h                                                 -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Line oriented reader over plain, gzip and bzip2 dump files, with byte
   accurate positioning in the uncompressed stream.
*/

#pragma once

#include "stagger/arch/exception.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>

namespace STAGGER {

struct Decompressor;


/*****************************************************************************/
/* CODEC                                                                     */
/*****************************************************************************/

enum class Codec {
    NONE,
    GZIP,
    BZIP2
};

/** Name of the codec as registered with Decompressor ("none", "gzip",
    "bzip2").
*/
std::string codecName(Codec codec);

/** Inverse of codecName(); throws on an unknown name. */
Codec parseCodecName(const std::string & name);

/** Codec implied by a filename: case insensitive ".gz" is gzip, ".bz2" is
    bzip2, anything else (".sql", ".csv", no extension) is plain text.
*/
Codec codecForFilename(const std::string & filename);


/*****************************************************************************/
/* CODEC CAPABILITIES                                                        */
/*****************************************************************************/

/** Which compressed formats this process can read.  The probe is run once
    per process against the decompressor registry; readers can be handed an
    explicit set instead.
*/

struct CodecCapabilities {
    bool gzip = false;
    bool bzip2 = false;

    bool supports(Codec codec) const;

    /// Result of the process-wide probe, computed on first call
    static CodecCapabilities probe();

    /// Forget the probe result so the next call recomputes it
    static void resetProbe();
};


/*****************************************************************************/
/* ERRORS                                                                    */
/*****************************************************************************/

/** The dump file does not exist. */
struct NotFoundError: public Exception {
    NotFoundError(const std::string & filename);

    std::string filename;
};

/** The file's compression format is not available in this process. */
struct UnsupportedCodecError: public Exception {
    UnsupportedCodecError(const std::string & filename, Codec codec);

    std::string filename;
    Codec codec;
};

/** The compressed stream could not be decoded. */
struct CorruptStreamError: public Exception {
    CorruptStreamError(const std::string & filename,
                       uint64_t compressedOffset,
                       const std::string & reason);

    std::string filename;
    uint64_t compressedOffset;
};


/*****************************************************************************/
/* STREAM READER                                                             */
/*****************************************************************************/

struct StreamReaderOptions {
    /// Size of reads from the underlying file; clamped to
    /// [MIN_BUFFER_SIZE, MAX_BUFFER_SIZE]
    size_t bufferSize = 128 * 1024;

    /// Codec support to assume; the process-wide probe if not set
    std::optional<CodecCapabilities> capabilities;
};

/** Called during a replay seek with the number of uncompressed bytes
    re-read so far and the target offset.
*/
typedef std::function<void (uint64_t bytesRead, uint64_t target)> SeekProgress;

struct StreamReader {

    static constexpr size_t MIN_BUFFER_SIZE = 64 * 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 256 * 1024;
    static constexpr size_t DEFAULT_BUFFER_SIZE = 128 * 1024;

    /// Replay seeks report progress each time this many bytes are skipped
    static constexpr uint64_t SEEK_PROGRESS_INTERVAL = 8 * 1024 * 1024;

    StreamReader(StreamReaderOptions options = StreamReaderOptions());
    ~StreamReader();

    StreamReader(const StreamReader &) = delete;
    void operator = (const StreamReader &) = delete;

    /** Open the given file, closing any file that is already open.  Throws
        NotFoundError, UnsupportedCodecError, or CorruptStreamError when a
        compressed file does not start with a valid stream.
    */
    void open(const std::string & filename);

    /** Return the next line including its terminator, or an empty optional
        at the end of the stream.  A UTF-8 byte order mark at offset zero is
        removed from the returned text (but still counts in tell()).
    */
    std::optional<std::string> readLine();

    /** Number of bytes of the uncompressed stream consumed so far. */
    uint64_t tell() const { return position_; }

    /** Position the reader at the given offset of the uncompressed stream.
        Plain files seek natively; gzip skips forward by decompressing,
        reopening first if the target is behind the current position; bzip2
        always performs a replaySeek().  Throws if the target is past the end
        of the stream.
    */
    void seek(uint64_t targetOffset, const SeekProgress & onProgress = nullptr);

    /** Reopen the stream from its beginning and decompress forward until
        targetOffset, calling onProgress periodically.  Cost is proportional
        to targetOffset.
    */
    void replaySeek(uint64_t targetOffset,
                    const SeekProgress & onProgress = nullptr);

    /** True once readLine() has returned the end of stream marker. */
    bool eof() const { return eof_; }

    bool isOpen() const { return fd_ != -1; }

    /** Release the file and reset all state so another file can be
        opened.
    */
    void close();

    Codec codec() const { return codec_; }
    const std::string & filename() const { return filename_; }

    /** Size of the file on disk (compressed size for compressed files). */
    uint64_t fileSize() const { return fileSize_; }

    /** Bytes read from the file on disk, for progress against fileSize(). */
    uint64_t compressedBytesRead() const { return compressedRead_; }

    size_t bufferSize() const { return bufferSize_; }

    static size_t clampBufferSize(size_t requested);

private:
    void openFile();
    void closeFile();

    /** Read the next block of the file into pending_.  Returns false once
        the underlying file is exhausted and no more data can arrive.
    */
    bool fill();

    /** Discard bytes until position_ reaches targetOffset. */
    void skipForward(uint64_t targetOffset, const SeekProgress & onProgress);

    size_t available() const { return pending_.size() - pendingPos_; }

    StreamReaderOptions options_;
    CodecCapabilities capabilities_;
    size_t bufferSize_;

    std::string filename_;
    Codec codec_ = Codec::NONE;
    int fd_ = -1;
    uint64_t fileSize_ = 0;
    uint64_t compressedRead_ = 0;
    uint64_t position_ = 0;
    bool inputDone_ = false;
    bool eof_ = false;

    std::unique_ptr<Decompressor> decompressor_;
    std::vector<char> input_;
    std::string pending_;
    size_t pendingPos_ = 0;
};

} // namespace STAGGER
