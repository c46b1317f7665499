/* stream_reader.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Line oriented reader over plain, gzip and bzip2 dump files.
*/

#include "stream_reader.h"
#include "compressor.h"
#include "stagger/arch/format.h"
#include "stagger/utils/log.h"
#include <boost/algorithm/string/predicate.hpp>
#include <algorithm>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <errno.h>


using namespace std;


namespace STAGGER {

namespace {

const char UTF8_BOM[] = "\xEF\xBB\xBF";

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("stream_reader");
    return result;
}

} // file scope


/*****************************************************************************/
/* CODEC                                                                     */
/*****************************************************************************/

std::string codecName(Codec codec)
{
    switch (codec) {
    case Codec::NONE:  return "none";
    case Codec::GZIP:  return "gzip";
    case Codec::BZIP2: return "bzip2";
    }
    STAGGER_THROW_LOGIC_ERROR("unknown codec");
}

Codec parseCodecName(const std::string & name)
{
    if (name == "none")
        return Codec::NONE;
    if (name == "gzip")
        return Codec::GZIP;
    if (name == "bzip2")
        return Codec::BZIP2;
    throw Exception("unknown codec '" + name + "'");
}

Codec codecForFilename(const std::string & filename)
{
    if (boost::algorithm::iends_with(filename, ".gz"))
        return Codec::GZIP;
    if (boost::algorithm::iends_with(filename, ".bz2"))
        return Codec::BZIP2;
    return Codec::NONE;
}


/*****************************************************************************/
/* CODEC CAPABILITIES                                                        */
/*****************************************************************************/

namespace {

std::mutex probeMutex;
std::optional<CodecCapabilities> probeResult;

} // file scope

bool
CodecCapabilities::
supports(Codec codec) const
{
    switch (codec) {
    case Codec::NONE:  return true;
    case Codec::GZIP:  return gzip;
    case Codec::BZIP2: return bzip2;
    }
    return false;
}

CodecCapabilities
CodecCapabilities::
probe()
{
    std::unique_lock<std::mutex> guard(probeMutex);
    if (!probeResult) {
        CodecCapabilities result;
        result.gzip = Decompressor::isRegistered(codecName(Codec::GZIP));
        result.bzip2 = Decompressor::isRegistered(codecName(Codec::BZIP2));
        DEBUG_MSG(logger()) << "codec support: gzip " << result.gzip
                            << " bzip2 " << result.bzip2;
        probeResult = result;
    }
    return *probeResult;
}

void
CodecCapabilities::
resetProbe()
{
    std::unique_lock<std::mutex> guard(probeMutex);
    probeResult.reset();
}


/*****************************************************************************/
/* ERRORS                                                                    */
/*****************************************************************************/

NotFoundError::
NotFoundError(const std::string & filename)
    : Exception("file not found: " + filename),
      filename(filename)
{
}

UnsupportedCodecError::
UnsupportedCodecError(const std::string & filename, Codec codec)
    : Exception("cannot read " + filename + ": " + codecName(codec)
                + " support is not available in this build"),
      filename(filename),
      codec(codec)
{
}

CorruptStreamError::
CorruptStreamError(const std::string & filename,
                   uint64_t compressedOffset,
                   const std::string & reason)
    : Exception(format("corrupt compressed stream in %s near byte %llu: %s",
                       filename.c_str(),
                       (unsigned long long)compressedOffset,
                       reason.c_str())),
      filename(filename),
      compressedOffset(compressedOffset)
{
}


/*****************************************************************************/
/* STREAM READER                                                             */
/*****************************************************************************/

StreamReader::
StreamReader(StreamReaderOptions options)
    : options_(std::move(options)),
      bufferSize_(clampBufferSize(options_.bufferSize))
{
    capabilities_ = options_.capabilities
        ? *options_.capabilities : CodecCapabilities::probe();
}

StreamReader::
~StreamReader()
{
    closeFile();
}

size_t
StreamReader::
clampBufferSize(size_t requested)
{
    return std::clamp(requested, MIN_BUFFER_SIZE, MAX_BUFFER_SIZE);
}

void
StreamReader::
open(const std::string & filename)
{
    close();

    Codec codec = codecForFilename(filename);

    struct stat st;
    if (::stat(filename.c_str(), &st) == -1) {
        if (errno == ENOENT || errno == ENOTDIR)
            throw NotFoundError(filename);
        throw Exception(errno, "stat " + filename, "StreamReader::open");
    }
    if (S_ISDIR(st.st_mode))
        throw NotFoundError(filename);

    if (!capabilities_.supports(codec)
        || (codec != Codec::NONE
            && !Decompressor::isRegistered(codecName(codec))))
        throw UnsupportedCodecError(filename, codec);

    filename_ = filename;
    codec_ = codec;
    input_.resize(bufferSize_);

    openFile();

    DEBUG_MSG(logger()) << "opened " << filename_ << " codec "
                        << codecName(codec_) << " size " << fileSize_
                        << " buffer " << bufferSize_;

    // Decode the first block now so that a file that is not what its
    // extension claims fails here rather than on the first readLine()
    if (codec_ != Codec::NONE) {
        try {
            fill();
        } catch (...) {
            close();
            throw;
        }
    }
}

void
StreamReader::
openFile()
{
    fd_ = ::open(filename_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ == -1) {
        if (errno == ENOENT)
            throw NotFoundError(filename_);
        throw Exception(errno, "open " + filename_, "StreamReader::open");
    }

    struct stat st;
    if (::fstat(fd_, &st) == -1) {
        int err = errno;
        closeFile();
        throw Exception(err, "fstat " + filename_, "StreamReader::open");
    }
    fileSize_ = st.st_size;

    if (codec_ != Codec::NONE)
        decompressor_ = Decompressor::create(codecName(codec_));

    compressedRead_ = 0;
    position_ = 0;
    inputDone_ = false;
    eof_ = false;
    pending_.clear();
    pendingPos_ = 0;
}

void
StreamReader::
closeFile()
{
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    decompressor_.reset();
}

void
StreamReader::
close()
{
    closeFile();
    filename_.clear();
    codec_ = Codec::NONE;
    fileSize_ = 0;
    compressedRead_ = 0;
    position_ = 0;
    inputDone_ = false;
    eof_ = false;
    pending_.clear();
    pendingPos_ = 0;
}

bool
StreamReader::
fill()
{
    if (inputDone_)
        return false;
    if (fd_ == -1)
        throw Exception("StreamReader: no file is open");

    // Drop consumed data before it accumulates
    if (pendingPos_ > 0 && pendingPos_ >= pending_.size() / 2) {
        pending_.erase(0, pendingPos_);
        pendingPos_ = 0;
    }

    ssize_t res;
    do {
        res = ::read(fd_, input_.data(), input_.size());
    } while (res == -1 && errno == EINTR);

    if (res == -1)
        throw Exception(errno,
                        format("read %s at byte %llu", filename_.c_str(),
                               (unsigned long long)compressedRead_),
                        "StreamReader::fill");

    auto onData = [&] (const char * data, size_t len) -> size_t
        {
            pending_.append(data, len);
            return len;
        };

    if (res == 0) {
        inputDone_ = true;
        if (decompressor_) {
            try {
                decompressor_->finish(onData);
            } catch (const CorruptStreamError &) {
                throw;
            } catch (const Exception & exc) {
                throw CorruptStreamError(filename_, compressedRead_,
                                         exc.what());
            }
        }
        return false;
    }

    compressedRead_ += res;

    if (decompressor_) {
        try {
            decompressor_->decompress(input_.data(), res, onData);
        } catch (const Exception & exc) {
            throw CorruptStreamError(filename_, compressedRead_, exc.what());
        }
    }
    else {
        pending_.append(input_.data(), res);
    }

    return true;
}

std::optional<std::string>
StreamReader::
readLine()
{
    if (eof_)
        return std::nullopt;

    size_t newline;
    size_t searchFrom = pendingPos_;
    for (;;) {
        newline = pending_.find('\n', searchFrom);
        if (newline != string::npos)
            break;
        searchFrom = pending_.size();
        size_t consumed = pendingPos_;
        bool more = fill();
        // fill() may have compacted the buffer
        searchFrom -= consumed - pendingPos_;
        if (!more) {
            newline = pending_.find('\n', searchFrom);
            break;
        }
    }

    size_t end = (newline == string::npos) ? pending_.size() : newline + 1;
    if (end == pendingPos_) {
        eof_ = true;
        return std::nullopt;
    }

    std::string line(pending_, pendingPos_, end - pendingPos_);
    bool atStart = position_ == 0;

    position_ += line.size();
    pendingPos_ = end;

    if (atStart && boost::algorithm::starts_with(line, UTF8_BOM))
        line.erase(0, 3);

    return line;
}

void
StreamReader::
skipForward(uint64_t targetOffset, const SeekProgress & onProgress)
{
    uint64_t nextReport = position_ + SEEK_PROGRESS_INTERVAL;

    while (position_ < targetOffset) {
        if (available() == 0 && !fill() && available() == 0) {
            throw Exception(format("cannot seek %s to byte %llu: stream ends "
                                   "at byte %llu",
                                   filename_.c_str(),
                                   (unsigned long long)targetOffset,
                                   (unsigned long long)position_));
        }

        size_t toSkip = std::min<uint64_t>(available(),
                                           targetOffset - position_);
        pendingPos_ += toSkip;
        position_ += toSkip;

        if (onProgress && position_ >= nextReport && position_ < targetOffset) {
            onProgress(position_, targetOffset);
            nextReport = position_ + SEEK_PROGRESS_INTERVAL;
        }
    }
}

void
StreamReader::
seek(uint64_t targetOffset, const SeekProgress & onProgress)
{
    if (fd_ == -1)
        throw Exception("StreamReader: cannot seek, no file is open");

    switch (codec_) {
    case Codec::NONE: {
        if (targetOffset > fileSize_)
            throw Exception(format("cannot seek %s to byte %llu: file has "
                                   "%llu bytes",
                                   filename_.c_str(),
                                   (unsigned long long)targetOffset,
                                   (unsigned long long)fileSize_));
        if (::lseek(fd_, targetOffset, SEEK_SET) == -1)
            throw Exception(errno, "lseek " + filename_, "StreamReader::seek");
        pending_.clear();
        pendingPos_ = 0;
        position_ = targetOffset;
        compressedRead_ = targetOffset;
        inputDone_ = false;
        eof_ = false;
        return;
    }

    case Codec::GZIP:
        if (targetOffset < position_) {
            closeFile();
            openFile();
        }
        eof_ = false;
        skipForward(targetOffset, nullptr);
        return;

    case Codec::BZIP2:
        replaySeek(targetOffset, onProgress);
        return;
    }
}

void
StreamReader::
replaySeek(uint64_t targetOffset, const SeekProgress & onProgress)
{
    if (fd_ == -1)
        throw Exception("StreamReader: cannot seek, no file is open");

    DEBUG_MSG(logger()) << "replaying " << filename_ << " up to byte "
                        << targetOffset;

    closeFile();
    openFile();
    skipForward(targetOffset, onProgress);

    if (onProgress)
        onProgress(position_, targetOffset);
}

} // namespace STAGGER
