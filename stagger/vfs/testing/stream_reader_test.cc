/* stream_reader_test.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Test of line reading and seeking over plain and compressed dumps.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "stagger/vfs/stream_reader.h"
#include "stagger/vfs/compressor.h"
#include "stagger/arch/format.h"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <vector>
#include <errno.h>
#include <stdlib.h>

using namespace std;
using namespace STAGGER;

namespace {

struct TempDir {
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path()
                            / "stream_reader_test_XXXXXX").string();
        if (!mkdtemp(tmpl.data()))
            throw Exception(errno, "mkdtemp", "TempDir");
        path = tmpl;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string & name) const
    {
        return (path / name).string();
    }

    std::filesystem::path path;
};

/** Write contents to filename, compressed according to its extension. */
void writeFile(const std::string & filename, const std::string & contents)
{
    std::string compression = Compressor::filenameToCompression(filename);
    if (compression.empty())
        compression = "none";
    auto compressor = Compressor::create(compression);

    std::ofstream stream(filename, std::ios::binary);
    auto onData = [&] (const char * data, size_t len)
        {
            stream.write(data, len);
            return len;
        };
    compressor->compress(contents.data(), contents.size(), onData);
    compressor->finish(onData);
    BOOST_REQUIRE(stream);
}

std::string makeDump(int lines)
{
    std::string result;
    for (int i = 0;  i < lines;  ++i)
        result += format("INSERT INTO t VALUES (%d, 'row %d');\n", i, i);
    return result;
}

/** Builds may leave out bzip2 support. */
bool canWrite(const std::string & filename)
{
    Codec codec = codecForFilename(filename);
    return codec == Codec::NONE
        || Decompressor::isRegistered(codecName(codec));
}

std::vector<std::string> readAll(StreamReader & reader)
{
    std::vector<std::string> result;
    while (auto line = reader.readLine())
        result.push_back(*line);
    return result;
}

} // file scope

BOOST_AUTO_TEST_CASE(test_codec_for_filename)
{
    BOOST_CHECK(codecForFilename("dump.sql") == Codec::NONE);
    BOOST_CHECK(codecForFilename("dump.sql.gz") == Codec::GZIP);
    BOOST_CHECK(codecForFilename("DUMP.SQL.GZ") == Codec::GZIP);
    BOOST_CHECK(codecForFilename("dump.sql.bz2") == Codec::BZIP2);
    BOOST_CHECK(codecForFilename("dump.csv") == Codec::NONE);
    BOOST_CHECK(codecForFilename("dump") == Codec::NONE);
    BOOST_CHECK(parseCodecName(codecName(Codec::BZIP2)) == Codec::BZIP2);
    BOOST_CHECK_THROW(parseCodecName("lzma"), Exception);
}

BOOST_AUTO_TEST_CASE(test_buffer_size_clamped)
{
    BOOST_CHECK_EQUAL(StreamReader::clampBufferSize(1024),
                      StreamReader::MIN_BUFFER_SIZE);
    BOOST_CHECK_EQUAL(StreamReader::clampBufferSize(1024 * 1024),
                      StreamReader::MAX_BUFFER_SIZE);
    BOOST_CHECK_EQUAL(StreamReader::clampBufferSize(100000), 100000);

    StreamReaderOptions options;
    options.bufferSize = 1;
    StreamReader reader(options);
    BOOST_CHECK_EQUAL(reader.bufferSize(), StreamReader::MIN_BUFFER_SIZE);
}

BOOST_AUTO_TEST_CASE(test_missing_file)
{
    TempDir dir;
    StreamReader reader;
    BOOST_CHECK_THROW(reader.open(dir.file("missing.sql")), NotFoundError);
    BOOST_CHECK_THROW(reader.open(dir.file("missing.sql.gz")), NotFoundError);
    BOOST_CHECK(!reader.isOpen());
}

BOOST_AUTO_TEST_CASE(test_read_lines_all_codecs)
{
    TempDir dir;
    std::string contents = makeDump(20000) + "SELECT 'no newline at end'";

    for (auto name: { "dump.sql", "dump.sql.gz", "dump.sql.bz2" }) {
        if (!canWrite(name))
            continue;
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            writeFile(filename, contents);

            StreamReader reader;
            reader.open(filename);
            BOOST_CHECK(!reader.eof());

            std::string joined;
            size_t count = 0;
            while (auto line = reader.readLine()) {
                joined += *line;
                ++count;
            }

            BOOST_CHECK(reader.eof());
            BOOST_CHECK_EQUAL(count, 20001);
            BOOST_CHECK(joined == contents);
            BOOST_CHECK_EQUAL(reader.tell(), contents.size());
            BOOST_CHECK(!reader.readLine());
        }
    }
}

BOOST_AUTO_TEST_CASE(test_bom_stripped_from_first_line_only)
{
    TempDir dir;
    std::string bom = "\xEF\xBB\xBF";
    std::string filename = dir.file("bom.sql");
    writeFile(filename, bom + "SELECT 1;\n" + bom + "SELECT 2;\n");

    StreamReader reader;
    reader.open(filename);
    auto lines = readAll(reader);
    BOOST_REQUIRE_EQUAL(lines.size(), 2);
    BOOST_CHECK_EQUAL(lines[0], "SELECT 1;\n");
    BOOST_CHECK_EQUAL(lines[1], bom + "SELECT 2;\n");

    // The BOM still counts towards the offset
    BOOST_CHECK_EQUAL(reader.tell(), 3 + 10 + 3 + 10);
}

BOOST_AUTO_TEST_CASE(test_seek_matches_sequential_read)
{
    TempDir dir;
    std::string contents = makeDump(50000);

    for (auto name: { "seek.sql", "seek.sql.gz", "seek.sql.bz2" }) {
        if (!canWrite(name))
            continue;
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            writeFile(filename, contents);

            StreamReader reader;
            reader.open(filename);
            for (int i = 0;  i < 30000;  ++i)
                BOOST_REQUIRE(reader.readLine());
            uint64_t offset = reader.tell();
            auto expected = readAll(reader);
            reader.close();
            BOOST_CHECK(!reader.isOpen());

            StreamReader resumed;
            resumed.open(filename);
            resumed.seek(offset);
            BOOST_CHECK_EQUAL(resumed.tell(), offset);
            auto actual = readAll(resumed);
            BOOST_CHECK(actual == expected);

            // Backwards seek on the same reader
            resumed.seek(offset);
            BOOST_CHECK(readAll(resumed) == expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_bzip2_replay_seek_progress)
{
    if (!canWrite("big.sql.bz2"))
        return;

    TempDir dir;
    std::string contents;
    while (contents.size() < 3 * StreamReader::SEEK_PROGRESS_INTERVAL)
        contents += makeDump(10000);
    std::string filename = dir.file("big.sql.bz2");
    writeFile(filename, contents);

    uint64_t target = contents.size() - 100;
    while (contents[target - 1] != '\n')
        --target;

    StreamReader reader;
    reader.open(filename);

    std::vector<uint64_t> reports;
    reader.seek(target, [&] (uint64_t bytesRead, uint64_t seekTarget)
                {
                    BOOST_CHECK_EQUAL(seekTarget, target);
                    reports.push_back(bytesRead);
                });

    BOOST_REQUIRE_GE(reports.size(), 3);
    for (size_t i = 1;  i < reports.size();  ++i)
        BOOST_CHECK_GT(reports[i], reports[i - 1]);
    BOOST_CHECK_EQUAL(reports.back(), target);

    auto line = reader.readLine();
    BOOST_REQUIRE(line);
    BOOST_CHECK_EQUAL(*line, contents.substr(target, line->size()));
}

BOOST_AUTO_TEST_CASE(test_seek_past_end)
{
    TempDir dir;
    std::string contents = makeDump(10);

    for (auto name: { "short.sql", "short.sql.gz", "short.sql.bz2" }) {
        if (!canWrite(name))
            continue;
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            writeFile(filename, contents);

            StreamReader reader;
            reader.open(filename);
            BOOST_CHECK_THROW(reader.seek(contents.size() + 1000), Exception);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_corrupt_stream_fails_fast)
{
    TempDir dir;

    for (auto name: { "corrupt.sql.gz", "corrupt.sql.bz2" }) {
        if (!canWrite(name))
            continue;
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            {
                std::ofstream stream(filename);
                stream << makeDump(100);
            }
            StreamReader reader;
            BOOST_CHECK_THROW(reader.open(filename), CorruptStreamError);
            BOOST_CHECK(!reader.isOpen());
        }
    }
}

BOOST_AUTO_TEST_CASE(test_truncated_stream)
{
    TempDir dir;
    std::string contents = makeDump(20000);

    for (auto name: { "truncated.sql.gz", "truncated.sql.bz2" }) {
        if (!canWrite(name))
            continue;
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            writeFile(filename, contents);
            std::filesystem::resize_file
                (filename, std::filesystem::file_size(filename) / 2);

            StreamReader reader;
            reader.open(filename);
            BOOST_CHECK_THROW(readAll(reader), CorruptStreamError);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_unsupported_codec)
{
    TempDir dir;
    // Contents are never read
    std::string filename = dir.file("dump.sql.bz2");
    {
        std::ofstream stream(filename);
        stream << "BZh9";
    }

    CodecCapabilities noBzip2;
    noBzip2.gzip = true;
    noBzip2.bzip2 = false;

    StreamReaderOptions options;
    options.capabilities = noBzip2;
    StreamReader reader(options);
    BOOST_CHECK_THROW(reader.open(filename), UnsupportedCodecError);

    // Plain files are always readable
    writeFile(dir.file("dump.sql"), makeDump(10));
    reader.open(dir.file("dump.sql"));
    BOOST_CHECK_EQUAL(readAll(reader).size(), 10);
}

BOOST_AUTO_TEST_CASE(test_capability_probe)
{
    CodecCapabilities::resetProbe();
    CodecCapabilities capabilities = CodecCapabilities::probe();
    BOOST_CHECK(capabilities.gzip);
    BOOST_CHECK(capabilities.supports(Codec::NONE));
    BOOST_CHECK_EQUAL(capabilities.supports(Codec::BZIP2),
                      Decompressor::isRegistered("bzip2"));
}
