#include "CommandsTest.hpp"
#include "TestHelpers.hpp"
#include "Commands.h"
#include "FileIO.h"

#include <QTest>

#include <algorithm>
#include <filesystem>

QTEST_MAIN(CommandsTest)

using namespace PNGMessage;

static std::filesystem::path pathIn(const QTemporaryDir& dir, const char* name)
{
    return std::filesystem::path(dir.path().toStdString()) / name;
}

static void writeBytes(const std::filesystem::path& path, std::span<const Byte> bytes)
{
    QVERIFY(WriteWholeFile(path, bytes).has_value());
}

void CommandsTest::initTestCase()
{
    QVERIFY(tempDir.isValid());
}

void CommandsTest::init()
{
    writeBytes(pathIn(tempDir, "image.png"), TestData::onePixelPNG);
}

void CommandsTest::testReadMissingFile()
{
    auto bytes = ReadWholeFile(pathIn(tempDir, "missing.png"));
    QVERIFY(!bytes.has_value());
    QCOMPARE(bytes.error(), PNGError::File_Open_Failure);

    auto decoded = DecodeMessage(pathIn(tempDir, "missing.png"), "RuSt");
    QVERIFY(!decoded.has_value());
    QCOMPARE(decoded.error(), PNGError::File_Open_Failure);
}

void CommandsTest::testWriteWholeFile()
{
    std::filesystem::path path = pathIn(tempDir, "bytes.bin");
    std::vector<Byte> bytes{ 1, 2, 3, 0, 255 };

    QVERIFY(WriteWholeFile(path, bytes).has_value());
    auto read = ReadWholeFile(path);
    QVERIFY(read.has_value());
    QVERIFY(*read == bytes);

    // overwriting replaces the whole file and leaves no temporary behind
    std::vector<Byte> shorter{ 9 };
    QVERIFY(WriteWholeFile(path, shorter).has_value());
    QVERIFY(ReadWholeFile(path).value() == shorter);
    QVERIFY(!std::filesystem::exists(pathIn(tempDir, "bytes.bin.tmp")));
}

void CommandsTest::testWriteIntoMissingDirectory()
{
    auto result = WriteWholeFile(pathIn(tempDir, "no-such-dir") / "out.png", TestData::onePixelPNG);
    QVERIFY(!result.has_value());
    QCOMPARE(result.error(), PNGError::File_Write_Failure);
}

void CommandsTest::testEncodeDecode()
{
    std::filesystem::path input = pathIn(tempDir, "image.png");
    std::filesystem::path output = pathIn(tempDir, "encoded.png");

    QVERIFY(EncodeMessage(input, "RuSt", TestData::message, output).has_value());

    // the source file is untouched
    QVERIFY(std::ranges::equal(ReadWholeFile(input).value(), TestData::onePixelPNG));

    auto decoded = DecodeMessage(output, "RuSt");
    QVERIFY(decoded.has_value());
    QVERIFY(decoded->has_value());
    QCOMPARE(**decoded, std::string(TestData::message));

    auto png = LoadPNG(output);
    QVERIFY(png.has_value());
    QCOMPARE(png->Chunks().size(), std::size_t(4));
    QCOMPARE(std::string(png->Chunks().back().Type().ToString()), std::string("RuSt"));
}

void CommandsTest::testEncodeRejectsReservedType()
{
    std::filesystem::path output = pathIn(tempDir, "reserved.png");

    auto result = EncodeMessage(pathIn(tempDir, "image.png"), "Rust", TestData::message, output);
    QVERIFY(!result.has_value());
    QCOMPARE(result.error(), PNGError::Chunk_Type_Reserved_Bit_Set);
    QVERIFY(!std::filesystem::exists(output));

    result = EncodeMessage(pathIn(tempDir, "image.png"), "Ru1t", TestData::message, output);
    QVERIFY(!result.has_value());
    QCOMPARE(result.error(), PNGError::Chunk_Type_Not_Alphabetic);
}

void CommandsTest::testEncodeRejectsNonPNG()
{
    std::filesystem::path input = pathIn(tempDir, "text.txt");
    writeBytes(input, TestData::ToBytes("definitely not a png file"));

    auto result = EncodeMessage(input, "RuSt", TestData::message, pathIn(tempDir, "out.png"));
    QVERIFY(!result.has_value());
    QCOMPARE(result.error(), PNGError::Unknown_Signature);
}

void CommandsTest::testDecodeAbsentChunk()
{
    auto decoded = DecodeMessage(pathIn(tempDir, "image.png"), "RuSt");
    QVERIFY(decoded.has_value());
    QVERIFY(!decoded->has_value());
}

void CommandsTest::testDecodeBinaryPayload()
{
    // the IDAT payload is zlib data, not text
    auto decoded = DecodeMessage(pathIn(tempDir, "image.png"), "IDAT");
    QVERIFY(!decoded.has_value());
    QCOMPARE(decoded.error(), PNGError::Invalid_Text_Encoding);
}

void CommandsTest::testRemove()
{
    std::filesystem::path path = pathIn(tempDir, "image.png");
    QVERIFY(EncodeMessage(path, "RuSt", TestData::message, path).has_value());

    auto removed = RemoveMessage(path, "RuSt");
    QVERIFY(removed.has_value());
    QCOMPARE(removed->DataAsText().value(), std::string(TestData::message));

    // removing the only message chunk restores the original bytes
    QVERIFY(std::ranges::equal(ReadWholeFile(path).value(), TestData::onePixelPNG));
}

void CommandsTest::testRemoveAbsentChunkLeavesFile()
{
    std::filesystem::path path = pathIn(tempDir, "image.png");

    auto removed = RemoveMessage(path, "RuSt");
    QVERIFY(!removed.has_value());
    QCOMPARE(removed.error(), PNGError::Chunk_Not_Found);
    QVERIFY(std::ranges::equal(ReadWholeFile(path).value(), TestData::onePixelPNG));
}

void CommandsTest::testPrint()
{
    auto text = PrintChunks(pathIn(tempDir, "image.png"));
    QVERIFY(text.has_value());
    QVERIFY(text->find("Chunks: 3") != std::string::npos);
    QVERIFY(text->find("Type: IHDR") != std::string::npos);
    QVERIFY(text->find("Data: 13 bytes") != std::string::npos);
}

void CommandsTest::testValidate()
{
    std::filesystem::path path = pathIn(tempDir, "image.png");
    QVERIFY(ValidateFile(path).has_value());

    // appending after IEND is allowed by encode but breaks the structure
    QVERIFY(EncodeMessage(path, "RuSt", TestData::message, path).has_value());
    auto result = ValidateFile(path);
    QVERIFY(!result.has_value());
    QCOMPARE(result.error(), PNGError::Trailer_Not_Last);
}
