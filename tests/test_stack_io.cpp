#include "czistack/core/Errors.hpp"
#include "czistack/core/Exporter.hpp"
#include "czistack/io/StackReader.hpp"
#include "czistack/io/StackWriter.hpp"
#include "czistack/io/SyntheticStackSource.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <libCZI.h>

#include <cstdint>
#include <fstream>
#include <memory>

using namespace czistack;
using czistack::test::ScratchDir;
using czistack::test::listFileNames;
using czistack::test::makeStack;

namespace {

DecodedStack twoChannelStack() {
    DecodedStack d;
    d.stack = makeStack({2, 3, 4, 4}, [](int c, int z, int y, int x) {
        return c == 0 ? 10 + z * 60 + y * 4 + x : 250 - z * 30 - y * 8 - x;
    });
    d.channels = {
        ChannelMetadata{0, "Red",   "#FFFF0000"},
        ChannelMetadata{1, "Green", "#FF00FF00"},
    };
    return d;
}

/* Metadata document with the given <Channels> body. */
std::string metadataWithChannels(const std::string& channels) {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<ImageDocument><Metadata><DisplaySetting><Channels>"
           + channels +
           "</Channels></DisplaySetting></Metadata></ImageDocument>\n";
}

/* One 2x2 Gray16 plane at C0 Z0 with otherwise valid channel metadata. */
void writeGray16Czi(const std::filesystem::path& path) {
    const std::uint16_t px[4] = {1000, 2000, 3000, 4000};

    auto out = libCZI::CreateOutputStreamForFile(path.wstring().c_str(), true);
    auto writer = libCZI::CreateCZIWriter();
    writer->Create(out, std::make_shared<libCZI::CCziWriterInfo>(
        libCZI::GUID{0x1b2c3d4e, 0x0a0b, 0x4c0d, {0x8e, 0x0f, 0x10, 0x11, 0x12, 0x13, 0x14, 0x15}}));

    libCZI::AddSubBlockInfoStridedBitmap sb;
    sb.Clear();
    sb.coordinate.Set(libCZI::DimensionIndex::C, 0);
    sb.coordinate.Set(libCZI::DimensionIndex::Z, 0);
    sb.mIndexValid    = false;
    sb.x              = 0;
    sb.y              = 0;
    sb.logicalWidth   = 2;
    sb.logicalHeight  = 2;
    sb.physicalWidth  = 2;
    sb.physicalHeight = 2;
    sb.PixelType      = libCZI::PixelType::Gray16;
    sb.ptrBitmap      = px;
    sb.strideBitmap   = 2 * sizeof(std::uint16_t);
    writer->SyncAddSubBlock(sb);

    const std::string xml = buildStackMetadataXml(StackShape{1, 1, 2, 2},
                                                  {ChannelMetadata{0, "Deep", "#FFFFFFFF"}});
    libCZI::WriteMetadataInfo md;
    md.Clear();
    md.szMetadata     = xml.c_str();
    md.szMetadataSize = xml.size();
    writer->SyncWriteMetadata(md);
    writer->Close();
}

} // namespace

TEST(StackWriter, MetadataXmlListsChannelsInOrder) {
    const std::string xml = buildStackMetadataXml(
        StackShape{2, 3, 4, 5},
        {ChannelMetadata{0, "A&B", "#FFFF0000"}, ChannelMetadata{1, "C", "#FF00FF00"}});
    const auto a = xml.find("Name=\"A&amp;B\"");
    const auto c = xml.find("Name=\"C\"");
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(c, std::string::npos);
    EXPECT_LT(a, c);
    EXPECT_NE(xml.find("<Color>#FF00FF00</Color>"), std::string::npos);
    EXPECT_NE(xml.find("<SizeX>5</SizeX>"), std::string::npos);
}

TEST(StackReader, ReadsBackWrittenStack) {
    ScratchDir tmp;
    const auto file = tmp / "two.czi";
    const DecodedStack in = twoChannelStack();
    writeStackCzi(file, in.stack, in.channels);

    StackReader reader(file);
    EXPECT_EQ(reader.shape(), (StackShape{2, 3, 4, 4}));

    const DecodedStack out = reader.read();
    ASSERT_EQ(out.stack.shape(), in.stack.shape());
    for (int c = 0; c < 2; ++c)
        for (int z = 0; z < 3; ++z)
            for (int y = 0; y < 4; ++y)
                for (int x = 0; x < 4; ++x)
                    ASSERT_EQ(out.stack.at(c, z, y, x), in.stack.at(c, z, y, x))
                        << "c=" << c << " z=" << z << " y=" << y << " x=" << x;

    ASSERT_EQ(out.channels.size(), 2u);
    EXPECT_EQ(out.channels[0].index, 0);
    EXPECT_EQ(out.channels[0].name, "Red");
    EXPECT_EQ(out.channels[0].color, "#FFFF0000");
    EXPECT_EQ(out.channels[1].index, 1);
    EXPECT_EQ(out.channels[1].name, "Green");
    EXPECT_EQ(out.channels[1].color, "#FF00FF00");
}

TEST(StackReader, SingleChannelSingleSliceKeepsBothAxes) {
    ScratchDir tmp;
    const auto file = tmp / "one.czi";
    const ImageStack s = makeStack({1, 1, 3, 2}, [](int, int, int y, int x) { return 100 + y * 2 + x; });
    writeStackCzi(file, s, {ChannelMetadata{0, "Only", "#FFFFFFFF"}});

    const DecodedStack d = readStack(file);
    EXPECT_EQ(d.stack.channels(), 1);
    EXPECT_EQ(d.stack.depth(), 1);
    EXPECT_EQ(d.stack.height(), 3);
    EXPECT_EQ(d.stack.width(), 2);
    EXPECT_EQ(d.stack.at(0, 0, 2, 1), 105);
}

TEST(StackReader, MissingFileIsDecodeError) {
    ScratchDir tmp;
    EXPECT_THROW(StackReader(tmp / "nope.czi"), DecodeError);
}

TEST(StackReader, GarbageFileIsDecodeError) {
    ScratchDir tmp;
    const auto file = tmp / "garbage.czi";
    {
        std::ofstream f(file, std::ios::binary);
        for (int i = 0; i < 4096; ++i) f.put(static_cast<char>((i * 31) & 0xFF));
    }
    try {
        StackReader reader(file);
        (void)reader.readPixels();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.stage(), "decode");
    }
}

TEST(StackReader, FewerChannelRecordsThanChannelsIsMetadataError) {
    ScratchDir tmp;
    const auto file = tmp / "short.czi";
    const DecodedStack in = twoChannelStack();
    writeStackCzi(file, in.stack, {in.channels[0]});

    EXPECT_THROW(readStack(file), MetadataError);
}

TEST(StackReader, MoreChannelRecordsThanChannelsIsMetadataError) {
    ScratchDir tmp;
    const auto file = tmp / "long.czi";
    const DecodedStack in = twoChannelStack();
    auto channels = in.channels;
    channels.push_back(ChannelMetadata{2, "Blue", "#FF0000FF"});
    writeStackCzi(file, in.stack, channels);

    EXPECT_THROW(readStack(file), MetadataError);
}

TEST(StackReader, ChannelWithoutColorIsMetadataError) {
    ScratchDir tmp;
    const auto file = tmp / "nocolor.czi";
    const ImageStack s = makeStack({1, 1, 2, 2}, [](int, int, int, int) { return 7; });
    writeStackCzi(file, s, metadataWithChannels("<Channel Id=\"Channel:0\" Name=\"DAPI\"/>"));

    try {
        (void)readStack(file);
        FAIL() << "expected MetadataError";
    } catch (const MetadataError& e) {
        EXPECT_EQ(e.stage(), "metadata");
        EXPECT_NE(std::string(e.what()).find("Color"), std::string::npos);
    }
}

TEST(StackReader, ChannelWithoutNameIsMetadataError) {
    ScratchDir tmp;
    const auto file = tmp / "noname.czi";
    const ImageStack s = makeStack({1, 1, 2, 2}, [](int, int, int, int) { return 7; });
    writeStackCzi(file, s, metadataWithChannels(
        "<Channel Id=\"Channel:0\"><Color>#FFFF0000</Color></Channel>"));

    try {
        (void)readStack(file);
        FAIL() << "expected MetadataError";
    } catch (const MetadataError& e) {
        EXPECT_NE(std::string(e.what()).find("Name"), std::string::npos);
    }
}

TEST(StackReader, NameElementIsAcceptedAndTrimmed) {
    ScratchDir tmp;
    const auto file = tmp / "nameelem.czi";
    const ImageStack s = makeStack({1, 1, 2, 2}, [](int, int, int, int) { return 7; });
    writeStackCzi(file, s, metadataWithChannels(
        "<Channel Id=\"Channel:0\"><Name> EGFP </Name><Color> #FF00FF00 </Color></Channel>"));

    const DecodedStack d = readStack(file);
    ASSERT_EQ(d.channels.size(), 1u);
    EXPECT_EQ(d.channels[0].name, "EGFP");
    EXPECT_EQ(d.channels[0].color, "#FF00FF00");
}

TEST(StackReader, MissingDisplaySettingIsMetadataError) {
    ScratchDir tmp;
    const auto file = tmp / "nodisplay.czi";
    const ImageStack s = makeStack({1, 1, 2, 2}, [](int, int, int, int) { return 7; });
    writeStackCzi(file, s, std::string(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<ImageDocument><Metadata><Information><Image><SizeX>2</SizeX></Image></Information>"
        "</Metadata></ImageDocument>\n"));

    EXPECT_THROW(readStack(file), MetadataError);
}

TEST(StackReader, NonGray8PixelsAreDecodeError) {
    ScratchDir tmp;
    const auto file = tmp / "gray16.czi";
    writeGray16Czi(file);

    try {
        StackReader reader(file);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.stage(), "decode");
        EXPECT_NE(std::string(e.what()).find("Gray8"), std::string::npos);
    }
}

TEST(StackReader, WideTextToUtf8) {
    EXPECT_EQ(wideToUtf8(L"EGFP"), "EGFP");
    EXPECT_EQ(wideToUtf8(L"Gr\u00FCn"), "Gr\xC3\xBCn");
    EXPECT_EQ(wideToUtf8(std::wstring(1, static_cast<wchar_t>(0x1F52C))), "\xF0\x9F\x94\xAC");

    std::wstring bad = L"a";
    bad.push_back(static_cast<wchar_t>(0xD800));
    bad.push_back(static_cast<wchar_t>(0x110000));
    bad.push_back(L'b');
    EXPECT_EQ(wideToUtf8(bad), "a??b");
}

TEST(ConvertFile, EndToEndFromCzi) {
    ScratchDir tmp;
    const auto file = tmp / "synthetic.czi";
    const DecodedStack in = twoChannelStack();
    writeStackCzi(file, in.stack, in.channels);

    const auto out = tmp / "png";
    StackExporter::prepareOutputDir(out);
    ExportOptions o;
    o.verbose = false;
    StackExporter exporter(o);
    const auto files = convertFile(file, out, exporter);

    EXPECT_EQ(files.size(), 10u);
    const auto names = listFileNames(out);
    ASSERT_EQ(names.size(), 10u);
    EXPECT_EQ(names.front(), "synthetic_color_Green_aip.png");
    EXPECT_EQ(names.back(), "synthetic_color_Red_slice_2.png");

    cv::Mat bgr = cv::imread((out / "synthetic_color_Red_slice_1.png").string(), cv::IMREAD_UNCHANGED);
    ASSERT_EQ(bgr.type(), CV_8UC3);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            EXPECT_EQ(bgr.at<cv::Vec3b>(y, x)[0], 0);
            EXPECT_EQ(bgr.at<cv::Vec3b>(y, x)[1], 0);
            EXPECT_EQ(bgr.at<cv::Vec3b>(y, x)[2], in.stack.at(0, 1, y, x));
        }
    }
}

TEST(SyntheticStackSource, DeterministicForSeed) {
    SyntheticStackSource::Options o;
    o.channels = 3;
    o.depth = 4;
    o.width = 48;
    o.height = 32;
    o.seed = 7;

    const DecodedStack a = SyntheticStackSource(o).generate();
    const DecodedStack b = SyntheticStackSource(o).generate();
    EXPECT_EQ(a.stack.shape(), (StackShape{3, 4, 32, 48}));
    ASSERT_EQ(a.channels.size(), 3u);
    EXPECT_EQ(a.channels[2].name, "Blue");
    EXPECT_EQ(a.channels[2].color, "#FF0000FF");
    EXPECT_TRUE(std::equal(a.stack.data().begin(), a.stack.data().end(), b.stack.data().begin()));

    o.seed = 8;
    const DecodedStack c = SyntheticStackSource(o).generate();
    EXPECT_FALSE(std::equal(a.stack.data().begin(), a.stack.data().end(), c.stack.data().begin()));
}

TEST(SyntheticStackSource, PaletteWrapsWithSuffix) {
    EXPECT_EQ(SyntheticStackSource::paletteChannel(0).name, "Red");
    EXPECT_EQ(SyntheticStackSource::paletteChannel(6).name, "Red1");
    EXPECT_EQ(SyntheticStackSource::paletteChannel(6).index, 6);
}
