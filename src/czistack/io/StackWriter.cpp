#include "czistack/io/StackWriter.hpp"
#include "czistack/core/Errors.hpp"

#include <libCZI.h>

#include <sstream>

namespace czistack {

namespace {
std::string xmlEscape(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '&':  o += "&amp;";  break;
            case '<':  o += "&lt;";   break;
            case '>':  o += "&gt;";   break;
            case '"':  o += "&quot;"; break;
            case '\'': o += "&apos;"; break;
            default:   o += c;
        }
    }
    return o;
}
} // namespace

std::string buildStackMetadataXml(const StackShape& shape,
                                  const std::vector<ChannelMetadata>& channels)
{
    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
       << "<ImageDocument>\n"
       << " <Metadata>\n"
       << "  <Information>\n"
       << "   <Image>\n"
       << "    <PixelType>Gray8</PixelType>\n"
       << "    <SizeX>" << shape.width    << "</SizeX>\n"
       << "    <SizeY>" << shape.height   << "</SizeY>\n"
       << "    <SizeZ>" << shape.depth    << "</SizeZ>\n"
       << "    <SizeC>" << shape.channels << "</SizeC>\n"
       << "   </Image>\n"
       << "  </Information>\n"
       << "  <DisplaySetting>\n"
       << "   <Channels>\n";
    for (std::size_t i = 0; i < channels.size(); ++i) {
        os << "    <Channel Id=\"Channel:" << i << "\" Name=\"" << xmlEscape(channels[i].name) << "\">\n"
           << "     <Color>" << xmlEscape(channels[i].color) << "</Color>\n"
           << "    </Channel>\n";
    }
    os << "   </Channels>\n"
       << "  </DisplaySetting>\n"
       << " </Metadata>\n"
       << "</ImageDocument>\n";
    return os.str();
}

void writeStackCzi(const std::filesystem::path& path,
                   const ImageStack& stack,
                   const std::vector<ChannelMetadata>& channels)
{
    writeStackCzi(path, stack, buildStackMetadataXml(stack.shape(), channels));
}

void writeStackCzi(const std::filesystem::path& path,
                   const ImageStack& stack,
                   const std::string& xml)
{
    if (stack.empty()) {
        throw IOError("refusing to write an empty stack to '" + path.string() + "'");
    }

    try {
        auto out = libCZI::CreateOutputStreamForFile(path.wstring().c_str(), true);
        auto writer = libCZI::CreateCZIWriter();
        auto info = std::make_shared<libCZI::CCziWriterInfo>(
            libCZI::GUID{0x5a1c0e2d, 0x7b3f, 0x4c19, {0x9e, 0x21, 0x43, 0x7a, 0x11, 0xc5, 0x08, 0x6d}});
        writer->Create(out, info);

        for (int c = 0; c < stack.channels(); ++c) {
            for (int z = 0; z < stack.depth(); ++z) {
                const cv::Mat plane = stack.plane(c, z);

                libCZI::AddSubBlockInfoStridedBitmap sb;
                sb.Clear();
                sb.coordinate.Set(libCZI::DimensionIndex::C, c);
                sb.coordinate.Set(libCZI::DimensionIndex::Z, z);
                sb.mIndexValid    = false;
                sb.x              = 0;
                sb.y              = 0;
                sb.logicalWidth   = stack.width();
                sb.logicalHeight  = stack.height();
                sb.physicalWidth  = stack.width();
                sb.physicalHeight = stack.height();
                sb.PixelType      = libCZI::PixelType::Gray8;
                sb.ptrBitmap      = plane.data;
                sb.strideBitmap   = static_cast<std::uint32_t>(plane.step[0]);
                writer->SyncAddSubBlock(sb);
            }
        }

        libCZI::WriteMetadataInfo md;
        md.Clear();
        md.szMetadata     = xml.c_str();
        md.szMetadataSize = xml.size();
        writer->SyncWriteMetadata(md);

        writer->Close();
    } catch (const std::exception& e) {
        throw IOError("cannot write CZI '" + path.string() + "': " + e.what());
    }
}

} // namespace czistack
