#include "czistack/io/StackReader.hpp"
#include "czistack/core/Errors.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>

namespace czistack {

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

constexpr libCZI::DimensionIndex kPinnedDims[] = {
    libCZI::DimensionIndex::T, libCZI::DimensionIndex::R,
    libCZI::DimensionIndex::I, libCZI::DimensionIndex::H,
    libCZI::DimensionIndex::V, libCZI::DimensionIndex::B
};

} // namespace

/* libCZI hands XML text out as wide strings (UTF-32 on Linux). */
std::string wideToUtf8(const std::wstring& ws) {
    std::string out;
    out.reserve(ws.size());
    for (wchar_t wc : ws) {
        auto cp = static_cast<std::uint32_t>(wc);
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            out.push_back('?');
        } else if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

StackReader::StackReader(const std::filesystem::path& path)
    : path_(path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw DecodeError("'" + path_.string() + "' is not a readable file");
    }

    try {
        auto stream = libCZI::CreateStreamFromFile(path_.wstring().c_str());
        reader_ = libCZI::CreateCZIReader();
        reader_->Open(stream);
    } catch (const std::exception& e) {
        throw DecodeError("cannot open '" + path_.string() + "' as CZI: " + e.what());
    }

    inspect();
}

StackReader::~StackReader() {
    if (reader_) {
        try { reader_->Close(); }
        catch (const std::exception& e) {
            std::cerr << "[decode] closing " << path_.string() << ": " << e.what() << "\n";
        }
    }
}

void StackReader::inspect() {
    libCZI::SubBlockStatistics stats;
    bool gray8 = true;
    int  badType = 0;
    try {
        stats = reader_->GetStatistics();
        reader_->EnumerateSubBlocks(
            [&](int /*index*/, const libCZI::SubBlockInfo& info) -> bool {
                if (info.pixelType != libCZI::PixelType::Gray8) {
                    gray8 = false;
                    badType = static_cast<int>(info.pixelType);
                    return false;
                }
                return true;
            });
    } catch (const std::exception& e) {
        throw DecodeError("cannot read sub-block directory of '" + path_.string() + "': " + e.what());
    }

    if (stats.subBlockCount <= 0) {
        throw DecodeError("'" + path_.string() + "' contains no image sub-blocks");
    }
    if (!gray8) {
        throw DecodeError("'" + path_.string() + "' has pixel type " + std::to_string(badType)
                          + ", only 8-bit grayscale (Gray8) is supported");
    }

    int start = 0, size = 0;
    if (stats.dimBounds.TryGetInterval(libCZI::DimensionIndex::C, &start, &size)) {
        hasC_ = true; cStart_ = start; shape_.channels = size;
    } else {
        shape_.channels = 1;
    }
    if (stats.dimBounds.TryGetInterval(libCZI::DimensionIndex::Z, &start, &size)) {
        hasZ_ = true; zStart_ = start; shape_.depth = size;
    } else {
        shape_.depth = 1;
    }
    for (auto d : kPinnedDims) {
        if (stats.dimBounds.TryGetInterval(d, &start, &size)) pinned_.emplace_back(d, start);
    }

    roi_ = stats.boundingBoxLayer0Only;
    if (roi_.w <= 0 || roi_.h <= 0 || shape_.channels <= 0 || shape_.depth <= 0) {
        throw DecodeError("'" + path_.string() + "' has an empty layer-0 extent");
    }
    shape_.width  = roi_.w;
    shape_.height = roi_.h;
}

libCZI::CDimCoordinate StackReader::planeCoordinate(int c, int z) const {
    libCZI::CDimCoordinate coord;
    if (hasC_) coord.Set(libCZI::DimensionIndex::C, cStart_ + c);
    if (hasZ_) coord.Set(libCZI::DimensionIndex::Z, zStart_ + z);
    for (const auto& [dim, first] : pinned_) coord.Set(dim, first);
    return coord;
}

ImageStack StackReader::readPixels() {
    ImageStack stack(shape_);

    libCZI::ISingleChannelTileAccessor::Options opt;
    opt.Clear();
    opt.backGroundColor = libCZI::RgbFloatColor{0.0f, 0.0f, 0.0f};

    try {
        auto accessor = reader_->CreateSingleChannelTileAccessor();
        for (int c = 0; c < shape_.channels; ++c) {
            for (int z = 0; z < shape_.depth; ++z) {
                const libCZI::CDimCoordinate coord = planeCoordinate(c, z);
                std::shared_ptr<libCZI::IBitmapData> bmp =
                    accessor->Get(libCZI::PixelType::Gray8, roi_, &coord, &opt);

                const auto sz = bmp->GetSize();
                if (static_cast<int>(sz.w) != shape_.width || static_cast<int>(sz.h) != shape_.height) {
                    throw DecodeError("plane C" + std::to_string(c) + "Z" + std::to_string(z)
                                      + " of '" + path_.string() + "' has unexpected size");
                }

                cv::Mat dst = stack.plane(c, z);
                libCZI::ScopedBitmapLockerSP lck{bmp};
                for (int y = 0; y < shape_.height; ++y) {
                    const auto* src = static_cast<const std::uint8_t*>(lck.ptrDataRoi)
                                      + static_cast<std::size_t>(y) * lck.stride;
                    std::memcpy(dst.ptr<std::uint8_t>(y), src, static_cast<std::size_t>(shape_.width));
                }
            }
        }
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw DecodeError("cannot decode pixels of '" + path_.string() + "': " + e.what());
    }

    std::cout << "[decode] " << path_.filename().string() << ": C=" << shape_.channels
              << " Z=" << shape_.depth << " " << shape_.width << "x" << shape_.height << "\n";
    return stack;
}

std::vector<ChannelMetadata> StackReader::readChannels() {
    std::shared_ptr<libCZI::ICziMetadata> md;
    try {
        auto segment = reader_->ReadMetadataSegment();
        if (segment) md = segment->CreateMetaFromMetadataSegment();
    } catch (const std::exception& e) {
        throw MetadataError("cannot read metadata of '" + path_.string() + "': " + e.what());
    }
    if (!md || !md->IsXmlValid()) {
        throw MetadataError("'" + path_.string() + "' has no valid XML metadata");
    }

    auto channelsNode = md->GetChildNodeReadonly("ImageDocument/Metadata/DisplaySetting/Channels");
    if (!channelsNode) {
        throw MetadataError("'" + path_.string() + "' has no DisplaySetting/Channels metadata");
    }

    // collect first, parse outside of the libCZI callback
    std::vector<std::shared_ptr<libCZI::IXmlNodeRead>> nodes;
    channelsNode->EnumChildren([&](std::shared_ptr<libCZI::IXmlNodeRead> node) -> bool {
        if (node->Name() == L"Channel") nodes.push_back(std::move(node));
        return true;
    });

    std::vector<ChannelMetadata> out;
    out.reserve(nodes.size());
    for (const auto& node : nodes) {
        ChannelMetadata ch;
        ch.index = static_cast<int>(out.size());

        std::wstring value;
        if (node->TryGetAttribute(L"Name", &value)) {
            ch.name = wideToUtf8(value);
        } else {
            auto nameNode = node->GetChildNodeReadonly("Name");
            if (!nameNode || !nameNode->TryGetValue(&value)) {
                throw MetadataError("channel " + std::to_string(ch.index) + " of '"
                                    + path_.string() + "' has no Name");
            }
            ch.name = trim(wideToUtf8(value));
        }

        value.clear();
        auto colorNode = node->GetChildNodeReadonly("Color");
        if (!colorNode || !colorNode->TryGetValue(&value)) {
            throw MetadataError("channel " + std::to_string(ch.index) + " ('" + ch.name
                                + "') of '" + path_.string() + "' has no Color");
        }
        ch.color = trim(wideToUtf8(value));

        out.push_back(std::move(ch));
    }
    return out;
}

DecodedStack StackReader::read() {
    DecodedStack d;
    d.stack = readPixels();
    d.channels = readChannels();
    if (static_cast<int>(d.channels.size()) != d.stack.channels()) {
        throw MetadataError("'" + path_.string() + "' describes " + std::to_string(d.channels.size())
                            + " channel(s) in DisplaySetting but its pixel data has "
                            + std::to_string(d.stack.channels()));
    }
    return d;
}

DecodedStack readStack(const std::filesystem::path& path) {
    StackReader reader(path);
    return reader.read();
}

} // namespace czistack
