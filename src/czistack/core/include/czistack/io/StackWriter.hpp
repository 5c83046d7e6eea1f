#pragma once

#include "czistack/core/Stack.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace czistack {

/*
  Store a stack as an uncompressed Gray8 CZI (libCZI writer).
  One sub-block per (C, Z) plane; channels become
  ImageDocument/Metadata/DisplaySetting/Channels/Channel entries with a
  Name attribute and a Color element, in the given order. The number of
  channel records is written as given, it is not checked against the
  stack. An existing file is overwritten. Throws IOError.
*/
void writeStackCzi(const std::filesystem::path& path,
                   const ImageStack& stack,
                   const std::vector<ChannelMetadata>& channels);

/// Same, with a caller-supplied metadata document written verbatim.
void writeStackCzi(const std::filesystem::path& path,
                   const ImageStack& stack,
                   const std::string& xml);

/// The XML document writeStackCzi() embeds.
std::string buildStackMetadataXml(const StackShape& shape,
                                  const std::vector<ChannelMetadata>& channels);

} // namespace czistack
