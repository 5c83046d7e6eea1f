#pragma once
#include "czistack/core/Config.hpp"
#include "czistack/core/Errors.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/*
  Helpers shared by the CLI modes.
*/

/* All regular files with a .czi extension (any case) in 'folder', sorted by name. */
std::vector<std::filesystem::path> list_czi_in_folder(const std::filesystem::path& folder);

/* First base name shared (ignoring case) by two of 'files', or "" if all
   differ. Such files would write the same PNG names into one directory. */
std::string find_stem_collision(const std::vector<std::filesystem::path>& files);

/* Build export options from --no-mip/--no-aip/--no-slices/--quiet,
   --unsafe-names, --duplicate-names and --png-compression.
   Throws std::invalid_argument for unknown policy words. */
czistack::ExportOptions export_options_from_args(int argc, char** argv);

/* Print "[mode] <file>: <stage> error: <message>" and, when files were
   already written, a note that they were left on disk. */
void report_failure(const std::string& mode, const std::filesystem::path& file,
                    const czistack::Error& e, std::size_t writtenSoFar);
