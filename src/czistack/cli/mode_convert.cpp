#include "modes.hpp"
#include "args.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include "czistack/core/Exporter.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int run_convert(int argc, char** argv) {
    const std::string input  = argValue(argc, argv, "input", "");
    const std::string output = argValue(argc, argv, "output", "");
    const bool withManifest  = argHas(argc, argv, "manifest");

    if (input.empty() || output.empty()) {
        std::cerr << "[convert] usage:\n"
                  << "  czistack-cli convert --input=<file.czi|dir> --output=<new dir> [options]\n";
        return 2;
    }

    czistack::ExportOptions opt{};
    try {
        opt = export_options_from_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[convert] " << e.what() << "\n";
        return 2;
    }

    // a directory input converts every *.czi in it into the same output directory
    std::vector<fs::path> files;
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
        files = list_czi_in_folder(input);
        if (files.empty()) {
            std::cerr << "[convert] no .czi files found in '" << input << "'\n";
            return 1;
        }
        const std::string clash = find_stem_collision(files);
        if (!clash.empty()) {
            std::cerr << "[convert] several files in '" << input << "' share the base name '"
                      << clash << "' and would write the same PNG names; rename them first\n";
            return 1;
        }
        std::cout << "[convert] found " << files.size() << " CZI file(s) in " << input << "\n";
    } else {
        files.emplace_back(input);
    }

    std::cout << "[convert] converting all the stack slices to PNG...\n";

    czistack::StackExporter exporter(opt);
    fs::path current = output;
    try {
        czistack::StackExporter::prepareOutputDir(output);

        for (const auto& f : files) {
            current = f;
            const auto produced = czistack::convertFile(f, output, exporter);
            std::cout << "[convert] " << f.filename().string() << ": "
                      << produced.size() << " PNG(s)\n";
        }

        if (withManifest) {
            current = fs::path(output) / "manifest.json";
            std::vector<std::string> inputs;
            for (const auto& f : files) inputs.push_back(f.string());
            const auto artifacts = manifest::collect(exporter.written());
            manifest::write_text_file(current,
                manifest::to_json(inputs, artifacts, manifest::join_argv(argc, argv),
                                  manifest::iso_utc_now()));
            std::cout << "[convert] manifest written to " << current.string() << "\n";
        }
    } catch (const czistack::Error& e) {
        report_failure("convert", current, e, exporter.written().size());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[convert] " << current.string() << ": unexpected error: " << e.what() << "\n";
        if (!exporter.written().empty()) {
            std::cerr << "[convert] " << exporter.written().size()
                      << " file(s) were already written and have been left on disk\n";
        }
        return 1;
    }

    std::cout << "[convert] conversion complete, " << exporter.written().size()
              << " PNG images saved in " << output << "\n";
    return 0;
}
