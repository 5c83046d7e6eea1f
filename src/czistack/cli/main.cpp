#include "modes.hpp"
#include "args.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - convert  : CZI file or folder -> per-channel MIP, AIP and slice PNGs.
    - info     : show what a CZI file decodes to.
    - simulate : write a synthetic CZI Z-stack.
  Without a mode word ("czistack-cli --input X --output Y") convert runs.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  czistack-cli convert  --input=<file.czi|dir> --output=<new dir>\n"
        << "                        [--no-mip] [--no-aip] [--no-slices] [--manifest] [--quiet]\n"
        << "                        [--unsafe-names=sanitize|reject] [--duplicate-names=index|reject]\n"
        << "                        [--png-compression=0..9]\n"
        << "  czistack-cli info     --input=<file.czi>\n"
        << "  czistack-cli simulate --output=<file.czi> [--channels=2] [--depth=5] [--size=256x256]\n"
        << "                        [--blobs=12] [--seed=1]\n"
        << "     the output directory of convert must not exist; it is created.\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 2; }
    const std::string mode = argv[1];

    if      (mode == "convert")  return run_convert (argc, argv);
    else if (mode == "info")     return run_info    (argc, argv);
    else if (mode == "simulate") return run_simulate(argc, argv);
    else if (isOptionToken(mode)) {
        if (mode == "--help") { print_usage(); return 0; }
        return run_convert(argc, argv);
    }

    std::cerr << "Unknown mode: " << mode << "\n";
    print_usage();
    return 2;
}
