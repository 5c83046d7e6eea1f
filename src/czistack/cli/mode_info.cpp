#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "czistack/core/Color.hpp"
#include "czistack/core/Exporter.hpp"
#include "czistack/io/StackReader.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int run_info(int argc, char** argv) {
    const std::string input = argValue(argc, argv, "input", "");
    if (input.empty()) {
        std::cerr << "[info] usage: czistack-cli info --input=<file.czi>\n";
        return 2;
    }

    try {
        czistack::StackReader reader(input);
        const auto& s = reader.shape();
        std::cout << "[info] " << input << "\n"
                  << "[info] shape (C, Z, Y, X) = (" << s.channels << ", " << s.depth << ", "
                  << s.height << ", " << s.width << ")\n";

        const auto channels = reader.readChannels();
        const auto names = czistack::resolveChannelNames(channels, czistack::ExportOptions{});
        std::cout << "[info] " << channels.size() << " display channel(s)"
                  << (static_cast<int>(channels.size()) == s.channels ? "" : "  (MISMATCH with pixel data)")
                  << "\n";

        for (std::size_t i = 0; i < channels.size(); ++i) {
            const auto& ch = channels[i];
            const czistack::Rgba c = czistack::decodeColor(ch.color);
            std::cout << "[info]   #" << ch.index
                      << "  name='" << ch.name << "'"
                      << "  color=" << ch.color
                      << "  rgba=(" << int(c.r) << "," << int(c.g) << "," << int(c.b) << "," << int(c.a) << ")"
                      << "  file-name=" << std::quoted(names[i]) << "\n";
        }
    } catch (const czistack::Error& e) {
        report_failure("info", input, e, 0);
        return 1;
    }
    return 0;
}
