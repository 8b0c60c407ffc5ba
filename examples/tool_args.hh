//
// Command line splitting for pngme_tool
//

#pragma once

#include <string>
#include <vector>

namespace pngme_tool {

    struct tool_args {
        std::vector<std::string> positional;
        bool lenient = false;
    };

    // Flags may appear anywhere; everything else is kept in order
    inline tool_args split_args(int argc, const char* const argv[]) {
        tool_args result;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--lenient") {
                result.lenient = true;
            } else {
                result.positional.push_back(arg);
            }
        }
        return result;
    }

    // A command word plus at least one operand
    inline bool has_command(const tool_args& args) {
        return args.positional.size() >= 2;
    }
}
