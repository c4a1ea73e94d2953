#include "CommandOptions.hpp"

CommandOptions CommandOptions::parse(int argc, char* argv[], int first) {
    CommandOptions options;

    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() > 1 && arg[0] == '-') {  // This is an option
            if (i + 1 < argc) {  // Make sure we have a value after the option
                options.options[arg] = argv[i + 1];
                i++;  // Skip the next argument since it's the option value
            }
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}
