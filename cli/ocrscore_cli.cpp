#include "ocrscore/settings.h"
#include "ocrscore/runner.h"

#include <iostream>

using namespace ocrscore;

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);

        ScoreSettings settings;
        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        return run(settings, std::cout, std::cerr);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
