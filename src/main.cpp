// main.cpp - cmus-auto-lyrics entry point
// Lyrics for whatever cmus is playing, scrolled along with the song.

#include "core/Application.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        cal::Application app(argc, argv);

        // Parse command line arguments
        auto optsResult = app.parseArgs();
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        auto opts = std::move(*optsResult);

        auto initResult = app.init(opts);
        if (!initResult) {
            std::cerr << "Initialization failed: "
                      << initResult.error().message << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
