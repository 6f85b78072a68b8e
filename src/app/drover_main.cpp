#include "drover/drover.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        const juce::ArgumentList args(argc, argv);
        const auto options = drover::DroverApp::parseArguments(args);

        if (options.showHelp) {
            drover::DroverApp::printUsage(std::cout);
            return 0;
        }

        auto& settings = drover::Settings::getInstance();
        if (options.settingsFile) {
            if (!settings.loadFromFile(*options.settingsFile)) {
                std::cerr << "ERROR: Could not read settings file " << *options.settingsFile
                          << std::endl;
                return 1;
            }
        } else if (juce::File::getCurrentWorkingDirectory()
                       .getChildFile(drover::DROVER_DEFAULT_SETTINGS_FILE)
                       .existsAsFile()) {
            if (!settings.loadFromFile(drover::DROVER_DEFAULT_SETTINGS_FILE))
                std::cerr << "Using default settings" << std::endl;
        }

        std::cout << "drover v" << drover::DROVER_VERSION << " - agent process supervisor"
                  << std::endl;

        drover::PosixWorkerLauncher launcher;
        drover::DroverApp app(settings, launcher);
        return app.run(options, std::cin, std::cout);

    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        drover::DroverApp::printUsage(std::cerr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }
}
