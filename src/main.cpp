#include "cnc/application/controllers/ApplicationController.hpp"
#include "cnc/logger/Logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    try {
        cnc::Logger::init();

        std::vector<std::string> args(argv, argv + argc);
        cnc::application::ApplicationController app(std::cout, std::cerr);
        return static_cast<int>(app.run(args));
    } catch (const std::exception &ex) {
        cnc::Logger::logError("Fatal error: " + std::string(ex.what()));
        return static_cast<int>(cnc::application::ExitCode::Fatal);
    }
}
