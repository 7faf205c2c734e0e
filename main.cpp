#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "app/KindleSenderApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        kindlesender::app::KindleSenderApp app;
        return app.Run(args);
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
