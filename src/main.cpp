#include "App/AppConfig.hpp"
#include "App/Application.hpp"
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config/overlay.cfg";

    AppConfig cfg;
    cfg.loadFromFile(configPath);

    std::cout << "[APP] " << cfg.title << "  size=" << cfg.width << "x" << cfg.height
              << "  limit=" << cfg.frameLimit << "  vsync=" << cfg.vsync
              << "  backend=" << cfg.backend << std::endl;

    try {
        Application app(cfg);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "[APP] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
