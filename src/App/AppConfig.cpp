#include "AppConfig.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

bool AppConfig::loadFromFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[CFG] Config not found: " << filename << " (using defaults)" << std::endl;
        return false;
    }

    loadFromStream(file);
    std::cout << "[CFG] Loaded " << filename << std::endl;
    return true;
}

void AppConfig::loadFromStream(std::istream& in)
{
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        std::stringstream ss(line);
        std::string key;
        if (!(ss >> key) || key[0] == '#') continue;

        bool ok = true;
        if (key == "WINDOW") {
            int w, h;
            ok = static_cast<bool>(ss >> w >> h) && w > 0 && h > 0;
            if (ok) { width = static_cast<unsigned int>(w); height = static_cast<unsigned int>(h); }
        }
        else if (key == "TITLE") {
            std::string rest;
            std::getline(ss >> std::ws, rest);
            ok = !rest.empty();
            if (ok) title = rest;
        }
        else if (key == "FRAMELIMIT") {
            int limit;
            ok = static_cast<bool>(ss >> limit);
            if (ok) frameLimit = limit;
        }
        else if (key == "VSYNC") {
            bool on;
            ok = static_cast<bool>(ss >> on);
            if (ok) vsync = on;
        }
        else if (key == "FONT") {
            std::string path;
            ok = static_cast<bool>(ss >> path);
            if (ok) fontPath = path;
        }
        else if (key == "BACKEND") {
            std::string name;
            ok = static_cast<bool>(ss >> name);
            if (ok) backend = name;
        }
        else if (key == "VISIBLE") {
            bool on;
            ok = static_cast<bool>(ss >> on);
            if (ok) overlayVisible = on;
        }
        else if (key == "MARKERS") {
            int count;
            ok = static_cast<bool>(ss >> count);
            if (ok) markerCount = count;
        }
        else {
            std::cerr << "[CFG] Line " << lineNumber << ": unknown key '" << key << "'" << std::endl;
            continue;
        }

        if (!ok) {
            std::cerr << "[CFG] Line " << lineNumber << ": bad value for " << key << ", ignored" << std::endl;
        }
    }

    clampToValidRanges();
}

void AppConfig::clampToValidRanges()
{
    width = std::clamp(width, 160u, MaxWindowSize);
    height = std::clamp(height, 120u, MaxWindowSize);
    frameLimit = std::clamp(frameLimit, 0, 1000);
    markerCount = std::clamp(markerCount, 0, 64);

    for (char& ch : backend)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (backend != "sfml" && backend != "imgui") {
        std::cerr << "[CFG] Invalid BACKEND '" << backend << "' -> using 'sfml'" << std::endl;
        backend = "sfml";
    }
}
