#pragma once
#include <istream>
#include <string>

struct AppConfig {
    static constexpr unsigned int MaxWindowSize = 16384;

    // Ventana
    unsigned int width = 1280;
    unsigned int height = 720;
    std::string title = "FrameRateOverlay";
    int frameLimit = 0; // 0 = sin límite
    bool vsync = false;

    // Overlay
    std::string fontPath = "assets/DejaVuSans.ttf";
    std::string backend = "sfml"; // sfml|imgui
    bool overlayVisible = true;

    // Escena demo
    int markerCount = 6;

    // Formato: una línea "CLAVE valor..." por opción, '#' para comentarios.
    // Si el archivo no existe quedan los defaults. Devuelve false en ese caso.
    bool loadFromFile(const std::string& filename);
    void loadFromStream(std::istream& in);

    void clampToValidRanges();
};
