#pragma once
#include "OverlayRenderer.hpp"

// Backend de respaldo: dibuja en la foreground draw list de ImGui con la
// fuente por defecto, así no hace falta ningún .ttf en disco.
// Solo se puede usar entre ImGui::SFML::Update y ImGui::SFML::Render.
class ImGuiOverlayRenderer : public OverlayRenderer {
public:
    void drawLabeledBox(const sf::IntRect& bounds, const std::string& text,
                        unsigned int fontSize, const sf::Color& textColor) override;
};
