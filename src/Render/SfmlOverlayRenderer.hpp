#pragma once
#include "OverlayRenderer.hpp"
#include <SFML/Graphics.hpp>

// Backend nativo: RectangleShape + Text sobre cualquier RenderTarget.
// La fuente es del caller y tiene que vivir más que el renderer.
class SfmlOverlayRenderer : public OverlayRenderer {
public:
    explicit SfmlOverlayRenderer(sf::RenderTarget& target, const sf::Font& font,
                                 sf::Color boxColor = sf::Color(0, 0, 0, 160));

    void drawLabeledBox(const sf::IntRect& bounds, const std::string& text,
                        unsigned int fontSize, const sf::Color& textColor) override;

private:
    sf::RenderTarget& m_target;
    sf::RectangleShape m_box;
    sf::Text m_text;
};
