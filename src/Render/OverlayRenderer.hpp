#pragma once
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <string>

// Lo único que el overlay necesita del host para dibujarse.
class OverlayRenderer {
public:
    virtual ~OverlayRenderer() = default;

    virtual void drawLabeledBox(const sf::IntRect& bounds, const std::string& text,
                                unsigned int fontSize, const sf::Color& textColor) = 0;
};
