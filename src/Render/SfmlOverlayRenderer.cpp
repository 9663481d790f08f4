#include "SfmlOverlayRenderer.hpp"

SfmlOverlayRenderer::SfmlOverlayRenderer(sf::RenderTarget& target, const sf::Font& font, sf::Color boxColor)
    : m_target(target)
{
    m_box.setFillColor(boxColor);
    m_text.setFont(font);
}

void SfmlOverlayRenderer::drawLabeledBox(const sf::IntRect& bounds, const std::string& text,
                                         unsigned int fontSize, const sf::Color& textColor)
{
    m_box.setPosition(static_cast<float>(bounds.left), static_cast<float>(bounds.top));
    m_box.setSize(sf::Vector2f(static_cast<float>(bounds.width), static_cast<float>(bounds.height)));

    m_text.setString(text);
    m_text.setCharacterSize(fontSize);
    m_text.setFillColor(textColor);
    m_text.setPosition(static_cast<float>(bounds.left), static_cast<float>(bounds.top));

    // El overlay va en píxeles de pantalla, sin importar la cámara de la escena
    sf::View sceneView = m_target.getView();
    m_target.setView(m_target.getDefaultView());
    m_target.draw(m_box);
    m_target.draw(m_text);
    m_target.setView(sceneView);
}
