#pragma once
#include "Scene.hpp"
#include <SFML/Graphics.hpp>
#include <vector>

// Grilla de fondo y marcadores orbitando.
class DemoScene : public Scene {
public:
    DemoScene(const sf::Vector2u& size, int markerCount);

    void update(float dt) override;
    void draw(sf::RenderTarget& target) const override;
    void resize(const sf::Vector2u& size) override;

    float time() const { return m_time; }
    std::size_t markerCount() const { return m_markers.size(); }

private:
    struct Marker {
        float radius;      // radio de la órbita, en fracción de la dimensión menor
        float speed;       // rad/s
        float phase;
        sf::Color color;
    };

    sf::Vector2u m_size;
    sf::Texture m_gridTexture;
    sf::Sprite m_background;
    std::vector<Marker> m_markers;
    float m_time = 0.f;
};
