#include "DemoScene.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

sf::Texture createGridTexture(unsigned int width, unsigned int height)
{
    sf::RenderTexture rt;
    rt.create(width, height);
    rt.clear(sf::Color(30, 30, 30));
    sf::RectangleShape line;
    line.setFillColor(sf::Color(10, 10, 10));

    // Grosor y paso escalan con la resolución
    float lineThick = std::max(1.0f, (std::max(width, height) / 1080.0f) * 2.0f);
    unsigned int stepSize = std::max(8u, std::max(width, height) / 18);

    line.setSize(sf::Vector2f(lineThick, (float)height));
    for (unsigned int x = 0; x < width; x += stepSize) {
        line.setPosition((float)x, 0.0f); rt.draw(line);
    }
    line.setSize(sf::Vector2f((float)width, lineThick));
    for (unsigned int y = 0; y < height; y += stepSize) {
        line.setPosition(0.0f, (float)y); rt.draw(line);
    }
    rt.display();
    return rt.getTexture();
}

sf::Color lerpColor(const sf::Color& a, const sf::Color& b, float t)
{
    t = std::clamp(t, 0.0f, 1.0f);
    return sf::Color(
        (sf::Uint8)(a.r + (b.r - a.r) * t),
        (sf::Uint8)(a.g + (b.g - a.g) * t),
        (sf::Uint8)(a.b + (b.b - a.b) * t),
        (sf::Uint8)(a.a + (b.a - a.a) * t)
    );
}

}

DemoScene::DemoScene(const sf::Vector2u& size, int markerCount)
{
    const sf::Color from(0, 255, 255);
    const sf::Color to(255, 0, 255);

    for (int i = 0; i < markerCount; ++i) {
        float t = markerCount > 1 ? (float)i / (markerCount - 1) : 0.0f;
        m_markers.push_back({ 0.1f + 0.3f * t, 0.6f + 0.25f * i, 6.2831853f * t, lerpColor(from, to, t) });
    }

    resize(size);
    std::cout << "[SCENE] Loaded " << m_markers.size() << " markers at " << size.x << "x" << size.y << std::endl;
}

void DemoScene::update(float dt)
{
    m_time += dt;
}

void DemoScene::resize(const sf::Vector2u& size)
{
    if (size.x == 0 || size.y == 0) return; // ventana minimizada
    m_size = size;
    m_gridTexture = createGridTexture(size.x, size.y);
    m_background.setTexture(m_gridTexture, true);
}

void DemoScene::draw(sf::RenderTarget& target) const
{
    target.draw(m_background);

    float minDimension = (float)std::min(m_size.x, m_size.y);
    sf::Vector2f center(m_size.x * 0.5f, m_size.y * 0.5f);
    sf::CircleShape dot(minDimension / 60.0f);
    dot.setOrigin(dot.getRadius(), dot.getRadius());

    for (const auto& m : m_markers) {
        float angle = m.phase + m.speed * m_time;
        float r = m.radius * minDimension;
        dot.setPosition(center.x + std::cos(angle) * r, center.y + std::sin(angle) * r);
        dot.setFillColor(m.color);
        target.draw(dot);
    }
}
