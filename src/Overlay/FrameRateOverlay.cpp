#include "FrameRateOverlay.hpp"
#include "../Render/OverlayRenderer.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

void FrameRateOverlay::onActivate(const sf::Vector2u& viewport)
{
    m_layout.recompute(static_cast<int>(viewport.x), static_cast<int>(viewport.y));

    const sf::IntRect& box = m_layout.bounds();
    std::cout << "[FPS] Overlay activo: " << box.width << "x" << box.height
              << " @ (" << box.left << "," << box.top << "), font " << m_layout.fontSize() << std::endl;
}

void FrameRateOverlay::onUpdate(float dt, const sf::Vector2u& viewport)
{
    m_counter.onFrame(dt);
    m_layout.onFrame(static_cast<int>(viewport.x), static_cast<int>(viewport.y));
}

void FrameRateOverlay::onDraw(OverlayRenderer& renderer)
{
    if (!m_visible) return;
    renderer.drawLabeledBox(m_layout.bounds(), label(), m_layout.fontSize(), sf::Color::White);
}

std::string FrameRateOverlay::label() const
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << m_counter.rate() << " FPS";
    return ss.str();
}
