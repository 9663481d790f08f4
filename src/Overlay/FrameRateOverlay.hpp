#pragma once
#include "FrameCallbacks.hpp"
#include "../Utils/FPSCounter.hpp"
#include "../Utils/OverlayLayout.hpp"
#include <string>

class FrameRateOverlay : public FrameCallbacks {
public:
    void onActivate(const sf::Vector2u& viewport) override;
    void onUpdate(float dt, const sf::Vector2u& viewport) override;
    void onDraw(OverlayRenderer& renderer) override;

    // "60.0 FPS"
    std::string label() const;

    void setVisible(bool visible) { m_visible = visible; }
    bool isVisible() const { return m_visible; }

    const FPSCounter& counter() const { return m_counter; }
    const OverlayLayout& layout() const { return m_layout; }

private:
    FPSCounter m_counter;
    OverlayLayout m_layout;
    bool m_visible = true;
};
