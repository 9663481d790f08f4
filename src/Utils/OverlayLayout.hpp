#pragma once
#include <SFML/Graphics/Rect.hpp>

// Caja y fuente del overlay derivadas de la dimensión mayor de la ventana.
class OverlayLayout {
public:
    static constexpr int Margin = 10;
    static constexpr int ResizeThreshold = 10; // px de tolerancia

    // Recalcula solo si la dimensión mayor cambió más que ResizeThreshold.
    bool onFrame(int viewportWidth, int viewportHeight);
    void recompute(int viewportWidth, int viewportHeight);

    int referenceSize() const { return m_referenceSize; }
    const sf::IntRect& bounds() const { return m_bounds; }
    unsigned int fontSize() const { return m_fontSize; }

private:
    int m_referenceSize = 0;
    sf::IntRect m_bounds;
    unsigned int m_fontSize = 0;
};
