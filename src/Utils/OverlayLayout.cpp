#include "OverlayLayout.hpp"
#include <algorithm>
#include <cstdlib>

bool OverlayLayout::onFrame(int viewportWidth, int viewportHeight)
{
    int maxDimension = std::max(viewportWidth, viewportHeight);
    if (std::abs(m_referenceSize - maxDimension) <= ResizeThreshold) return false;

    recompute(viewportWidth, viewportHeight);
    return true;
}

void OverlayLayout::recompute(int viewportWidth, int viewportHeight)
{
    m_referenceSize = std::max(viewportWidth, viewportHeight);
    m_bounds = sf::IntRect(Margin, Margin, m_referenceSize / 10, m_referenceSize / 30);
    m_fontSize = static_cast<unsigned int>(m_referenceSize / 36);
}
