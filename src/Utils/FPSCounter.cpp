#include "FPSCounter.hpp"
#include <cmath>

namespace {
// std::round redondea los medios alejándose del cero (60.05 -> 60.1)
double roundToTenths(double value)
{
    return std::round(value * 10.0) / 10.0;
}
}

bool FPSCounter::onFrame(float dt)
{
    ++m_frames;
    m_elapsed += dt;
    if (m_elapsed < UpdateInterval) return false;

    float perSecond = m_elapsed > 0.f ? m_frames / m_elapsed : 0.f;
    m_rate = roundToTenths(static_cast<double>(perSecond));
    m_frames = 0;
    m_elapsed = 0.f;
    return true;
}
