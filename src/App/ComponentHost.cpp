#include "ComponentHost.hpp"

void ComponentHost::activate(const sf::Vector2u& viewport)
{
    if (m_active) return;
    m_active = true;
    m_viewport = viewport;
    for (auto& c : m_components) c->onActivate(viewport);
}

void ComponentHost::update(float dt, const sf::Vector2u& viewport)
{
    m_viewport = viewport;
    for (auto& c : m_components) c->onUpdate(dt, viewport);
}

void ComponentHost::draw(OverlayRenderer& renderer)
{
    for (auto& c : m_components) c->onDraw(renderer);
}
