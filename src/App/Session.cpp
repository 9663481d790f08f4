#include "Session.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

Session::Session(SceneFactory factory)
    : m_factory(std::move(factory))
{
    if (!m_factory) throw std::invalid_argument("Session needs a scene factory.");
    m_scene = makeScene();
}

std::unique_ptr<Scene> Session::makeScene()
{
    std::unique_ptr<Scene> scene = m_factory();
    if (!scene) throw std::runtime_error("Scene factory returned no scene.");
    return scene;
}

void Session::reloadScene()
{
    // Si la fábrica falla, la escena vieja sigue en pie
    m_scene = makeScene();
    ++m_sceneGeneration;
    std::cout << "[SCENE] Reload #" << m_sceneGeneration << std::endl;
}

void Session::update(float dt, const sf::Vector2u& viewport)
{
    m_components.update(dt, viewport);
    m_scene->update(dt);
}

void Session::draw(sf::RenderTarget& target, OverlayRenderer& renderer)
{
    m_scene->draw(target);
    m_components.draw(renderer);
}
