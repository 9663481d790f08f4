#pragma once
#include "ComponentHost.hpp"
#include "Scene.hpp"
#include <functional>
#include <memory>

// Lo que vive mientras vive la ventana: los componentes del host y la
// escena activa. Una recarga cambia la escena y nada más.
class Session {
public:
    using SceneFactory = std::function<std::unique_ptr<Scene>()>;

    explicit Session(SceneFactory factory);

    ComponentHost& components() { return m_components; }
    Scene& scene() { return *m_scene; }
    int sceneGeneration() const { return m_sceneGeneration; }

    void reloadScene();

    // Orden fijo: componentes y después escena en update,
    // escena y después componentes en draw.
    void update(float dt, const sf::Vector2u& viewport);
    void draw(sf::RenderTarget& target, OverlayRenderer& renderer);

private:
    std::unique_ptr<Scene> makeScene();

    SceneFactory m_factory;
    ComponentHost m_components;
    std::unique_ptr<Scene> m_scene;
    int m_sceneGeneration = 0;
};
