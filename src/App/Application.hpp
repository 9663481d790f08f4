#pragma once
#include "AppConfig.hpp"
#include "Session.hpp"
#include "../Render/OverlayRenderer.hpp"
#include <SFML/Graphics.hpp>
#include <memory>

class FrameRateOverlay;

// Sesión de larga vida: ventana, escena activa y componentes persistentes.
class Application {
public:
    explicit Application(const AppConfig& cfg);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();

    // Reemplaza solo la escena; los componentes del host siguen vivos.
    void reloadScene();

private:
    void handleEvent(const sf::Event& event);
    void createRenderer();

    AppConfig m_cfg;
    sf::RenderWindow m_window;
    sf::Font m_font;
    std::unique_ptr<OverlayRenderer> m_renderer;
    Session m_session;
    FrameRateOverlay* m_overlay = nullptr; // propiedad de m_session
};
