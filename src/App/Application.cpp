#include "Application.hpp"
#include "DemoScene.hpp"
#include "../Overlay/FrameRateOverlay.hpp"
#include "../Render/ImGuiOverlayRenderer.hpp"
#include "../Render/SfmlOverlayRenderer.hpp"
#include <imgui.h>
#include <imgui-SFML.h>
#include <iostream>
#include <stdexcept>

Application::Application(const AppConfig& cfg)
    : m_cfg(cfg)
    , m_window(sf::VideoMode(cfg.width, cfg.height), cfg.title)
    , m_session([this]() -> std::unique_ptr<Scene> {
          return std::make_unique<DemoScene>(m_window.getSize(), m_cfg.markerCount);
      })
{
    m_window.setVerticalSyncEnabled(m_cfg.vsync);
    if (m_cfg.frameLimit > 0) m_window.setFramerateLimit(static_cast<unsigned int>(m_cfg.frameLimit));

    if (!ImGui::SFML::Init(m_window)) {
        throw std::runtime_error("ImGui-SFML init failed.");
    }

    createRenderer();

    m_overlay = &m_session.components().add<FrameRateOverlay>();
    m_overlay->setVisible(m_cfg.overlayVisible);
}

Application::~Application()
{
    ImGui::SFML::Shutdown();
}

void Application::createRenderer()
{
    if (m_cfg.backend == "sfml") {
        if (m_font.loadFromFile(m_cfg.fontPath)) {
            m_renderer = std::make_unique<SfmlOverlayRenderer>(m_window, m_font);
            std::cout << "[APP] Overlay backend: sfml (" << m_cfg.fontPath << ")" << std::endl;
            return;
        }
        std::cerr << "[APP] Font not found: " << m_cfg.fontPath << " -> falling back to imgui" << std::endl;
        m_cfg.backend = "imgui";
    }

    m_renderer = std::make_unique<ImGuiOverlayRenderer>();
    std::cout << "[APP] Overlay backend: imgui" << std::endl;
}

void Application::reloadScene()
{
    m_session.reloadScene();
    std::cout << "[SCENE] Overlay sigue en " << m_overlay->label() << std::endl;
}

void Application::handleEvent(const sf::Event& event)
{
    if (event.type == sf::Event::Closed) m_window.close();
    if (event.type == sf::Event::Resized) {
        // Mantener 1 unidad = 1 píxel tras el resize
        sf::FloatRect visibleArea(0.f, 0.f, (float)event.size.width, (float)event.size.height);
        m_window.setView(sf::View(visibleArea));
        m_session.scene().resize(sf::Vector2u(event.size.width, event.size.height));
    }
    if (event.type == sf::Event::KeyPressed) {
        switch (event.key.code) {
            case sf::Keyboard::Escape: m_window.close(); break;
            case sf::Keyboard::F1: m_overlay->setVisible(!m_overlay->isVisible()); break;
            case sf::Keyboard::R: reloadScene(); break;
            default: break;
        }
    }
}

int Application::run()
{
    m_session.components().activate(m_window.getSize());
    std::cout << "[APP] Running. F1 = overlay, R = reload scene, Esc = quit." << std::endl;

    sf::Clock clock;
    while (m_window.isOpen()) {
        sf::Event event;
        while (m_window.pollEvent(event)) {
            ImGui::SFML::ProcessEvent(m_window, event);
            handleEvent(event);
        }
        if (!m_window.isOpen()) break;

        sf::Time dt = clock.restart();
        float dtSec = dt.asSeconds();
        ImGui::SFML::Update(m_window, dt);

        m_session.update(dtSec, m_window.getSize());

        m_window.clear(sf::Color(20, 20, 20));
        m_session.draw(m_window, *m_renderer);
        ImGui::SFML::Render(m_window);
        m_window.display();
    }

    std::cout << "[APP] Closed. Last reading: " << m_overlay->label() << std::endl;
    return 0;
}
