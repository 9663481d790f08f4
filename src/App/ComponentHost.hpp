#pragma once
#include "../Overlay/FrameCallbacks.hpp"
#include <memory>
#include <utility>
#include <vector>

// Dueño de los componentes de larga vida. Vive en el Application, no en la
// Scene, así una recarga de escena no los toca.
class ComponentHost {
public:
    // Si el host ya está activo, el componente se activa en el momento.
    template <typename T, typename... Args>
    T& add(Args&&... args)
    {
        auto component = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *component;
        if (m_active) ref.onActivate(m_viewport);
        m_components.push_back(std::move(component));
        return ref;
    }

    void activate(const sf::Vector2u& viewport);
    void update(float dt, const sf::Vector2u& viewport);
    void draw(OverlayRenderer& renderer);

    bool isActive() const { return m_active; }
    std::size_t size() const { return m_components.size(); }

private:
    std::vector<std::unique_ptr<FrameCallbacks>> m_components;
    sf::Vector2u m_viewport;
    bool m_active = false;
};
