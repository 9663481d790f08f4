#pragma once
#include <SFML/System/Vector2.hpp>

class OverlayRenderer;

// Ganchos por frame que el Application le da a cada componente.
// Orden fijo por frame: onUpdate de todos, escena, onDraw de todos.
class FrameCallbacks {
public:
    virtual ~FrameCallbacks() = default;

    virtual void onActivate(const sf::Vector2u& viewport) = 0;
    virtual void onUpdate(float dt, const sf::Vector2u& viewport) = 0;
    virtual void onDraw(OverlayRenderer& renderer) = 0;
};
