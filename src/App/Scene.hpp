#pragma once
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/System/Vector2.hpp>

// Contenido que se destruye y recrea en cada recarga.
// Nada que deba sobrevivir a la recarga puede vivir acá.
class Scene {
public:
    virtual ~Scene() = default;

    virtual void update(float dt) = 0;
    virtual void draw(sf::RenderTarget& target) const = 0;
    virtual void resize(const sf::Vector2u& size) = 0;
};
