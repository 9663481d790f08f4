#pragma once
#include "Overlay/FrameCallbacks.hpp"
#include "Render/OverlayRenderer.hpp"
#include <gmock/gmock.h>

class MockFrameCallbacks : public FrameCallbacks {
public:
    MOCK_METHOD(void, onActivate, (const sf::Vector2u& viewport), (override));
    MOCK_METHOD(void, onUpdate, (float dt, const sf::Vector2u& viewport), (override));
    MOCK_METHOD(void, onDraw, (OverlayRenderer& renderer), (override));
};
