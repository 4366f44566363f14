/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_DRAWABLE_HPP
#define MOCK_DRAWABLE_HPP

#include "entities/Drawable.hpp"
#include "scenes/Scene.hpp"
#include <optional>
#include <string>
#include <vector>

// Drawable with directly stored transform state and test access to the
// protected geometry setters. Starts without a collision path.
class MockDrawable : public Drawable {
public:
    explicit MockDrawable(PolyForge::EngineContext& context) : Drawable(context) {
        setBounds({Vector2D(0.0f, 0.0f), Vector2D(10.0f, 0.0f),
                   Vector2D(10.0f, 10.0f), Vector2D(0.0f, 10.0f)});
    }

    Vector2D getTranslation() const override { return m_translation; }
    float getRotation() const override { return m_rotation; }
    Vector2D getScale() const override { return m_scale; }

    void translate(const Vector2D& translationMod) override {
        ++m_translateCalls;
        m_translation += translationMod;
        translateBounds(translationMod);
        if (m_collisionPath.has_value()) {
            m_collisionPath->translate(translationMod);
        }
    }

    void rotate(float rotationMod, const Vector2D& centerpoint) override {
        m_rotation += rotationMod;
        m_lastPivot = centerpoint;
    }

    void scale(const Vector2D& scaleMod, const Vector2D& centerpoint) override {
        m_scale += scaleMod;
        m_lastPivot = centerpoint;
    }

    using Drawable::rotate;
    using Drawable::scale;

    void render(SDL_Renderer*, float, float) override { ++m_renderCalls; }
    void renderAsGUIObject(SDL_Renderer*) override { ++m_guiRenderCalls; }

    void destroy(Scene& originScene) override { destroyTheRest(originScene); }

    std::string getName() const override { return "MockDrawable"; }

    // Test access
    void setTestBounds(std::vector<Vector2D> bounds) { setBounds(std::move(bounds)); }
    void setTestCollisionPath(std::optional<PolyForge::CollisionPath> path) {
        setCollisionPath(std::move(path));
    }

    int getTranslateCalls() const { return m_translateCalls; }
    int getRenderCalls() const { return m_renderCalls; }
    int getGUIRenderCalls() const { return m_guiRenderCalls; }
    const Vector2D& getLastPivot() const { return m_lastPivot; }

private:
    Vector2D m_translation{0.0f, 0.0f};
    float m_rotation{0.0f};
    Vector2D m_scale{1.0f, 1.0f};
    Vector2D m_lastPivot{0.0f, 0.0f};
    int m_translateCalls{0};
    int m_renderCalls{0};
    int m_guiRenderCalls{0};
};

#endif // MOCK_DRAWABLE_HPP
