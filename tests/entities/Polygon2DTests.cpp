/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE Polygon2DTests
#include <boost/test/unit_test.hpp>

#include "core/EngineContext.hpp"
#include "entities/Polygon2D.hpp"
#include "mocks/RecordingErrorReporter.hpp"
#include "mocks/TestScene.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

std::vector<Vector2D> square(float left, float top, float size) {
    return {Vector2D(left, top), Vector2D(left + size, top),
            Vector2D(left + size, top + size), Vector2D(left, top + size)};
}

void checkVector(const Vector2D& actual, float x, float y) {
    BOOST_TEST_INFO("actual " << actual.toString());
    BOOST_CHECK_SMALL(actual.getX() - x, 1e-3f);
    BOOST_CHECK_SMALL(actual.getY() - y, 1e-3f);
}

} // anonymous namespace

struct PolygonFixture {
    PolyForge::EngineContext context;
    RecordingErrorReporter* reporter{nullptr};

    PolygonFixture() {
        auto recording = std::make_unique<RecordingErrorReporter>();
        reporter = recording.get();
        context.setErrorReporter(std::move(recording));
    }
};

BOOST_FIXTURE_TEST_SUITE(Polygon2DConstructionTests, PolygonFixture)

BOOST_AUTO_TEST_CASE(TestConstructionBuildsGeometry) {
    Polygon2D polygon(context, square(2.0f, 3.0f, 10.0f));

    BOOST_CHECK_EQUAL(polygon.getPoints().size(), 4u);
    BOOST_CHECK(polygon.hasCollisionPath());
    BOOST_REQUIRE_EQUAL(polygon.getBounds().size(), 4u);
    checkVector(polygon.getBound(Boundary::TopLeft), 2.0f, 3.0f);
    checkVector(polygon.getBound(Boundary::TopRight), 12.0f, 3.0f);
    checkVector(polygon.getBound(Boundary::BottomRight), 12.0f, 13.0f);
    checkVector(polygon.getBound(Boundary::BottomLeft), 2.0f, 13.0f);
    checkVector(polygon.getCenter(), 7.0f, 8.0f);

    checkVector(polygon.getTranslation(), 0.0f, 0.0f);
    BOOST_CHECK_EQUAL(polygon.getRotation(), 0.0f);
    checkVector(polygon.getScale(), 1.0f, 1.0f);
    BOOST_CHECK(reporter->getFatals().empty());
}

BOOST_AUTO_TEST_CASE(TestBoundsEncloseIrregularShape) {
    Polygon2D triangle(context, {Vector2D(0.0f, 5.0f), Vector2D(8.0f, 0.0f), Vector2D(4.0f, 9.0f)});

    checkVector(triangle.getBound(Boundary::TopLeft), 0.0f, 0.0f);
    checkVector(triangle.getBound(Boundary::BottomRight), 8.0f, 9.0f);
}

BOOST_AUTO_TEST_CASE(TestTooFewPointsThrows) {
    BOOST_CHECK_THROW(Polygon2D line(context, {Vector2D(0.0f, 0.0f), Vector2D(1.0f, 0.0f)}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Polygon2D empty(context, {}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestColor) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 1.0f), SDL_Color{10, 20, 30, 255});
    BOOST_CHECK_EQUAL(polygon.getColor().g, 20);

    polygon.setColor(SDL_Color{0, 0, 0, 128});
    BOOST_CHECK_EQUAL(polygon.getColor().a, 128);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Polygon2DTransformTests, PolygonFixture)

BOOST_AUTO_TEST_CASE(TestTranslateMovesEverything) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.translate(Vector2D(5.0f, -5.0f));

    checkVector(polygon.getTranslation(), 5.0f, -5.0f);
    checkVector(polygon.getPoints()[0], 5.0f, -5.0f);
    checkVector(polygon.getBound(Boundary::BottomRight), 15.0f, 5.0f);
    // Model outline is untouched
    checkVector(polygon.getModelPoints()[0], 0.0f, 0.0f);

    Polygon2D target(context, square(12.0f, 2.0f, 1.0f));
    BOOST_CHECK(polygon.collidesWith(target));
}

BOOST_AUTO_TEST_CASE(TestRotateAboutCenterKeepsCenter) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.rotate(90.0f);

    BOOST_CHECK_CLOSE(polygon.getRotation(), 90.0f, 0.001f);
    checkVector(polygon.getCenter(), 5.0f, 5.0f);
    checkVector(polygon.getTranslation(), 10.0f, 0.0f);
    // First model vertex swings to the top right corner
    checkVector(polygon.getPoints()[0], 10.0f, 0.0f);
    checkVector(polygon.getPoints()[1], 10.0f, 10.0f);
}

BOOST_AUTO_TEST_CASE(TestRotateAboutExternalPivot) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 2.0f));
    polygon.rotate(180.0f, Vector2D(10.0f, 0.0f));

    checkVector(polygon.getCenter(), 19.0f, -1.0f);
    checkVector(polygon.getTranslation(), 20.0f, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestRotationAccumulates) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    for (int i = 0; i < 4; ++i) {
        polygon.rotate(100.0f);
    }

    BOOST_CHECK_CLOSE(polygon.getRotation(), 400.0f, 0.001f);
    BOOST_CHECK_CLOSE(polygon.getRotationWithin360(), 40.0f, 0.01f);
    checkVector(polygon.getCenter(), 5.0f, 5.0f);
}

BOOST_AUTO_TEST_CASE(TestScaleAboutCenter) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.scale(1.0f);

    checkVector(polygon.getScale(), 2.0f, 2.0f);
    checkVector(polygon.getCenter(), 5.0f, 5.0f);
    checkVector(polygon.getBound(Boundary::TopLeft), -5.0f, -5.0f);
    checkVector(polygon.getBound(Boundary::BottomRight), 15.0f, 15.0f);
}

BOOST_AUTO_TEST_CASE(TestSetScaleIsAbsolute) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.setScale(Vector2D(3.0f, 0.5f));
    polygon.setScale(Vector2D(3.0f, 0.5f));

    checkVector(polygon.getScale(), 3.0f, 0.5f);
    checkVector(polygon.getBound(Boundary::TopLeft), -10.0f, 2.5f);
    checkVector(polygon.getBound(Boundary::BottomRight), 20.0f, 7.5f);
}

BOOST_AUTO_TEST_CASE(TestScaleAfterRotationKeepsPivot) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.rotate(90.0f);
    polygon.scale(Vector2D(1.0f, 1.0f));

    checkVector(polygon.getCenter(), 5.0f, 5.0f);
    checkVector(polygon.getTranslation(), 15.0f, -5.0f);
}

BOOST_AUTO_TEST_CASE(TestCollisionPathFollowsRotation) {
    // Long thin bar that only reaches the target once turned upright
    Polygon2D bar(context, {Vector2D(0.0f, 4.0f), Vector2D(10.0f, 4.0f),
                            Vector2D(10.0f, 6.0f), Vector2D(0.0f, 6.0f)});
    Polygon2D target(context, square(4.5f, 0.5f, 1.0f));

    BOOST_CHECK(!bar.collidesWith(target));
    bar.rotate(90.0f);
    BOOST_CHECK(bar.collidesWith(target));
    BOOST_CHECK(reporter->getErrors().empty());
}

BOOST_AUTO_TEST_CASE(TestWorldPointsMatchTransformation) {
    Polygon2D polygon(context, square(1.0f, 1.0f, 4.0f));
    polygon.translate(Vector2D(3.0f, 7.0f));
    polygon.rotate(33.0f);
    polygon.scale(Vector2D(0.25f, -0.5f));

    PolyForge::Transform2D transform = polygon.getTransformation();
    for (size_t i = 0; i < polygon.getModelPoints().size(); ++i) {
        Vector2D expected = transform.apply(polygon.getModelPoints()[i]);
        checkVector(polygon.getPoints()[i], expected.getX(), expected.getY());
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Polygon2DLifecycleTests, PolygonFixture)

BOOST_AUTO_TEST_CASE(TestRenderWithoutRendererIsHarmless) {
    Polygon2D polygon(context, square(0.0f, 0.0f, 10.0f));
    polygon.render(nullptr, 0.0f, 0.0f);
    polygon.renderAsGUIObject(nullptr);
    BOOST_CHECK(reporter->getErrors().empty());
}

BOOST_AUTO_TEST_CASE(TestDestroyClearsGeometry) {
    auto scene = std::make_shared<TestScene>("PolygonScene", context);
    context.getSceneManager().addScene(scene);

    auto polygon = std::make_shared<Polygon2D>(context, square(0.0f, 0.0f, 10.0f));
    polygon->addAsGameObject(*scene);
    polygon->destroy(*scene);

    BOOST_CHECK(polygon->getPoints().empty());
    BOOST_CHECK(!polygon->hasCollisionPath());
    BOOST_CHECK(polygon->getBounds().empty());
    BOOST_CHECK(scene->getGameObjects().empty());

    // Transforms on a destroyed polygon leave it empty
    polygon->translate(Vector2D(1.0f, 1.0f));
    BOOST_CHECK(polygon->getPoints().empty());
}

BOOST_AUTO_TEST_SUITE_END()
