/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SceneManagerTests
#include <boost/test/unit_test.hpp>

#include "core/EngineContext.hpp"
#include "managers/SceneManager.hpp"
#include "managers/TagManager.hpp"
#include "mocks/MockBehavior.hpp"
#include "mocks/MockDrawable.hpp"
#include "mocks/TestScene.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

struct SceneManagerFixture {
    PolyForge::EngineContext context;
    SceneManager& manager;
    std::shared_ptr<TestScene> title;
    std::shared_ptr<TestScene> level;

    SceneManagerFixture() : manager(context.getSceneManager()) {
        title = std::make_shared<TestScene>("Title", context);
        level = std::make_shared<TestScene>("Level", context);
        manager.addScene(title);
        manager.addScene(level);
    }
};

BOOST_FIXTURE_TEST_SUITE(SceneRegistrationTests, SceneManagerFixture)

BOOST_AUTO_TEST_CASE(TestAddScene) {
    BOOST_CHECK_EQUAL(manager.getSceneCount(), 2u);
    BOOST_CHECK(manager.hasScene("Title"));
    BOOST_CHECK_EQUAL(manager.getScene("Level"), level);
    BOOST_CHECK(manager.getScene("Missing") == nullptr);
    BOOST_CHECK(context.getTagManager().hasTaggableEntityList(*title));
}

BOOST_AUTO_TEST_CASE(TestDuplicateNameThrows) {
    auto duplicate = std::make_shared<TestScene>("Title", context);
    BOOST_CHECK_THROW(manager.addScene(duplicate), std::runtime_error);
    BOOST_CHECK_EQUAL(manager.getScene("Title"), title);
    BOOST_CHECK(!context.getTagManager().hasTaggableEntityList(*duplicate));
}

BOOST_AUTO_TEST_CASE(TestNullSceneIsIgnored) {
    manager.addScene(nullptr);
    BOOST_CHECK_EQUAL(manager.getSceneCount(), 2u);
}

BOOST_AUTO_TEST_CASE(TestRemoveCurrentSceneUnloadsIt) {
    BOOST_REQUIRE(manager.switchScenes("Title"));
    manager.removeScene("Title");

    BOOST_CHECK_EQUAL(title->getUnloadCount(), 1);
    BOOST_CHECK(!title->isInitialized());
    BOOST_CHECK(manager.getCurrentScene() == nullptr);
    BOOST_CHECK(!manager.hasScene("Title"));
    BOOST_CHECK(!context.getTagManager().hasTaggableEntityList(*title));
}

BOOST_AUTO_TEST_CASE(TestClearAllScenes) {
    BOOST_REQUIRE(manager.switchScenes("Level"));
    manager.clearAllScenes();

    BOOST_CHECK_EQUAL(level->getUnloadCount(), 1);
    BOOST_CHECK_EQUAL(manager.getSceneCount(), 0u);
    BOOST_CHECK_EQUAL(context.getTagManager().getSceneCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SceneSwitchTests, SceneManagerFixture)

BOOST_AUTO_TEST_CASE(TestSwitchUnloadsThenLoads) {
    std::vector<std::string> events;
    title->setOnUnload([&](TestScene&) { events.push_back("Title:unload"); });
    level->setOnLoad([&](TestScene&) { events.push_back("Level:load"); });

    BOOST_REQUIRE(manager.switchScenes("Title"));
    BOOST_CHECK_EQUAL(title->getLoadCount(), 1);
    BOOST_CHECK(title->isInitialized());

    BOOST_REQUIRE(manager.switchScenes("Level"));
    BOOST_CHECK_EQUAL(manager.getCurrentScene(), level);
    BOOST_CHECK(!title->isInitialized());
    BOOST_CHECK(level->isInitialized());

    const std::vector<std::string> expected = {"Title:unload", "Level:load"};
    BOOST_CHECK_EQUAL_COLLECTIONS(events.begin(), events.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestSwitchingFlagCoversUnloadAndLoad) {
    bool switchingDuringUnload = false;
    bool switchingDuringLoad = false;
    title->setOnUnload([&](TestScene&) { switchingDuringUnload = context.isSwitchingScenes(); });
    level->setOnLoad([&](TestScene&) { switchingDuringLoad = context.isSwitchingScenes(); });

    BOOST_CHECK(!manager.isSwitchingScenes());
    BOOST_REQUIRE(manager.switchScenes("Title"));
    BOOST_REQUIRE(manager.switchScenes("Level"));

    BOOST_CHECK(switchingDuringUnload);
    BOOST_CHECK(switchingDuringLoad);
    BOOST_CHECK(!manager.isSwitchingScenes());
}

BOOST_AUTO_TEST_CASE(TestSwitchingFlagResetsAfterThrow) {
    level->setOnLoad([](TestScene&) { throw std::runtime_error("load failed"); });

    BOOST_CHECK_THROW(manager.switchScenes("Level"), std::runtime_error);
    BOOST_CHECK(!manager.isSwitchingScenes());
    BOOST_CHECK(!level->isInitialized());
}

BOOST_AUTO_TEST_CASE(TestSwitchToUnknownScene) {
    BOOST_REQUIRE(manager.switchScenes("Title"));
    BOOST_CHECK(!manager.switchScenes("Nowhere"));
    BOOST_CHECK_EQUAL(manager.getCurrentScene(), title);
    BOOST_CHECK_EQUAL(title->getUnloadCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestSetCurrentSceneDefersLoading) {
    BOOST_REQUIRE(manager.setCurrentScene("Level"));
    BOOST_CHECK_EQUAL(level->getLoadCount(), 0);
    BOOST_CHECK(!manager.setCurrentScene("Nowhere"));

    manager.loadCurrentScene();
    manager.loadCurrentScene();
    BOOST_CHECK_EQUAL(level->getLoadCount(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SceneUpdateTests, SceneManagerFixture)

BOOST_AUTO_TEST_CASE(TestUpdateBeforeLoadDoesNothing) {
    manager.update(0.1f);
    BOOST_REQUIRE(manager.setCurrentScene("Title"));
    manager.update(0.1f);
    BOOST_CHECK_EQUAL(title->getUpdateCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestUpdateRunsSceneThenBehaviors) {
    std::vector<std::string> callLog;
    auto drawable = std::make_shared<MockDrawable>(context);
    auto behavior = std::make_shared<MockBehavior>("mover", &callLog);
    drawable->addAsGameObject(*level);
    drawable->addBehavior(behavior, *level);

    bool sceneUpdatedFirst = false;
    behavior->setOnUpdate([&](Drawable&) { sceneUpdatedFirst = level->getUpdateCount() == 1; });

    BOOST_REQUIRE(manager.switchScenes("Level"));
    manager.update(0.25f);

    BOOST_CHECK_CLOSE(level->getLastDeltaTime(), 0.25f, 0.0001f);
    BOOST_CHECK(sceneUpdatedFirst);

    const std::vector<std::string> expected = {"mover:init", "mover:update"};
    BOOST_CHECK_EQUAL_COLLECTIONS(callLog.begin(), callLog.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestRenderOnlyWhenLoaded) {
    auto drawable = std::make_shared<MockDrawable>(context);
    drawable->addAsGameObject(*title);

    manager.render(nullptr);
    BOOST_CHECK_EQUAL(drawable->getRenderCalls(), 0);

    BOOST_REQUIRE(manager.switchScenes("Title"));
    manager.render(nullptr);
    BOOST_CHECK_EQUAL(drawable->getRenderCalls(), 1);
}

BOOST_AUTO_TEST_CASE(TestDestroyAllListsReleasesObjects) {
    auto gameObject = std::make_shared<MockDrawable>(context);
    auto guiObject = std::make_shared<MockDrawable>(context);
    gameObject->addAsGameObject(*title).addTag("enemy", *title);
    guiObject->addAsGUIObject(*title);
    std::weak_ptr<MockDrawable> weakGame = gameObject;
    gameObject.reset();

    title->destroyAllLists();

    BOOST_CHECK(weakGame.expired());
    BOOST_CHECK(title->getGameObjects().empty());
    BOOST_CHECK(title->getGUIObjects().empty());
    BOOST_CHECK(context.getTagManager().getEntityList(*title).empty());
}

BOOST_AUTO_TEST_SUITE_END()
