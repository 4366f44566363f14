/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE EngineContextTests
#include <boost/test/unit_test.hpp>

#include "core/EngineContext.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/SceneManager.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/TagManager.hpp"
#include "mocks/MockDrawable.hpp"
#include "mocks/RecordingErrorReporter.hpp"
#include "mocks/TestScene.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

using PolyForge::EngineContext;
using PolyForge::Logger;

struct ContextFixture {
    EngineContext context;

    ~ContextFixture() {
        Logger::SetBenchmarkMode(false);
    }
};

BOOST_FIXTURE_TEST_SUITE(EngineContextSettingsTests, ContextFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsStartParallelQueries) {
    BOOST_REQUIRE(context.init());

    BOOST_CHECK(context.getTagManager().isParallelQueriesEnabled());
    BOOST_REQUIRE(context.getThreadSystem() != nullptr);
    BOOST_CHECK(!context.getThreadSystem()->isShutdown());
    BOOST_CHECK_GT(context.getThreadSystem()->getThreadCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDisablingParallelQueriesStopsWorkers) {
    context.getSettings().set("tags", "parallel_queries", false);
    BOOST_REQUIRE(context.init());

    BOOST_CHECK(!context.getTagManager().isParallelQueriesEnabled());
    BOOST_CHECK(context.getThreadSystem() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestWorkerCountSettingAndRestart) {
    context.getSettings().set("tags", "worker_threads", 2);
    BOOST_REQUIRE(context.init());
    BOOST_REQUIRE(context.getThreadSystem() != nullptr);
    BOOST_CHECK_EQUAL(context.getThreadSystem()->getThreadCount(), 2u);

    // Same size keeps the pool
    PolyForge::ThreadSystem* before = context.getThreadSystem();
    BOOST_REQUIRE(context.applySettings());
    BOOST_CHECK_EQUAL(context.getThreadSystem(), before);

    context.getSettings().set("tags", "worker_threads", 3);
    BOOST_REQUIRE(context.applySettings());
    BOOST_CHECK_EQUAL(context.getThreadSystem()->getThreadCount(), 3u);
}

BOOST_AUTO_TEST_CASE(TestBenchmarkModeSetting) {
    context.getSettings().set("logging", "benchmark_mode", true);
    BOOST_REQUIRE(context.applySettings());
    BOOST_CHECK(Logger::IsBenchmarkMode());

    context.getSettings().set("logging", "benchmark_mode", false);
    BOOST_REQUIRE(context.applySettings());
    BOOST_CHECK(!Logger::IsBenchmarkMode());
}

BOOST_AUTO_TEST_CASE(TestInitFromFile) {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "polyforge_context_test.json";
    {
        std::ofstream file(path);
        file << R"({"tags": {"worker_threads": 1, "parallel_scene_threshold": 1}})";
    }

    BOOST_REQUIRE(context.init(path.string()));
    BOOST_CHECK_EQUAL(context.getSettings().get<int>("tags", "parallel_scene_threshold", 0), 1);
    BOOST_REQUIRE(context.getThreadSystem() != nullptr);
    BOOST_CHECK_EQUAL(context.getThreadSystem()->getThreadCount(), 1u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

BOOST_AUTO_TEST_CASE(TestMissingSettingsFileFallsBackToDefaults) {
    BOOST_CHECK(context.init("does/not/exist.json"));
    BOOST_CHECK(context.getTagManager().isParallelQueriesEnabled());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EngineContextLifetimeTests, ContextFixture)

BOOST_AUTO_TEST_CASE(TestNullErrorReporterThrows) {
    BOOST_CHECK_THROW(context.setErrorReporter(nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestErrorReporterIsReplaced) {
    auto recording = std::make_unique<RecordingErrorReporter>();
    RecordingErrorReporter* reporter = recording.get();
    context.setErrorReporter(std::move(recording));

    context.getErrorReporter().error("message", "cause");
    BOOST_REQUIRE_EQUAL(reporter->getErrors().size(), 1u);
    BOOST_CHECK_EQUAL(reporter->getErrors()[0].first, "message");
}

BOOST_AUTO_TEST_CASE(TestParallelQueryThroughContext) {
    context.getSettings().set("tags", "worker_threads", 2);
    context.getSettings().set("tags", "parallel_scene_threshold", 2);
    BOOST_REQUIRE(context.init());

    auto first = std::make_shared<TestScene>("First", context);
    auto second = std::make_shared<TestScene>("Second", context);
    context.getSceneManager().addScene(first);
    context.getSceneManager().addScene(second);

    auto a = std::make_shared<MockDrawable>(context);
    auto b = std::make_shared<MockDrawable>(context);
    a->addTag("enemy", *first);
    b->addTag("enemy", *second);

    const size_t enqueuedBefore = context.getThreadSystem()->getTotalTasksEnqueued();
    BOOST_CHECK_EQUAL(context.getTagManager().getAllWithTag("enemy").size(), 2u);
    BOOST_CHECK_EQUAL(context.getThreadSystem()->getTotalTasksEnqueued(), enqueuedBefore + 2);
}

BOOST_AUTO_TEST_CASE(TestCleanReleasesEverything) {
    BOOST_REQUIRE(context.init());

    auto scene = std::make_shared<TestScene>("Main", context);
    context.getSceneManager().addScene(scene);
    BOOST_REQUIRE(context.getSceneManager().switchScenes("Main"));

    auto drawable = std::make_shared<MockDrawable>(context);
    drawable->addTag("player", *scene);

    context.clean();

    BOOST_CHECK_EQUAL(scene->getUnloadCount(), 1);
    BOOST_CHECK_EQUAL(context.getSceneManager().getSceneCount(), 0u);
    BOOST_CHECK_EQUAL(context.getTagManager().getSceneCount(), 0u);
    BOOST_CHECK(!context.getTagManager().doesTagExist("player"));
    BOOST_CHECK(context.getThreadSystem() == nullptr);

    // Clean is repeatable
    context.clean();
    BOOST_CHECK_EQUAL(scene->getUnloadCount(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
