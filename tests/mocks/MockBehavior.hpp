/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MOCK_BEHAVIOR_HPP
#define MOCK_BEHAVIOR_HPP

#include "behaviors/Behavior.hpp"
#include "entities/Drawable.hpp"
#include <functional>
#include <string>
#include <vector>

// Counts lifecycle calls and appends its name to a shared call log so tests
// can check ordering across behaviors
class MockBehavior : public Behavior {
public:
    explicit MockBehavior(std::string name, std::vector<std::string>* callLog = nullptr)
        : m_name(std::move(name)), mp_callLog(callLog) {}

    void init(Drawable& drawable) override {
        ++m_initCount;
        record("init");
        if (m_onInit) {
            m_onInit(drawable);
        }
    }

    void update(Drawable& drawable) override {
        ++m_updateCount;
        record("update");
        if (m_onUpdate) {
            m_onUpdate(drawable);
        }
    }

    void destroy() override {
        ++m_destroyCount;
        record("destroy");
    }

    std::string getName() const override { return m_name; }

    // Hooks for reentrancy tests
    void setOnInit(std::function<void(Drawable&)> hook) { m_onInit = std::move(hook); }
    void setOnUpdate(std::function<void(Drawable&)> hook) { m_onUpdate = std::move(hook); }

    int getInitCount() const { return m_initCount; }
    int getUpdateCount() const { return m_updateCount; }
    int getDestroyCount() const { return m_destroyCount; }

private:
    void record(const std::string& phase) {
        if (mp_callLog) {
            mp_callLog->push_back(m_name + ":" + phase);
        }
    }

    std::string m_name;
    std::vector<std::string>* mp_callLog;
    std::function<void(Drawable&)> m_onInit;
    std::function<void(Drawable&)> m_onUpdate;
    int m_initCount{0};
    int m_updateCount{0};
    int m_destroyCount{0};
};

#endif // MOCK_BEHAVIOR_HPP
