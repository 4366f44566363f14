/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Maths.hpp"
#include <random>
#include <stdexcept>

namespace PolyForge {
namespace Maths {

namespace {
std::mt19937& getThreadLocalRNG() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return rng;
}
} // anonymous namespace

float random(float min, float max) {
    if (min >= max) {
        throw std::invalid_argument("The minimum must be less than the maximum.");
    }

    std::uniform_real_distribution<float> dist(min, max);
    return dist(getThreadLocalRNG());
}

bool randomBoolean() {
    std::bernoulli_distribution dist(0.5);
    return dist(getThreadLocalRNG());
}

float randomAtEdge(float leftEdge, float rightEdge) {
    if (leftEdge >= rightEdge) {
        throw std::invalid_argument("The left edge must be less than the right edge.");
    }

    return randomBoolean() ? leftEdge : rightEdge;
}

float snap(float num, float leftEdge, float rightEdge) {
    if (leftEdge >= rightEdge) {
        throw std::invalid_argument("The left edge must be less than the right edge.");
    }

    return ((num - leftEdge) < (rightEdge - num)) ? leftEdge : rightEdge;
}

Vector2D centerOf(const std::vector<Vector2D>& points) {
    if (points.empty()) {
        return Vector2D(0.0f, 0.0f);
    }

    Vector2D sum;
    for (const auto& point : points) {
        sum += point;
    }
    return sum / static_cast<float>(points.size());
}

} // namespace Maths
} // namespace PolyForge
