/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/TaggableEntity.hpp"
#include <algorithm>

bool TaggableEntity::hasTag(const std::string& tag) const {
  return std::find(m_tags.begin(), m_tags.end(), tag) != m_tags.end();
}

bool TaggableEntity::insertTag(const std::string& tag) {
  if (hasTag(tag)) {
    return false;
  }
  m_tags.push_back(tag);
  return true;
}

bool TaggableEntity::eraseTag(const std::string& tag) {
  auto it = std::find(m_tags.begin(), m_tags.end(), tag);
  if (it == m_tags.end()) {
    return false;
  }
  m_tags.erase(it);
  return true;
}
