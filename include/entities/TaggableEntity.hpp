/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TAGGABLE_ENTITY_HPP
#define TAGGABLE_ENTITY_HPP

#include <boost/container/small_vector.hpp>
#include <string>

/**
 * @brief Tag membership for an entity.
 *
 * Holds an ordered, de-duplicated list of tag strings. Registering the entity
 * with the tag manager is left to the owning type (see Drawable::addTag), so
 * this class has no dependency on scenes.
 */
class TaggableEntity {
 public:
  // Most entities carry one or two tags
  using TagList = boost::container::small_vector<std::string, 4>;

  virtual ~TaggableEntity() = default;

  bool hasTag(const std::string& tag) const;
  const TagList& getTags() const { return m_tags; }
  void clearTags() { m_tags.clear(); }

 protected:
  // Returns true if the tag was not already present
  bool insertTag(const std::string& tag);
  // Returns true if the tag was present
  bool eraseTag(const std::string& tag);

 private:
  TagList m_tags;
};

#endif // TAGGABLE_ENTITY_HPP
