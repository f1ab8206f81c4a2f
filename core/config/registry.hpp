/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include "config/config_error.hpp"

namespace oasis::config {

  /**
   * Identifiers of networks and ParaTimes: non-empty, ASCII letters, digits,
   * '_' and '-'
   */
  outcome::result<void> validateIdentifier(std::string_view identifier);

  /**
   * Named entries with an optional default one. The default name is either
   * empty or names an existing entry.
   * @tparam T - entry type providing outcome::result<void> validate() const
   */
  template <typename T>
  struct Registry {
    std::string default_name;
    std::map<std::string, T> all;

    bool operator==(const Registry &) const = default;

    outcome::result<void> validate() const {
      if (not default_name.empty() and not all.contains(default_name)) {
        return ConfigError::DEFAULT_NOT_FOUND;
      }
      for (const auto &[name, entry] : all) {
        OUTCOME_TRY(validateIdentifier(name));
        OUTCOME_TRY(entry.validate());
      }
      return outcome::success();
    }

    /**
     * Adds a validated entry; the first one added becomes the default
     */
    outcome::result<void> add(const std::string &name, T entry) {
      if (all.contains(name)) {
        return ConfigError::ALREADY_EXISTS;
      }
      OUTCOME_TRY(validateIdentifier(name));
      OUTCOME_TRY(entry.validate());
      all.emplace(name, std::move(entry));
      if (default_name.empty()) {
        default_name = name;
      }
      return outcome::success();
    }

    /**
     * Removes an entry, clearing the default if it pointed to it
     */
    outcome::result<void> remove(const std::string &name) {
      if (all.erase(name) == 0) {
        return ConfigError::NOT_FOUND;
      }
      if (default_name == name) {
        default_name.clear();
      }
      return outcome::success();
    }

    outcome::result<void> setDefault(const std::string &name) {
      if (not all.contains(name)) {
        return ConfigError::NOT_FOUND;
      }
      default_name = name;
      return outcome::success();
    }

    /// @return nullptr when there is no such entry
    const T *find(const std::string &name) const {
      auto it = all.find(name);
      return it == all.end() ? nullptr : &it->second;
    }

    /// @return nullptr when no default is set
    const T *getDefault() const {
      return find(default_name);
    }
  };

}  // namespace oasis::config
