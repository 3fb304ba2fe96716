
#ifndef CHUNKSYNC_APPLICATION_UTIL_HPP
#define CHUNKSYNC_APPLICATION_UTIL_HPP

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "application/impl/config_reader/error.hpp"

namespace csync::application {

  template <typename T>
  outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt_entry) {
    if (! opt_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    return opt_entry.value();
  }

  /**
   * Reads an optional entry of the tree.
   * @return the default value when the entry is absent, PARSER_ERROR when it
   * is present but cannot be converted to T
   */
  template <typename T>
  outcome::result<T> readOr(const boost::property_tree::ptree &tree,
                            const std::string &path,
                            T default_value) {
    auto child = tree.get_child_optional(path);
    if (! child) {
      return default_value;
    }
    auto value = child->get_value_optional<T>();
    if (! value) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return *value;
  }

}  // namespace csync::application

#endif  // CHUNKSYNC_APPLICATION_UTIL_HPP
