#pragma once

#include <compare>
#include <ostream>
#include <string>
#include <utility>

namespace mctext {
/*
 * Base of the open style enumerations. Values are identified only by their
 * internal name, the string used on the wire. The template parameter keeps
 * colours, decorations and actions from comparing equal to each other.
 */
template <typename T> class InternalName {
  std::string name;

protected:
  explicit InternalName(std::string _name) : name(std::move(_name)) {}

public:
  const std::string &internal_name() const { return name; }

  bool operator==(const InternalName &) const = default;
  std::strong_ordering operator<=>(const InternalName &) const = default;

  template <typename H> friend H AbslHashValue(H h, const InternalName &v) {
    return H::combine(std::move(h), v.name);
  }

  friend std::ostream &operator<<(std::ostream &stream,
                                  const InternalName &v) {
    return stream << v.name;
  }
};
} // namespace mctext
