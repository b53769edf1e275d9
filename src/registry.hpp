#pragma once

#include <event.hpp>
#include <format.hpp>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <util.hpp>
#include <utility>
#include <vector>

namespace mctext {
/*
 * Reverse lookup from internal name to a registered style value. Registries
 * are filled with the well-known constants on first use; embedding
 * applications may add their own values during startup.
 */
template <typename T> class Registry {
  std::string name;
  std::vector<T> values;
  std::map<std::string, size_t, std::less<>> index;
  mutable std::mutex mutex;

public:
  Registry(std::string _name, std::initializer_list<T> initial)
      : name(std::move(_name)) {
    for (const auto &value : initial) {
      add(value);
    }
  }

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  /* Registering the same internal name twice aborts. */
  void add(const T &value) {
    std::lock_guard<std::mutex> lock(mutex);
    const auto &internal_name = value.internal_name();
    MCTEXT_ASSERT(!index.contains(internal_name), "Duplicate %s registered: %s",
                  name, internal_name);
    index.emplace(internal_name, values.size());
    values.push_back(value);
    MCTEXT_LOG(debug) << "Registered " << name << " " << internal_name;
  }

  std::optional<T> find(std::string_view internal_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto i = index.find(internal_name);
    if (i == index.end()) {
      return std::nullopt;
    }
    return values[i->second];
  }

  bool contains(std::string_view internal_name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return index.find(internal_name) != index.end();
  }

  /* Registered values in registration order. */
  std::vector<T> entries() const {
    std::lock_guard<std::mutex> lock(mutex);
    return values;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return values.size();
  }
};

Registry<Colour> &colour_registry();
Registry<Decoration> &decoration_registry();
Registry<ClickEvent::Action> &click_action_registry();
Registry<HoverEvent::Action> &hover_action_registry();
} // namespace mctext
