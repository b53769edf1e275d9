#include <json_serialiser.hpp>
#include <optional>
#include <registry.hpp>
#include <text_builder.hpp>
#include <util.hpp>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace mctext {
  namespace {
    [[noreturn]] void throw_malformed(const std::string& message) {
      MCTEXT_THROW(TextParseError(TextParseError::Kind::Malformed, message));
    }

    [[noreturn]] void throw_unknown(std::string_view what, std::string_view internal_name) {
      MCTEXT_THROW(TextParseError(TextParseError::Kind::UnknownIdentifier,
                                  absl::StrFormat("Unknown %s: %s", what, internal_name)));
    }

    std::string read_string(const boost::json::value& value, std::string_view field) {
      switch (value.kind()) {
      case boost::json::kind::string:
        return std::string(value.get_string());
      case boost::json::kind::bool_:
        return value.get_bool() ? "true" : "false";
      case boost::json::kind::int64:
        return absl::StrCat(value.get_int64());
      case boost::json::kind::uint64:
        return absl::StrCat(value.get_uint64());
      case boost::json::kind::double_:
        return absl::StrCat(value.get_double());
      default:
        throw_malformed(absl::StrFormat("Field \"%s\" must be a string", field));
      }
    }

    /*
     * Decoration flags: a string is true only when it spells "true" in any
     * case, every other scalar is false. Null, objects and arrays carry no
     * flag and leave the decoration unspecified.
     */
    std::optional<bool> read_boolean(const boost::json::value& value) {
      switch (value.kind()) {
      case boost::json::kind::bool_:
        return value.get_bool();
      case boost::json::kind::string:
        return absl::EqualsIgnoreCase(std::string(value.get_string()), "true");
      case boost::json::kind::int64:
      case boost::json::kind::uint64:
      case boost::json::kind::double_:
        return false;
      default:
        return std::nullopt;
      }
    }

    Text read_text(const boost::json::value& value);

    template<typename Event>
    Event read_event(const boost::json::value& value, std::string_view field,
                     const Registry<typename Event::Action>& registry, std::string_view what) {
      auto object = value.if_object();
      if (object == nullptr) {
        throw_malformed(absl::StrFormat("Field \"%s\" must be an object", field));
      }
      auto action_field = object->if_contains("action");
      auto value_field = object->if_contains("value");
      if (action_field == nullptr || value_field == nullptr) {
        throw_malformed(absl::StrFormat("Field \"%s\" requires \"action\" and \"value\"", field));
      }
      auto name = read_string(*action_field, "action");
      auto action = registry.find(name);
      if (!action) {
        throw_unknown(what, name);
      }
      return Event(*action, read_text(*value_field));
    }

    template<typename Builder>
    Text read_style(Builder& builder, const boost::json::object& object) {
      for (const auto& decoration : decoration_registry().entries()) {
        auto field = object.if_contains(decoration.internal_name());
        if (field == nullptr) {
          continue;
        }
        auto active = read_boolean(*field);
        if (active) {
          builder.apply(decoration, *active);
        } else {
          MCTEXT_LOG(debug) << "Ignoring non-scalar decoration " << decoration.internal_name();
        }
      }

      if (auto field = object.if_contains("color")) {
        auto name = read_string(*field, "color");
        auto colour = colour_registry().find(name);
        if (!colour) {
          throw_unknown("colour", name);
        }
        builder.apply(*colour);
      }

      if (auto field = object.if_contains("insertion")) {
        builder.insertion(read_string(*field, "insertion"));
      }

      if (auto field = object.if_contains("clickEvent")) {
        builder.click(read_event<ClickEvent>(*field, "clickEvent", click_action_registry(), "click action"));
      }

      if (auto field = object.if_contains("hoverEvent")) {
        builder.hover(read_event<HoverEvent>(*field, "hoverEvent", hover_action_registry(), "hover action"));
      }

      if (auto field = object.if_contains("extra")) {
        auto extra = field->if_array();
        if (extra == nullptr) {
          throw_malformed("Field \"extra\" must be an array");
        }
        for (const auto& child : *extra) {
          builder.append(read_text(child));
        }
      }

      return builder.build();
    }

    Text read_text(const boost::json::value& value) {
      auto object = value.if_object();
      if (object == nullptr) {
        throw_malformed(absl::StrFormat("Expected a text object, got %s", std::string(boost::json::to_string(value.kind()))));
      }

      auto text = object->if_contains("text");
      auto translate = object->if_contains("translate");
      auto keybind = object->if_contains("keybind");
      auto fields = int(text != nullptr) + int(translate != nullptr) + int(keybind != nullptr);
      if (fields == 0) {
        throw_malformed("Text object has none of \"text\", \"translate\" or \"keybind\"");
      }
      if (fields > 1) {
        throw_malformed("Text object has more than one of \"text\", \"translate\" or \"keybind\"");
      }

      if (text != nullptr) {
        LiteralBuilder builder(read_string(*text, "text"));
        return read_style(builder, *object);
      } else if (translate != nullptr) {
        TranslatableBuilder builder(read_string(*translate, "translate"));
        auto with = object->if_contains("with");
        if (with != nullptr && with->is_array()) {
          for (const auto& argument : with->get_array()) {
            builder.argument(read_text(argument));
          }
        }
        return read_style(builder, *object);
      } else {
        KeybindBuilder builder(read_string(*keybind, "keybind"));
        return read_style(builder, *object);
      }
    }

    boost::json::value write_text(const Text& text, const JsonSerialiser::Options& options);

    struct ContentWriter {
      boost::json::object& json;
      const JsonSerialiser::Options& options;

      void operator()(const Literal& literal) const {
        json["text"] = boost::json::string(literal.content);
      }

      void operator()(const Translatable& translatable) const {
        json["translate"] = boost::json::string(translatable.key);
        if (translatable.has_arguments()) {
          boost::json::array with;
          for (const auto& argument : translatable.args) {
            with.push_back(write_text(argument, options));
          }
          json["with"] = std::move(with);
        }
      }

      void operator()(const Keybind& keybind) const {
        json["keybind"] = boost::json::string(keybind.keybind);
      }
    };

    template<typename Event>
    boost::json::value write_event(const Event& event, const JsonSerialiser::Options& options) {
      boost::json::object json;
      json["action"] = boost::json::string(event.action().internal_name());
      json["value"] = write_text(event.value(), options);
      return json;
    }

    boost::json::value write_text(const Text& text, const JsonSerialiser::Options& options) {
      boost::json::object json;
      std::visit(ContentWriter{json, options}, text.content());

      for (const auto& [decoration, active] : text.decorations()) {
        if (options.decorations_as_strings) {
          json[decoration.internal_name()] = active ? "true" : "false";
        } else {
          json[decoration.internal_name()] = active;
        }
      }

      if (text.colour() != Colour::NONE) {
        json["color"] = boost::json::string(text.colour().internal_name());
      }

      if (text.insertion()) {
        json["insertion"] = boost::json::string(*text.insertion());
      }

      if (text.click_event()) {
        json["clickEvent"] = write_event(*text.click_event(), options);
      }

      if (text.hover_event()) {
        json["hoverEvent"] = write_event(*text.hover_event(), options);
      }

      if (text.has_children()) {
        boost::json::array extra;
        for (const auto& child : text.children()) {
          extra.push_back(write_text(child, options));
        }
        json["extra"] = std::move(extra);
      }

      return json;
    }

    /* Two spaces per level, one member or element per line. */
    void write_pretty(std::string& out, const boost::json::value& value, size_t depth) {
      auto indent = [&](size_t level) { out.append(2 * level, ' '); };

      if (auto object = value.if_object(); object && !object->empty()) {
        out += "{\n";
        auto first = true;
        for (const auto& member : *object) {
          if (!first) {
            out += ",\n";
          }
          first = false;
          indent(depth + 1);
          absl::StrAppend(&out, boost::json::serialize(boost::json::string(member.key())), ": ");
          write_pretty(out, member.value(), depth + 1);
        }
        out += "\n";
        indent(depth);
        out += "}";
      } else if (auto array = value.if_array(); array && !array->empty()) {
        out += "[\n";
        for (size_t i = 0; i < array->size(); ++i) {
          if (i > 0) {
            out += ",\n";
          }
          indent(depth + 1);
          write_pretty(out, (*array)[i], depth + 1);
        }
        out += "\n";
        indent(depth);
        out += "]";
      } else {
        out += boost::json::serialize(value);
      }
    }
  }

  JsonSerialiser::JsonSerialiser() {}

  JsonSerialiser::JsonSerialiser(Options options)
    : _options(options) {}

  const JsonSerialiser::Options& JsonSerialiser::options() const {
    return _options;
  }

  boost::json::value JsonSerialiser::to_json(const Text& text) const {
    return write_text(text, _options);
  }

  Text JsonSerialiser::from_json(const boost::json::value& value) const {
    return read_text(value);
  }

  std::string JsonSerialiser::serialise(const Text& text) const {
    auto json = to_json(text);
    if (_options.pretty) {
      return pretty_print(json);
    }
    return boost::json::serialize(json);
  }

  Text JsonSerialiser::deserialise(std::string_view text) const {
    boost::json::parse_options parse_options;
    parse_options.max_depth = _options.max_depth;

    boost::system::error_code error;
    auto json = boost::json::parse(boost::json::string_view(text.data(), text.size()), error,
                                   boost::json::storage_ptr(), parse_options);
    if (error) {
      auto kind = error == boost::json::error::too_deep ? TextParseError::Kind::TooDeep : TextParseError::Kind::Syntax;
      MCTEXT_THROW(TextParseError(kind, absl::StrFormat("Failed to parse json text: %s", error.message()), error));
    }
    return from_json(json);
  }

  std::string pretty_print(const boost::json::value& value) {
    std::string result;
    write_pretty(result, value, 0);
    result += "\n";
    return result;
  }
}
