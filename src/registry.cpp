#include <registry.hpp>

namespace mctext {
  Registry<Colour>& colour_registry() {
    static Registry<Colour> registry("colour", {
      Colour::NONE,
      Colour::BLACK,
      Colour::DARK_BLUE,
      Colour::DARK_GREEN,
      Colour::DARK_CYAN,
      Colour::DARK_RED,
      Colour::PURPLE,
      Colour::GOLD,
      Colour::GREY,
      Colour::DARK_GREY,
      Colour::BLUE,
      Colour::BRIGHT_GREEN,
      Colour::CYAN,
      Colour::RED,
      Colour::PINK,
      Colour::YELLOW,
      Colour::WHITE
    });
    return registry;
  }

  /* RESET comes first so a reset on the wire clears before the other flags apply. */
  Registry<Decoration>& decoration_registry() {
    static Registry<Decoration> registry("decoration", {
      Decoration::RESET,
      Decoration::OBFUSCATED,
      Decoration::BOLD,
      Decoration::STRIKETHROUGH,
      Decoration::UNDERLINED,
      Decoration::ITALIC
    });
    return registry;
  }

  Registry<ClickEvent::Action>& click_action_registry() {
    static Registry<ClickEvent::Action> registry("click action", {
      ClickEvent::Action::OPEN_URL,
      ClickEvent::Action::RUN_COMMAND,
      ClickEvent::Action::SUGGEST_COMMAND,
      ClickEvent::Action::CHANGE_PAGE
    });
    return registry;
  }

  Registry<HoverEvent::Action>& hover_action_registry() {
    static Registry<HoverEvent::Action> registry("hover action", {
      HoverEvent::Action::SHOW_TEXT,
      HoverEvent::Action::SHOW_ITEM,
      HoverEvent::Action::SHOW_ENTITY,
      HoverEvent::Action::SHOW_ACHIEVEMENT
    });
    return registry;
  }
}
