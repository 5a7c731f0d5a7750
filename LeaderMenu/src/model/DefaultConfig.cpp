#include "model/DefaultConfig.h"

namespace lmenu {

namespace {

constexpr std::string_view kDefaultConfig = R"({
  "actions": [
    {
      "key": "t",
      "type": "application",
      "value": "/usr/bin/x-terminal-emulator"
    },
    {
      "key": ",",
      "label": "Leader Menu Settings",
      "type": "command",
      "value": "${EDITOR:-xdg-open} \"${XDG_CONFIG_HOME:-$HOME/.config}/leadermenu/settings.json\""
    },
    {
      "actions": [
        {
          "key": "f",
          "type": "application",
          "value": "/usr/bin/firefox"
        },
        {
          "key": "e",
          "type": "application",
          "value": "/usr/bin/thunderbird"
        },
        {
          "key": "h",
          "type": "folder",
          "value": "~"
        }
      ],
      "key": "o",
      "label": "Open",
      "type": "group"
    },
    {
      "actions": [
        {
          "key": "d",
          "type": "url",
          "value": "https://duckduckgo.com"
        },
        {
          "key": "g",
          "type": "url",
          "value": "https://github.com"
        }
      ],
      "key": "w",
      "label": "Web",
      "type": "group"
    }
  ],
  "type": "group"
})";

} // namespace

std::string_view defaultConfigDocument() noexcept {
    return kDefaultConfig;
}

} // namespace lmenu
