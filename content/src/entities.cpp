#include "starpack_content/entities.h"

namespace starpack::content {

const std::string& LocalizedText::get(std::string_view locale) const {
  static const std::string kEmpty;
  auto it = by_locale.find(std::string(locale));
  if (it != by_locale.end() && !it->second.empty()) {
    return it->second;
  }
  auto en = by_locale.find("en");
  return en == by_locale.end() ? kEmpty : en->second;
}

const char* special_behavior_name(SpecialBehavior behavior) {
  switch (behavior) {
    case SpecialBehavior::Terraformer:
      return "terraformer";
    case SpecialBehavior::None:
    default:
      return "none";
  }
}

const char* victory_kind_name(VictoryKind kind) {
  switch (kind) {
    case VictoryKind::Domination:
      return "domination";
    case VictoryKind::CoverAllTiles:
    default:
      return "cover_all_tiles";
  }
}

const char* generation_mode_name(GenerationMode mode) {
  switch (mode) {
    case GenerationMode::RandomWhiteBlack:
    default:
      return "random_white_black";
  }
}

} // namespace starpack::content
