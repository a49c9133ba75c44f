/*
TGTelex — Engine settings and their YAML loader.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef TGTELEX_ENGINE_SETTINGS_H
#define TGTELEX_ENGINE_SETTINGS_H

#include <string>
#include <string_view>

#include "autocorrect.h"
#include "phonology.h"
#include "yaml_min.h"

namespace tgtelex {

struct EngineSettings {
  bool enabled = true;
  AutoCorrectMode autocorrect = AutoCorrectMode::Off;
  bool autoRestore = true;
  ToneStyle toneStyle = ToneStyle::Traditional;
  bool rawPrefix = true;  // backslash starts a literal word
  bool debugLog = false;
};

// Overlay the keys present in root onto inOut. Unknown keys are ignored.
// On a bad value nothing is changed and outError names the key and line.
bool applySettings(const yaml_min::Node& root, EngineSettings& inOut, std::string& outError);

bool loadSettingsText(std::string_view text, EngineSettings& inOut, std::string& outError);
bool loadSettingsFile(const std::string& path, EngineSettings& inOut, std::string& outError);

} // namespace tgtelex

#endif
