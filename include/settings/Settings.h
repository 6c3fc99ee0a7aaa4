#pragma once

#include <QSettings>
#include "version.h"

namespace NeoCR {

inline constexpr const char* kOrganizationName = "neocr";
inline constexpr const char* kApplicationName = NEOCR_APP_NAME;

// Settings keys
inline constexpr const char* kSettingsKeyLastModel = "last_model";
inline constexpr const char* kSettingsKeyOllamaUrl = "ollama/url";
inline constexpr const char* kSettingsKeyLanguage = "ocr/language";

// Default values
inline constexpr const char* kDefaultModel = "qwen3-vl:8b";
inline constexpr const char* kDefaultOllamaUrl = "http://localhost:11434";
inline constexpr const char* kDefaultLanguage = "English";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace NeoCR
