#include "configservices.h"

#include "labelstyle.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string_view>

#include <wx/stdpaths.h>

namespace {

constexpr const char *kVariantKey = "label_variant";
constexpr const char *kLastDirectoryKey = "last_directory";
constexpr const char *kCompressPdfKey = "compress_pdf";

bool TryParseFloat(const std::string &text, float &out) {
  if (text.empty())
    return false;

  const auto first =
      std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
      });
  if (first == text.end())
    return false;
  const auto last =
      std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();
  std::string_view trimmed(&(*first), static_cast<size_t>(last - first));

  auto *begin = trimmed.data();
  auto *end = trimmed.data() + trimmed.size();

  auto result = std::from_chars(begin, end, out);
  return result.ec == std::errc{} && result.ptr == end;
}

} // namespace

UserPreferencesStore::UserPreferencesStore() {
  RegisterVariable(LabelStyleKeys::PartColumnWidth, "float", 4.0f, 2.0f,
                   8.0f);
  RegisterVariable(LabelStyleKeys::LocationAreaWidth, "float", 11.0f, 6.0f,
                   16.0f);
  ApplyLabelDefaults();
}

void UserPreferencesStore::SetValue(const std::string &key,
                                    const std::string &value) {
  std::string newValue = value;

  auto var = variables.find(key);
  if (var != variables.end() && var->second.type == "float") {
    float parsed = 0.0f;
    if (TryParseFloat(value, parsed)) {
      parsed = std::clamp(parsed, var->second.minValue, var->second.maxValue);
      var->second.value = parsed;
      newValue = std::to_string(parsed);
    }
  }

  configData[key] = newValue;
}

std::optional<std::string>
UserPreferencesStore::GetValue(const std::string &key) const {
  auto it = configData.find(key);
  if (it != configData.end())
    return it->second;
  return std::nullopt;
}

bool UserPreferencesStore::HasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

void UserPreferencesStore::RegisterVariable(const std::string &name,
                                            const std::string &type,
                                            float defVal, float minVal,
                                            float maxVal) {
  VariableInfo info;
  info.type = type;
  info.defaultValue = defVal;
  info.value = defVal;
  info.minValue = minVal;
  info.maxValue = maxVal;
  variables[name] = info;
}

float UserPreferencesStore::GetFloat(const std::string &name) const {
  auto it = variables.find(name);
  float defVal = 0.0f;
  if (it != variables.end())
    defVal = it->second.defaultValue;

  auto valStr = GetValue(name);
  if (valStr) {
    float parsed = 0.0f;
    if (TryParseFloat(*valStr, parsed)) {
      if (it != variables.end())
        parsed = std::clamp(parsed, it->second.minValue, it->second.maxValue);
      return parsed;
    }
    return defVal;
  }
  return defVal;
}

void UserPreferencesStore::SetFloat(const std::string &name, float v) {
  auto it = variables.find(name);
  if (it != variables.end()) {
    v = std::clamp(v, it->second.minValue, it->second.maxValue);
    it->second.value = v;
  }
  SetValue(name, std::to_string(v));
}

void UserPreferencesStore::ApplyDefaults() {
  for (const auto &[name, info] : variables) {
    float value = info.defaultValue;
    auto raw = GetValue(name);
    if (raw) {
      float parsed = 0.0f;
      if (TryParseFloat(*raw, parsed))
        value = std::clamp(parsed, info.minValue, info.maxValue);
    }
    SetValue(name, std::to_string(value));
  }
}

void UserPreferencesStore::ApplyLabelDefaults() {
  if (!HasKey(kVariantKey))
    SetValue(kVariantKey, VariantId(LabelVariant::SinglePart));
  if (!HasKey(kCompressPdfKey))
    SetValue(kCompressPdfKey, "1");
  for (LabelVariant variant :
       {LabelVariant::MultiplePart, LabelVariant::SinglePart}) {
    const char *key = LabelStyleKeys::LocationWeights(variant);
    auto raw = GetValue(key);
    if (!raw || !ParseLocationWeights(*raw))
      SetValue(key, FormatLocationWeights(
                        LabelStyle::Defaults(variant).locationWeights));
  }
}

LabelVariant UserPreferencesStore::GetLabelVariant() const {
  auto raw = GetValue(kVariantKey);
  if (raw) {
    if (auto variant = ParseVariantId(*raw))
      return *variant;
  }
  return LabelVariant::SinglePart;
}

void UserPreferencesStore::SetLabelVariant(LabelVariant variant) {
  SetValue(kVariantKey, VariantId(variant));
}

std::string UserPreferencesStore::GetLastDirectory() const {
  return GetValue(kLastDirectoryKey).value_or(std::string());
}

void UserPreferencesStore::SetLastDirectory(const std::string &dir) {
  SetValue(kLastDirectoryKey, dir);
}

bool UserPreferencesStore::GetCompressPdf() const {
  return GetValue(kCompressPdfKey).value_or("1") != "0";
}

void UserPreferencesStore::SetCompressPdf(bool compress) {
  SetValue(kCompressPdfKey, compress ? "1" : "0");
}

bool UserPreferencesStore::LoadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  if (!j.is_object())
    return false;

  try {
    configData = j.get<std::unordered_map<std::string, std::string>>();
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  ApplyLabelDefaults();
  ApplyDefaults();
  return true;
}

bool UserPreferencesStore::SaveToFile(const std::string &path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j(configData);
  file << j.dump(4);
  return static_cast<bool>(file);
}

std::string UserPreferencesStore::GetUserConfigFile() {
  wxString dir = wxStandardPaths::Get().GetUserDataDir();
  std::filesystem::path p = std::filesystem::path(dir.ToStdString());
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  p /= "user_config.json";
  return p.string();
}

bool UserPreferencesStore::LoadUserConfig() {
  return LoadFromFile(GetUserConfigFile());
}

bool UserPreferencesStore::SaveUserConfig() const {
  return SaveToFile(GetUserConfigFile());
}
