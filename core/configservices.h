#pragma once

#include "partrecord.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Persistent user preferences stored as a flat JSON object of strings.
// Numeric settings are registered as variables so stored values are
// validated and clamped to their range.
class UserPreferencesStore {
public:
  struct VariableInfo {
    std::string type;
    float defaultValue = 0.0f;
    float value = 0.0f;
    float minValue = 0.0f;
    float maxValue = 0.0f;
  };

  // Registers the label layout variables and string defaults.
  UserPreferencesStore();

  void SetValue(const std::string &key, const std::string &value);
  std::optional<std::string> GetValue(const std::string &key) const;
  bool HasKey(const std::string &key) const;

  bool LoadFromFile(const std::string &path);
  bool SaveToFile(const std::string &path) const;
  static std::string GetUserConfigFile();
  bool LoadUserConfig();
  bool SaveUserConfig() const;

  void RegisterVariable(const std::string &name, const std::string &type,
                        float defVal, float minVal, float maxVal);
  float GetFloat(const std::string &name) const;
  void SetFloat(const std::string &name, float v);
  void ApplyDefaults();

  LabelVariant GetLabelVariant() const;
  void SetLabelVariant(LabelVariant variant);
  std::string GetLastDirectory() const;
  void SetLastDirectory(const std::string &dir);
  bool GetCompressPdf() const;
  void SetCompressPdf(bool compress);

private:
  void ApplyLabelDefaults();

  std::unordered_map<std::string, std::string> configData;
  std::unordered_map<std::string, VariableInfo> variables;
};
