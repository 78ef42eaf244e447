#include "sim/GestureScript.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

// Gesture field may be a name or the numeric enum value.
GestureSymbol GetGesture(const json &j, const char *key) {
  if (!j.contains(key))
    return GestureSymbol::None;
  const auto &val = j[key];
  if (val.is_string())
    return ParseGesture(val.get<std::string>().c_str());
  if (val.is_number_integer()) {
    const int raw = val.get<int>();
    if (raw >= static_cast<int>(GestureSymbol::None) &&
        raw <= static_cast<int>(GestureSymbol::Right))
      return static_cast<GestureSymbol>(raw);
  }
  return GestureSymbol::None;
}

bool ReadScript(GestureScript &script, const json &data) {
  if (!data.is_object()) {
    LOG_ERROR("Gesture script root must be an object");
    return false;
  }
  script.name = data.value("name", std::string());
  if (data.contains("seed") && data["seed"].is_number_unsigned()) {
    script.hasSeed = true;
    script.seed = data["seed"].get<uint32_t>();
  }

  if (!data.contains("gestures") || !data["gestures"].is_array()) {
    LOG_ERROR("Gesture script has no \"gestures\" array");
    return false;
  }

  int dropped = 0;
  for (const auto &g_json : data["gestures"]) {
    if (!g_json.is_object()) {
      ++dropped;
      continue;
    }
    ScriptedGesture entry{};
    entry.atMs = g_json.value("at", 0.0) * 1000.0;
    entry.gesture = GetGesture(g_json, "gesture");
    if (entry.gesture == GestureSymbol::None || entry.atMs < 0.0) {
      ++dropped;
      continue;
    }
    script.entries.push_back(entry);
  }
  if (dropped > 0) {
    LOG_WARN("Gesture script '{}': dropped {} unusable entries", script.name,
             dropped);
  }

  std::stable_sort(script.entries.begin(), script.entries.end(),
                   [](const ScriptedGesture &a, const ScriptedGesture &b) {
                     return a.atMs < b.atMs;
                   });
  return true;
}

} // namespace

bool ParseGestureScript(GestureScript &script, const std::string &text) {
  script = {};
  try {
    const json data = json::parse(text);
    return ReadScript(script, data);
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in gesture script: {}", e.what());
    return false;
  } catch (const json::type_error &e) {
    LOG_ERROR("Gesture script has a field of the wrong type: {}", e.what());
    return false;
  }
}

bool LoadGestureScript(GestureScript &script, const char *path) {
  script = {};
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open gesture script: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    if (!ReadScript(script, data)) {
      LOG_ERROR("Rejected gesture script: {}", path);
      return false;
    }
  } catch (const json::parse_error &e) {
    LOG_ERROR("JSON parse error in {}: {}", path, e.what());
    return false;
  } catch (const json::type_error &e) {
    LOG_ERROR("Wrong field type in {}: {}", path, e.what());
    return false;
  }

  LOG_INFO("Loaded gesture script '{}' ({} gestures)", script.name,
           script.entries.size());
  return true;
}

GestureSymbol PopDueGesture(GestureScript &script, const double nowMs) {
  if (script.cursor >= script.entries.size()) {
    return GestureSymbol::None;
  }
  const ScriptedGesture &next = script.entries[script.cursor];
  if (next.atMs > nowMs) {
    return GestureSymbol::None;
  }
  ++script.cursor;
  return next.gesture;
}

bool IsScriptFinished(const GestureScript &script) {
  return script.cursor >= script.entries.size();
}

void RewindScript(GestureScript &script) { script.cursor = 0; }
