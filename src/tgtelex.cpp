/*
TGTelex — C ABI for keyboard hosts.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "tgtelex.h"

#include <exception>
#include <memory>
#include <new>
#include <string>

#include "engine/debug_log.h"
#include "engine/engine.h"
#include "engine/settings.h"
#include "engine/utf8.h"

namespace tgtelex {

// Built on first use and shared by every handle.
static std::shared_ptr<const CorrectionTables> sharedTables() {
  static const std::shared_ptr<const CorrectionTables> tables =
      std::make_shared<const CorrectionTables>();
  return tables;
}

struct Handle {
  Engine engine;
  std::string lastError;

  // Backing storage for strings handed out through the ABI.
  std::string editText;
  std::string corrOriginal;
  std::string corrCorrected;

  Handle() : engine(sharedTables()) {}
};

static Handle* asHandle(tgtelex_handle_t h) {
  return reinterpret_cast<Handle*>(h);
}

static void setError(Handle* h, const std::string& msg) {
  if (!h) return;
  h->lastError = msg;
  TGTELEX_LOG("api error: %s", msg.c_str());
}

static void fillEdit(Handle* h, const EditInstruction& e, tgtelex_Edit* out) {
  h->editText = u32ToUtf8(e.text);
  out->action = static_cast<int>(e.action);
  out->backspace = static_cast<int>(e.backspace);
  out->textUtf8 = h->editText.c_str();
  out->textLength = static_cast<int>(e.text.size());
  out->passKey = e.passKey ? 1 : 0;
}

} // namespace tgtelex

extern "C" {

TGTELEX_API tgtelex_handle_t tgtelex_create(void) {
  using namespace tgtelex;
  try {
    auto* h = new Handle();
    return reinterpret_cast<tgtelex_handle_t>(h);
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}

TGTELEX_API void tgtelex_destroy(tgtelex_handle_t handle) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  delete h;
}

TGTELEX_API int tgtelex_onKey(tgtelex_handle_t handle, uint32_t codepoint, int isBoundaryHint, tgtelex_Edit* out) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  if (!out) {
    setError(h, "onKey: output pointer is NULL");
    return 0;
  }
  h->lastError.clear();
  try {
    const EditInstruction e = h->engine.onKey(static_cast<char32_t>(codepoint), isBoundaryHint != 0);
    fillEdit(h, e, out);
  } catch (const std::exception& ex) {
    setError(h, std::string("onKey failed: ") + ex.what());
    return 0;
  }
  return 1;
}

TGTELEX_API int tgtelex_cancel(tgtelex_handle_t handle, tgtelex_Edit* out) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  if (!out) {
    setError(h, "cancel: output pointer is NULL");
    return 0;
  }
  h->lastError.clear();
  try {
    fillEdit(h, h->engine.cancel(), out);
  } catch (const std::exception& ex) {
    setError(h, std::string("cancel failed: ") + ex.what());
    return 0;
  }
  return 1;
}

TGTELEX_API int tgtelex_setAutocorrectMode(tgtelex_handle_t handle, int mode) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  h->engine.setAutocorrectMode(autoCorrectModeFromCode(mode));
  return 1;
}

TGTELEX_API int tgtelex_getAutocorrectMode(tgtelex_handle_t handle) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return -1;
  return autoCorrectModeCode(h->engine.autocorrectMode());
}

TGTELEX_API int tgtelex_tryCorrect(tgtelex_handle_t handle, const char* wordUtf8, tgtelex_Correction* out) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  if (!wordUtf8 || !out) {
    setError(h, "tryCorrect: NULL argument");
    return 0;
  }
  h->lastError.clear();
  try {
    CorrectionResult r;
    if (!h->engine.tryCorrect(wordUtf8, r)) return 0;
    h->corrOriginal = std::move(r.original);
    h->corrCorrected = std::move(r.corrected);
    out->originalUtf8 = h->corrOriginal.c_str();
    out->correctedUtf8 = h->corrCorrected.c_str();
    out->backspaceCount = static_cast<int>(r.backspaceCount);
  } catch (const std::exception& ex) {
    setError(h, std::string("tryCorrect failed: ") + ex.what());
    return 0;
  }
  return 1;
}

TGTELEX_API int tgtelex_setEnabled(tgtelex_handle_t handle, int enabled) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  h->engine.setEnabled(enabled != 0);
  return 1;
}

TGTELEX_API int tgtelex_setModernTone(tgtelex_handle_t handle, int modern) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  h->engine.setToneStyle(modern ? ToneStyle::Modern : ToneStyle::Traditional);
  return 1;
}

TGTELEX_API int tgtelex_setAutoRestore(tgtelex_handle_t handle, int enabled) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  h->engine.setAutoRestore(enabled != 0);
  return 1;
}

TGTELEX_API int tgtelex_loadSettings(tgtelex_handle_t handle, const char* pathUtf8) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return 0;
  if (!pathUtf8 || !*pathUtf8) {
    setError(h, "loadSettings: empty path");
    return 0;
  }
  h->lastError.clear();
  try {
    EngineSettings s = h->engine.settings();
    std::string err;
    if (!loadSettingsFile(pathUtf8, s, err)) {
      setError(h, err.empty() ? "Failed to load settings" : err);
      return 0;
    }
    h->engine.applySettings(s);
  } catch (const std::exception& ex) {
    setError(h, std::string("loadSettings failed: ") + ex.what());
    return 0;
  }
  return 1;
}

TGTELEX_API const char* tgtelex_getLastError(tgtelex_handle_t handle) {
  using namespace tgtelex;
  Handle* h = asHandle(handle);
  if (!h) return "invalid handle";
  return h->lastError.c_str();
}

TGTELEX_API int tgtelex_getABIVersion(void) {
  return TGTELEX_ABI_VERSION;
}

} // extern "C"
