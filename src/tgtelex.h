/*
TGTelex — C ABI for keyboard hosts.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

/*
TGTelex - Telex input core (keystrokes -> Vietnamese text)

The host forwards every key of the focused input context to tgtelex_onKey
and applies the returned edit: delete `backspace` code points before the
caret, insert `textUtf8`, and deliver the original key itself only when
`passKey` is set.

One handle per input context. Calls on a handle must be serialized.
*/

#ifndef TGTELEX_H
#define TGTELEX_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef TGTELEX_EXPORTS
    #define TGTELEX_API __declspec(dllexport)
  #elif defined(TGTELEX_STATIC)
    #define TGTELEX_API
  #else
    #define TGTELEX_API __declspec(dllimport)
  #endif
#else
  #define TGTELEX_API
#endif

#define TGTELEX_ABI_VERSION 1

typedef void* tgtelex_handle_t;

/* tgtelex_Edit.action */
#define TGTELEX_ACTION_NONE 0
#define TGTELEX_ACTION_SEND 1
#define TGTELEX_ACTION_RESTORE 2

/* Autocorrect mode codes. Unknown codes are treated as OFF. */
#define TGTELEX_AUTOCORRECT_OFF 0
#define TGTELEX_AUTOCORRECT_VIETNAMESE 1
#define TGTELEX_AUTOCORRECT_ENGLISH 2
#define TGTELEX_AUTOCORRECT_ALL 3

/*
  Edit produced by a key event or a cancel.
  textUtf8 is owned by the handle and valid until the next call on it.
*/
typedef struct tgtelex_Edit {
  int action;
  int backspace;        /* code points to delete before the caret */
  const char* textUtf8; /* text to insert, never NULL */
  int textLength;       /* code points in textUtf8 */
  int passKey;          /* 1: host must still deliver the original key */
} tgtelex_Edit;

/* Strings are owned by the handle and valid until the next call on it. */
typedef struct tgtelex_Correction {
  const char* originalUtf8;
  const char* correctedUtf8;
  int backspaceCount;   /* code points of originalUtf8 */
} tgtelex_Correction;

/* Returns NULL only when out of memory. */
TGTELEX_API tgtelex_handle_t tgtelex_create(void);
TGTELEX_API void tgtelex_destroy(tgtelex_handle_t handle);

/*
  Feed one key (a Unicode code point; 0x08 backspace, 0x1B escape).
  isBoundaryHint != 0 forces the key to end the current word.
  Returns 1 on success, 0 on a NULL handle or output pointer.
*/
TGTELEX_API int tgtelex_onKey(tgtelex_handle_t handle, uint32_t codepoint, int isBoundaryHint, tgtelex_Edit* out);

/* Put the raw keystrokes of the current word back. Returns 1 on success. */
TGTELEX_API int tgtelex_cancel(tgtelex_handle_t handle, tgtelex_Edit* out);

TGTELEX_API int tgtelex_setAutocorrectMode(tgtelex_handle_t handle, int mode);
/* Returns the mode code, or -1 for a NULL handle. */
TGTELEX_API int tgtelex_getAutocorrectMode(tgtelex_handle_t handle);

/*
  Look a word up in the active autocorrect table.
  Returns 1 when a correction was found (out filled), 0 otherwise.
*/
TGTELEX_API int tgtelex_tryCorrect(tgtelex_handle_t handle, const char* wordUtf8, tgtelex_Correction* out);

TGTELEX_API int tgtelex_setEnabled(tgtelex_handle_t handle, int enabled);
/* 1: hoà / thuỳ, 0: hòa / thùy (default). */
TGTELEX_API int tgtelex_setModernTone(tgtelex_handle_t handle, int modern);
TGTELEX_API int tgtelex_setAutoRestore(tgtelex_handle_t handle, int enabled);

/*
  Load a YAML settings file. Keys: enabled, autocorrect (off | vietnamese |
  english | all), autoRestore, toneStyle (traditional | modern), rawPrefix,
  debugLog. Unknown keys are ignored.
  On failure the current settings are kept and 0 is returned.
*/
TGTELEX_API int tgtelex_loadSettings(tgtelex_handle_t handle, const char* pathUtf8);

/*
  If a function returns failure, call this to get a human-readable message.
  The returned pointer is owned by the handle and remains valid until the next call.
*/
TGTELEX_API const char* tgtelex_getLastError(tgtelex_handle_t handle);

TGTELEX_API int tgtelex_getABIVersion(void);

#ifdef __cplusplus
}
#endif

#endif
