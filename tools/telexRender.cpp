/*
  telexRender
  -----------
  Small command-line helper that feeds keystrokes through the TGTelex C ABI
  and prints the text a host application would end up showing.

  Intended use:
    - manual checks of typing sequences
    - scripted host tests (echo "Vieetj Nam " | telexRender)

  Notes:
    - Reads UTF-8 from stdin, one key per code point, and writes UTF-8 to
      stdout. A backspace byte (0x08) deletes like a real host would, and
      an escape byte (0x1B) cancels the current word.
    - Keys whose edit asks the host to deliver them (passKey) are applied
      to the simulated screen the way a text field would.
*/

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <iostream>
#include <string>

#include "tgtelex.h"
#include "engine/utf8.h"

#if defined(_WIN32)
  #include <fcntl.h>
  #include <io.h>
#endif

namespace {

struct Options {
  int autocorrect = TGTELEX_AUTOCORRECT_OFF;
  bool modernTone = false;
  bool autoRestore = true;
  std::string settingsPath;  // optional YAML settings file
  bool trace = false;        // print every edit to stderr
  bool help = false;
};

static void printHelp(const char* argv0) {
  std::cerr
    << "Usage: " << (argv0 ? argv0 : "telexRender") << " [options]\n\n"
    << "Reads keystrokes from stdin (UTF-8) and writes the resulting text to stdout.\n\n"
    << "Options:\n"
    << "  --autocorrect <mode>  off | vietnamese | english | all | 0-3 (default: off)\n"
    << "  --modern              Modern tone placement (hoà instead of hòa)\n"
    << "  --no-restore          Never restore English words\n"
    << "  --settings <path>     Load a YAML settings file before typing\n"
    << "  --trace               Print each edit instruction to stderr\n"
    << "\n"
    << "  -h, --help            Show this help\n";
}

static bool parseMode(const std::string& s, int& out) {
  if (s == "off" || s == "0") { out = TGTELEX_AUTOCORRECT_OFF; return true; }
  if (s == "vietnamese" || s == "1") { out = TGTELEX_AUTOCORRECT_VIETNAMESE; return true; }
  if (s == "english" || s == "2") { out = TGTELEX_AUTOCORRECT_ENGLISH; return true; }
  if (s == "all" || s == "3") { out = TGTELEX_AUTOCORRECT_ALL; return true; }
  return false;
}

static Options parseArgs(int argc, char** argv) {
  Options opt;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i] ? argv[i] : "";

    if (a == "-h" || a == "--help") {
      opt.help = true;
      continue;
    }

    auto requireValue = [&](const char* name) -> const char* {
      if (i + 1 >= argc || !argv[i + 1]) {
        std::cerr << "Missing value for " << name << "\n";
        opt.help = true;
        return nullptr;
      }
      return argv[++i];
    };

    if (a == "--autocorrect") {
      if (const char* v = requireValue("--autocorrect")) {
        if (!parseMode(v, opt.autocorrect)) {
          std::cerr << "Bad --autocorrect value: " << v << "\n";
          opt.help = true;
        }
      }
      continue;
    }
    if (a == "--settings") {
      if (const char* v = requireValue("--settings")) opt.settingsPath = v;
      continue;
    }
    if (a == "--modern") { opt.modernTone = true; continue; }
    if (a == "--no-restore") { opt.autoRestore = false; continue; }
    if (a == "--trace") { opt.trace = true; continue; }

    std::cerr << "Unknown arg: " << a << "\n";
    opt.help = true;
  }

  return opt;
}

static std::string readAllStdin() {
  std::string out;
  char buf[4096];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), stdin);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) {
      if (std::feof(stdin)) break;
      if (std::ferror(stdin)) break;
    }
  }
  return out;
}

// What a text field does with a key the engine passed through.
static void deliverKey(std::u32string& screen, char32_t key) {
  if (key == 0x08) {
    if (!screen.empty()) screen.pop_back();
    return;
  }
  if (key == 0x1B) return;
  screen.push_back(key);
}

static void applyEdit(std::u32string& screen, const tgtelex_Edit& e) {
  const size_t del = static_cast<size_t>(e.backspace);
  screen.erase(screen.size() - (del < screen.size() ? del : screen.size()));
  screen += tgtelex::utf8ToU32(e.textUtf8 ? e.textUtf8 : "");
}

}  // namespace

int main(int argc, char** argv) {
  const Options opt = parseArgs(argc, argv);
  if (opt.help) {
    printHelp(argv && argv[0] ? argv[0] : "telexRender");
    return 2;
  }

#if defined(_WIN32)
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif

  tgtelex_handle_t h = tgtelex_create();
  if (!h) {
    std::cerr << "tgtelex_create failed\n";
    return 1;
  }

  if (!opt.settingsPath.empty() && !tgtelex_loadSettings(h, opt.settingsPath.c_str())) {
    std::cerr << "Settings: " << tgtelex_getLastError(h) << "\n";
    tgtelex_destroy(h);
    return 1;
  }
  if (opt.autocorrect != TGTELEX_AUTOCORRECT_OFF) tgtelex_setAutocorrectMode(h, opt.autocorrect);
  if (opt.modernTone) tgtelex_setModernTone(h, 1);
  if (!opt.autoRestore) tgtelex_setAutoRestore(h, 0);

  const std::u32string keys = tgtelex::utf8ToU32(readAllStdin());
  std::u32string screen;

  for (char32_t key : keys) {
    tgtelex_Edit e{};
    if (!tgtelex_onKey(h, static_cast<uint32_t>(key), 0, &e)) {
      std::cerr << "onKey failed: " << tgtelex_getLastError(h) << "\n";
      tgtelex_destroy(h);
      return 1;
    }
    if (opt.trace) {
      std::cerr << "key U+" << std::hex << static_cast<uint32_t>(key) << std::dec
                << " action=" << e.action << " bs=" << e.backspace
                << " text='" << e.textUtf8 << "' pass=" << e.passKey << "\n";
    }
    applyEdit(screen, e);
    if (e.passKey) deliverKey(screen, key);
  }

  // End of input finishes the last word like a boundary would, without
  // adding a character.
  tgtelex_Edit e{};
  if (tgtelex_onKey(h, 0, 1, &e)) {
    applyEdit(screen, e);
  }

  const std::string out = tgtelex::u32ToUtf8(screen);
  std::fwrite(out.data(), 1, out.size(), stdout);
  tgtelex_destroy(h);
  return 0;
}
