#ifndef TRK_EXAMPLES_CLI_COLORS_H
#define TRK_EXAMPLES_CLI_COLORS_H

#include <ostream>
#include <string>
#include <string_view>

#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace trk_cli {
struct Colors {
  bool enabled = false;
  std::string_view reset = "\033[0m";
  std::string_view bold = "\033[1m";
  std::string_view cyan = "\033[36m";
  std::string_view green = "\033[32m";
  std::string_view yellow = "\033[33m";
};

inline bool stdout_supports_color() {
#if defined(_WIN32) || defined(_WIN64)
  HANDLE h = GetStdHandle(STD_OUTPUT_HANDLE);
  if (h == INVALID_HANDLE_VALUE || h == nullptr) {
    return false;
  }
  DWORD mode = 0;
  return GetConsoleMode(h, &mode) != 0;
#else
  return isatty(fileno(stdout)) != 0;
#endif
}

inline Colors terminal_colors() {
  Colors colors;
  colors.enabled = stdout_supports_color();
  return colors;
}

inline std::string colorize(const Colors &colors, std::string_view code, const std::string &text) {
  if (!colors.enabled) {
    return text;
  }
  return std::string(code) + text + std::string(colors.reset);
}

// "  Label: value" with the label highlighted.
template <typename T>
void print_field(std::ostream &out, const Colors &colors, const std::string &label, const T &value, int indent = 2) {
  out << std::string(static_cast<size_t>(indent), ' ') << colorize(colors, colors.cyan, label) << ": " << value
      << "\n";
}

inline void print_section(std::ostream &out, const Colors &colors, const std::string &title) {
  out << colorize(colors, colors.green, title) << ":\n";
}
} // namespace trk_cli

#endif
