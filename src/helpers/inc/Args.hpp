#ifndef WATCHPOST_HELPERS_ARGS_HPP
#define WATCHPOST_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flags plus positional operands. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map/std::vector for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstddef>
#include <cstdio>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace watchpost {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--port"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/**
 * @brief Parse output: flag values by key, and operands in order.
 */
struct ParsedArgs {
  std::unordered_map<std::uint8_t, std::vector<std::string_view>> flags;
  std::vector<std::string_view> positional;

  /// @brief True if the flag was given.
  [[nodiscard]] bool has(std::uint8_t key) const { return flags.count(key) != 0; }

  /// @brief First value of a flag, or fallback when absent.
  [[nodiscard]] std::string_view value(std::uint8_t key, std::string_view fallback = {}) const {
    const auto IT = flags.find(key);
    if (IT == flags.end() || IT->second.empty()) {
      return fallback;
    }
    return IT->second.front();
  }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * A matched flag consumes the next nargs tokens literally as its values. Any
 * other token starting with "--" is rejected. Remaining tokens are operands;
 * after a bare "--" every token is an operand, so operands may start with '-'.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output (cleared first).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  pargs.flags.clear();
  pargs.positional.clear();

  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;
  bool operandsOnly = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];

    if (operandsOnly) {
      pargs.positional.emplace_back(TOK);
      continue;
    }
    if (TOK == "--") {
      operandsOnly = true;
      continue;
    }

    const auto IT = lut.find(TOK);
    if (IT == lut.end()) {
      if (TOK.size() > 2 && TOK.substr(0, 2) == "--") {
        if (error) {
          error->get() = fmt::format("Unknown option '{}'", TOK);
        }
        return false;
      }
      pargs.positional.emplace_back(TOK);
      continue;
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);

    if (i + static_cast<std::size_t>(DEF.nargs) >= args.size()) {
      if (error) {
        error->get() = fmt::format("Argument out of bounds: expected {} values for flag '{}'",
                                   DEF.nargs, DEF.flag);
      }
      return false;
    }

    std::vector<std::string_view>& out = pargs.flags[KEY];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param operands    Operand synopsis, e.g. "<command> <host>".
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @param out         Destination stream (stdout for --help, stderr on error).
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view operands,
                       std::string_view description, const ArgMap& map,
                       std::FILE* out = stdout) {
  fmt::print(out, "Usage: {} [OPTIONS] {}\n\n", progName, operands);

  if (!description.empty()) {
    fmt::print(out, "{}\n\n", description);
  }

  fmt::print(out, "Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs > 1) {
      flagStr.append(" <value> ...");
    } else if (def->nargs == 1) {
      flagStr.append(" <value>");
    }

    fmt::print(out, "  {:<22}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace watchpost

#endif // WATCHPOST_HELPERS_ARGS_HPP
