#ifndef _CC_LIB_UTIL_H
#define _CC_LIB_UTIL_H

#include <cstdint>
#include <map>
#include <optional>
#include <stdio.h>
#include <string>
#include <string_view>
#include <vector>

struct Util {
  // No error handling; it just returns "".
  static std::string ReadFile(const std::string &filename);
  // Same but returns nullopt if the file can't be read.
  static std::optional<std::string> ReadFileOpt(const std::string &filename);

  // Reads the lines in the file to the vector. Ignores all
  // carriage returns, including ones not followed by newline.
  static std::vector<std::string> ReadFileToLines(const std::string &f);

  static std::vector<std::string> SplitToLines(const std::string &s);

  // Treat the first token on each line as a map key, and the rest
  // of the line (without surrounding whitespace) as the value.
  // Ignores empty lines and lines whose first token starts with #.
  static std::map<std::string, std::string> ReadFileToMap(
      const std::string &f);
  // Same, on the contents rather than a filename.
  static std::map<std::string, std::string> ParseMap(const std::string &s);

  // Return first token in line (separated by spaces), removing it
  // from 'line'.
  static std::string chop(std::string &line);
  // Remove whitespace from the left or right.
  static std::string losewhitel(const std::string &s);
  static std::string LoseWhiteR(std::string s);
  // Remove leading and trailing whitespace, and collapse runs of
  // whitespace to a single space.
  static std::string NormalizeWhitespace(const std::string &s);

  // All the whitespace-separated tokens.
  static std::vector<std::string> Tokens(const std::string &s);

  static std::string lcase(const std::string &in);

  static bool StartsWith(std::string_view big, std::string_view little);

  // Parse the entire string (ignoring leading/trailing whitespace)
  // as a number, or return nullopt.
  static std::optional<double> ParseDoubleOpt(const std::string &s);
  static std::optional<int64_t> ParseInt64Opt(const std::string &s);
};

#endif
