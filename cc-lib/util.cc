#include "util.h"

#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdio.h>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <vector>

using namespace std;

static bool IsDir(const string &f) {
  struct stat st;
  return 0 == stat(f.c_str(), &st) && S_ISDIR(st.st_mode);
}

static string ReadAndCloseFile(FILE *f) {
  string ret;
  char buf[4096];
  for (;;) {
    size_t n = fread(buf, 1, sizeof (buf), f);
    ret.append(buf, n);
    if (n < sizeof (buf)) break;
  }
  fclose(f);
  return ret;
}

optional<string> Util::ReadFileOpt(const string &s) {
  if (s.empty() || IsDir(s)) return nullopt;
  FILE *f = fopen(s.c_str(), "rb");
  if (f == nullptr) return nullopt;
  return {ReadAndCloseFile(f)};
}

string Util::ReadFile(const string &s) {
  return ReadFileOpt(s).value_or("");
}

vector<string> Util::ReadFileToLines(const string &f) {
  return SplitToLines(ReadFile(f));
}

vector<string> Util::SplitToLines(const string &s) {
  vector<string> v;
  string line;
  for (char c : s) {
    if (c == '\r') {
      continue;
    } else if (c == '\n') {
      v.push_back(std::move(line));
      line.clear();
    } else {
      line += c;
    }
  }
  // Last line need not be terminated.
  if (!line.empty()) v.push_back(std::move(line));
  return v;
}

map<string, string> Util::ParseMap(const string &s) {
  map<string, string> m;
  for (const string &line : SplitToLines(s)) {
    string rest = NormalizeWhitespace(line);
    string tok = chop(rest);
    if (tok.empty() || tok[0] == '#') continue;
    m[tok] = losewhitel(rest);
  }
  return m;
}

map<string, string> Util::ReadFileToMap(const string &f) {
  return ParseMap(ReadFile(f));
}

string Util::chop(string &line) {
  for (size_t i = 0; i < line.length(); i++) {
    if (line[i] != ' ') {
      for (size_t j = i; j < line.length(); j++) {
        if (line[j] == ' ') {
          string acc = line.substr(i, j - i);
          line = line.substr(j);
          return acc;
        }
      }
      string acc = line.substr(i);
      line.clear();
      return acc;
    }
  }
  /* all whitespace */
  line.clear();
  return "";
}

static inline bool IsWhite(char c) {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

string Util::losewhitel(const string &s) {
  for (size_t i = 0; i < s.length(); i++) {
    if (!IsWhite(s[i])) return s.substr(i);
  }
  return "";
}

string Util::LoseWhiteR(string s) {
  while (!s.empty() && IsWhite(s.back())) s.pop_back();
  return s;
}

string Util::NormalizeWhitespace(const string &s) {
  string ret;
  // Skip at beginning.
  bool skip_ws = true;
  for (char c : s) {
    if (IsWhite(c)) {
      if (skip_ws) continue;
      ret += ' ';
      skip_ws = true;
    } else {
      ret += c;
      skip_ws = false;
    }
  }
  // Can have at most one trailing space.
  if (!ret.empty() && ret.back() == ' ') ret.pop_back();
  return ret;
}

vector<string> Util::Tokens(const string &s) {
  vector<string> out;
  string rest = NormalizeWhitespace(s);
  while (!rest.empty()) {
    string tok = chop(rest);
    if (!tok.empty()) out.push_back(std::move(tok));
  }
  return out;
}

string Util::lcase(const string &in) {
  string out;
  out.reserve(in.size());
  for (char c : in) {
    if (c >= 'A' && c <= 'Z') out += (char)(c | 32);
    else out += c;
  }
  return out;
}

bool Util::StartsWith(string_view big, string_view little) {
  if (big.size() < little.size()) return false;
  return big.substr(0, little.size()) == little;
}

optional<double> Util::ParseDoubleOpt(const string &s) {
  string ss = NormalizeWhitespace(s);
  if (ss.empty()) return nullopt;
  char *endptr = nullptr;
  double d = strtod(ss.c_str(), &endptr);
  if (endptr == ss.c_str() + ss.size()) return {d};
  return nullopt;
}

optional<int64_t> Util::ParseInt64Opt(const string &s) {
  string ss = NormalizeWhitespace(s);
  if (ss.empty()) return nullopt;
  char *endptr = nullptr;
  long long ll = strtoll(ss.c_str(), &endptr, 10);
  if (endptr == ss.c_str() + ss.size()) return {(int64_t)ll};
  return nullopt;
}
