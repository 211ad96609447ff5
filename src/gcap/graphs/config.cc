// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/config.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_set>

namespace gcap {
namespace graphs {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n'; }

void trim(std::string& t) {
  std::size_t a = 0;
  while (a < t.size() && is_space(t[a])) ++a;
  std::size_t b = t.size();
  while (b > a && is_space(t[b - 1])) --b;
  t = t.substr(a, b - a);
}

// Strict: only decimal digits allowed; reject any sign or other chars
bool to_uint(const std::string& t, std::size_t& out) {
  if (t.empty()) return false;
  for (unsigned char ch : t) {
    if (!std::isdigit(ch)) return false;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long long x = std::strtoull(t.c_str(), &end, 10);
  if (errno != 0 || (end && *end != '\0')) return false;
  if (x > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) return false;
  out = static_cast<std::size_t>(x);
  return true;
}

bool to_bool(const std::string& t, bool& out) {
  std::string u = t;
  for (auto& c : u) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (u == "1" || u == "true" || u == "yes" || u == "on") { out = true; return true; }
  if (u == "0" || u == "false" || u == "no" || u == "off") { out = false; return true; }
  return false;
}

void warn_once(const std::string& key, const char* fmt, const std::string& a, const std::string& b) {
  static std::mutex s_warned_mu;
  static std::unordered_set<std::string> s_warned;
  std::lock_guard<std::mutex> lk(s_warned_mu);
  if (s_warned.insert(key).second) {
    std::fprintf(stderr, fmt, a.c_str(), b.c_str());
  }
}

} // anonymous

GraphConfig parse_graph_conf(const char* text) {
  GraphConfig cfg;
  if (!text || !*text) return cfg;
  const std::string s(text);
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i] == ',')) ++i;
    if (i >= s.size()) break;
    std::size_t k0 = i;
    while (i < s.size() && s[i] != '=' && s[i] != ',') ++i;
    std::string key = s.substr(k0, i - k0);
    trim(key);
    if (i >= s.size() || s[i] != '=') {
      warn_once("?" + key, "[GCAP_GRAPH_CONF] warning: entry '%s' has no value (ignored)%s\n", key, "");
      continue;
    }
    ++i;
    std::size_t v0 = i;
    while (i < s.size() && s[i] != ',') ++i;
    std::string val = s.substr(v0, i - v0);
    trim(val);

    bool ok = true;
    if (key == "warmup_iters") {
      ok = to_uint(val, cfg.warmup_iters);
    } else if (key == "cache_capacity") {
      ok = to_uint(val, cfg.cache_capacity);
    } else if (key == "warn_entries") {
      ok = to_uint(val, cfg.warn_entries);
    } else if (key == "log_captures") {
      ok = to_bool(val, cfg.log_captures);
    } else {
      warn_once(key, "[GCAP_GRAPH_CONF] warning: unknown key '%s' (ignored)%s\n", key, "");
      continue;
    }
    if (!ok) {
      warn_once(key + "=" + val, "[GCAP_GRAPH_CONF] warning: invalid value for '%s': '%s' (ignored)\n",
                key, val);
    }
  }
  return cfg;
}

const GraphConfig& graph_config_from_env() {
  static const GraphConfig cfg = parse_graph_conf(std::getenv(kGraphConfEnv));
  return cfg;
}

} // namespace graphs
} // namespace gcap
