#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include <string>
#include <vector>

namespace synthfi {

using std::string;
using std::vector;
using namespace eosio;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + std::to_string((int)code) + string("]] ") + msg); }

#ifdef DEBUG
#define TRACE(...) eosio::print(__VA_ARGS__, "\n")
#else
#define TRACE(...)
#endif

static constexpr eosio::name active_perm {"active"_n};

inline vector<string> split(const string& str, const string& delim) {
   vector<string> parts;
   size_t prev = 0, pos = 0;
   do {
      pos = str.find(delim, prev);
      if (pos == string::npos) pos = str.length();
      parts.push_back(str.substr(prev, pos - prev));
      prev = pos + delim.length();
   } while (pos < str.length() && prev <= str.length());
   return parts;
}

inline uint64_t to_uint64(const string& str, const char* title) {
   check(!str.empty(), string(title) + " is empty");
   uint64_t ret = 0;
   for (char c : str) {
      check(c >= '0' && c <= '9', string(title) + " is not a number: " + str);
      uint64_t next = ret * 10 + (c - '0');
      check(next / 10 == ret, string(title) + " overflow: " + str);
      ret = next;
   }
   return ret;
}

inline string uint128_to_string(uint128_t v) {
   if (v == 0) return "0";
   string ret;
   while (v > 0) {
      ret.insert(ret.begin(), char('0' + (int)(v % 10)));
      v /= 10;
   }
   return ret;
}

inline int64_t power10(uint8_t exp) {
   int64_t ret = 1;
   while (exp > 0) {
      ret *= 10; --exp;
   }
   return ret;
}

inline int64_t calc_precision(uint8_t digit) {
   check(digit <= 18, "precision digit " + std::to_string(digit) + " should be in range[0,18]");
   return power10(digit);
}

} // namespace synthfi
