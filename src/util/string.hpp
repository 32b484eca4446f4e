#pragma once

#include <string>
#include <vector>
#include <map>

#include "util/error.hpp"

typedef std::map<std::string, std::string> TStringMap;
typedef std::vector<std::string> TTuple;

TError StringToUint64(const std::string &string, uint64_t &value);
TError StringToOct(const std::string &str, unsigned &value);

TTuple SplitString(const std::string &str, const char sep, int max = 0);

std::string StringTrim(const std::string& s, const std::string &what = " \t\n");
bool StringStartsWith(const std::string &str, const std::string &prefix);
bool StringEndsWith(const std::string &str, const std::string &suffix);

std::string StringFormatSize(uint64_t value);
