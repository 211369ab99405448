//
//  util.hpp
//  asegnc
//

#ifndef ASEGNC_UTIL_HPP
#define ASEGNC_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

// split on any of the delimiter characters, empty items kept
std::vector<std::string> split(const std::string& s, char delim = '\t');

std::string_view trim_ws(std::string_view sv);
std::string trim(const std::string& s);

std::string to_upper(std::string s);
std::string to_lower(std::string s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

// case-insensitive equality for ASCII names
bool iequals(std::string_view a, std::string_view b);

void strip_cr_inplace(std::string& s);

// strtod based, whole field must be consumed; Fortran 'D' exponents accepted
bool parse_double_strict(std::string_view sv, double& out);
bool parse_int64_strict(std::string_view sv, int64_t& out);

// path helpers (".gz" aware): data.dat.gz -> data
std::string strip_gz(const std::string& path);
std::string replace_extension(const std::string& path, const std::string& ext);
std::string path_stem(const std::string& path);
std::string path_filename(const std::string& path);

// LOG_ERROR + exit(1) when cond is false
void require(bool cond, const std::string& msg);

#endif
