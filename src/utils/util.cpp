//
//  util.cpp
//  asegnc
//

#include "utils/util.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

using namespace std;

vector<string> split(const string& s, char delim)
{
    vector<string> out;
    size_t start = 0;
    for (size_t j = 0; j <= s.size(); ++j) {
        if (j == s.size() || s[j] == delim) {
            out.emplace_back(s, start, j - start);
            start = j + 1;
        }
    }
    return out;
}

string_view trim_ws(string_view sv)
{
    while (!sv.empty() && isspace((unsigned char)sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && isspace((unsigned char)sv.back()))  sv.remove_suffix(1);
    return sv;
}

string trim(const string& s)
{
    return string(trim_ws(s));
}

string to_upper(string s)
{
    for (auto &c : s) c = (char)toupper((unsigned char)c);
    return s;
}

string to_lower(string s)
{
    for (auto &c : s) c = (char)tolower((unsigned char)c);
    return s;
}

bool starts_with(string_view s, string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(string_view s, string_view suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool iequals(string_view a, string_view b)
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) return false;
    }
    return true;
}

void strip_cr_inplace(string& s)
{
    if (!s.empty() && s.back() == '\r') { s.pop_back(); return; }
    s.erase(remove(s.begin(), s.end(), '\r'), s.end());
}

bool parse_double_strict(string_view sv, double& out)
{
    sv = trim_ws(sv);
    if (sv.empty()) return false;

    // short fields: stack buffer, no heap
    char buf[128];
    if (sv.size() >= sizeof(buf)) return false;
    memcpy(buf, sv.data(), sv.size());
    buf[sv.size()] = '\0';

    // 1.0D+03 -> 1.0E+03
    for (size_t i = 0; i < sv.size(); ++i) {
        if (buf[i] == 'D' || buf[i] == 'd') buf[i] = 'E';
    }

    errno = 0;
    char *end = nullptr;
    out = strtod(buf, &end);

    if (end == buf) return false;
    if (*end != '\0') return false;
    if (errno == ERANGE) return false;
    return isfinite(out);
}

bool parse_int64_strict(string_view sv, int64_t& out)
{
    sv = trim_ws(sv);
    if (sv.empty()) return false;

    char buf[64];
    if (sv.size() >= sizeof(buf)) return false;
    memcpy(buf, sv.data(), sv.size());
    buf[sv.size()] = '\0';

    errno = 0;
    char *end = nullptr;
    long long v = strtoll(buf, &end, 10);
    if (end == buf || errno == ERANGE) return false;

    // integer columns written as "12." or "12.0" by some exporters
    if (*end == '.') {
        ++end;
        while (*end == '0') ++end;
    }
    if (*end != '\0') return false;
    out = (int64_t)v;
    return true;
}

string strip_gz(const string& path)
{
    if (ends_with(path, ".gz")) return path.substr(0, path.size() - 3);
    return path;
}

string replace_extension(const string& path, const string& ext)
{
    string base = strip_gz(path);
    size_t slash = base.find_last_of('/');
    size_t dot = base.find_last_of('.');
    if (dot != string::npos && (slash == string::npos || dot > slash)) {
        base.erase(dot);
    }
    return base + ext;
}

string path_filename(const string& path)
{
    size_t slash = path.find_last_of('/');
    return slash == string::npos ? path : path.substr(slash + 1);
}

string path_stem(const string& path)
{
    string name = path_filename(strip_gz(path));
    size_t dot = name.find_last_of('.');
    if (dot != string::npos && dot > 0) name.erase(dot);
    return name;
}

void require(bool cond, const string& msg)
{
    if (!cond) {
        LOG_ERROR(msg);
        exit(1);
    }
}
