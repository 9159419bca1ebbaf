/*---------------------------------------------------------*/
/*                                                         */
/*   json_lite.cpp - Minimal JSON reading/writing helpers  */
/*                                                         */
/*---------------------------------------------------------*/

#include "json_lite.h"

#include <cstdio>

void jsonSkipWs(const std::string& s, size_t& pos)
{
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\n' || s[pos] == '\r' || s[pos] == '\t')) ++pos;
}

bool jsonConsume(const std::string& s, size_t& pos, char ch)
{
    jsonSkipWs(s, pos);
    if (pos < s.size() && s[pos] == ch) { ++pos; return true; }
    return false;
}

bool jsonParseString(const std::string& s, size_t& pos, std::string& out)
{
    jsonSkipWs(s, pos);
    if (pos >= s.size() || s[pos] != '"') return false;
    ++pos;
    std::string res;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') { out = res; return true; }
        if (c == '\\') {
            if (pos >= s.size()) return false;
            char e = s[pos++];
            switch (e) {
                case '"': res.push_back('"'); break;
                case '\\': res.push_back('\\'); break;
                case '/': res.push_back('/'); break;
                case 'n': res.push_back('\n'); break;
                case 'r': res.push_back('\r'); break;
                case 't': res.push_back('\t'); break;
                case 'u': {
                    // Only the ASCII range is meaningful for our names.
                    if (pos + 4 > s.size()) return false;
                    unsigned code = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = s[pos++];
                        code <<= 4;
                        if (h >= '0' && h <= '9') code |= unsigned(h - '0');
                        else if (h >= 'a' && h <= 'f') code |= unsigned(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') code |= unsigned(h - 'A' + 10);
                        else return false;
                    }
                    res.push_back(code < 0x80 ? char(code) : '?');
                    break;
                }
                default: res.push_back(e); break;
            }
        } else res.push_back(c);
    }
    return false;
}

bool jsonParseNumber(const std::string& s, size_t& pos, long& out)
{
    jsonSkipWs(s, pos);
    bool neg = false;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) { neg = (s[pos] == '-'); ++pos; }
    long val = 0; bool any = false;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
        any = true;
        if (val > 100000000000L) return false;
        val = val * 10 + (s[pos] - '0');
        ++pos;
    }
    if (!any) return false;
    // Fractions and exponents are not part of our schema.
    if (pos < s.size() && (s[pos] == '.' || s[pos] == 'e' || s[pos] == 'E')) return false;
    out = neg ? -val : val;
    return true;
}

bool jsonParseBool(const std::string& s, size_t& pos, bool& out)
{
    jsonSkipWs(s, pos);
    if (s.compare(pos, 4, "true") == 0) { out = true; pos += 4; return true; }
    if (s.compare(pos, 5, "false") == 0) { out = false; pos += 5; return true; }
    return false;
}

bool jsonSkipValue(const std::string& s, size_t& pos)
{
    jsonSkipWs(s, pos);
    if (pos >= s.size()) return false;
    const char c = s[pos];
    if (c == '"') { std::string tmp; return jsonParseString(s, pos, tmp); }
    if ((c >= '0' && c <= '9') || c == '-' || c == '+') { long dummy; return jsonParseNumber(s, pos, dummy); }
    if (c == 't' || c == 'f') { bool b; return jsonParseBool(s, pos, b); }
    if (s.compare(pos, 4, "null") == 0) { pos += 4; return true; }
    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            if (s[pos] == '"') {
                std::string tmp;
                if (!jsonParseString(s, pos, tmp)) return false;
                continue;
            }
            if (s[pos] == '{' || s[pos] == '[') depth++;
            else if (s[pos] == '}' || s[pos] == ']') depth--;
            ++pos;
            if (depth == 0) return true;
        }
    }
    return false;
}

std::string jsonEscape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else out += char(c);
        }
    }
    return out;
}
