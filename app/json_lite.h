/*---------------------------------------------------------*/
/*                                                         */
/*   json_lite.h - Minimal JSON reading/writing helpers    */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef JSON_LITE_H
#define JSON_LITE_H

#include <string>

// Subset tailored to small flat files: strings, integers, booleans,
// objects and arrays. On false `pos` is left inside the bad value and
// the caller abandons the document.
void jsonSkipWs(const std::string& s, size_t& pos);
bool jsonConsume(const std::string& s, size_t& pos, char ch);
bool jsonParseString(const std::string& s, size_t& pos, std::string& out);
bool jsonParseNumber(const std::string& s, size_t& pos, long& out);
bool jsonParseBool(const std::string& s, size_t& pos, bool& out);
// Skips any single value (nested objects/arrays included).
bool jsonSkipValue(const std::string& s, size_t& pos);

std::string jsonEscape(const std::string& s);

#endif // JSON_LITE_H
