#pragma once
#include "../common/result.hpp"
#include "object_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Parsing of S3 REST response bodies and headers. Only the handful of
// elements the client reads are understood; there is no general XML parser.

std::string stripQuotes(const std::string& s);

// predefined entities plus numeric references (emitted as UTF-8); anything
// unrecognised is kept verbatim
std::string xmlUnescape(const std::string& s);

// inner text of every <tag>...</tag>, in document order, still escaped
std::vector<std::string> xmlElements(const std::string& xml, const std::string& tag);

// first <tag>, unescaped; empty when absent
std::string xmlElement(const std::string& xml, const std::string& tag);

// "2009-10-12T17:50:30.000Z" -> unix seconds, 0 when malformed
int64_t parseIso8601(const std::string& text);

// "Wed, 12 Oct 2009 17:50:00 GMT" -> unix seconds, 0 when malformed
int64_t parseHttpDate(const std::string& text);

// ListObjectsV2 result; keys stay URL-encoded when encoding-type=url was requested
Result<ListPage> parseListObjects(const std::string& xml);
