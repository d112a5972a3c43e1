#pragma once

// JsonArtifacts.h
//
// Scoped reads of per-run and envelope JSON documents plus tolerant field
// accessors. Absent or null fields come back as empty optionals; only the
// require* variants raise.

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace envdiag {
namespace json {

using Document = nlohmann::json;

bool fileExists(const std::string& path);

// Parses the whole file. Throws ArtifactError naming the path when the file
// cannot be opened or does not parse.
Document readDocument(const std::string& path);

// Object member lookup; nullptr when absent, null, or `obj` is not an object.
const Document* member(const Document& obj, const char* key);

std::optional<double> optNumber(const Document& obj, const char* key);
std::optional<std::string> optString(const Document& obj, const char* key);

// Throws ArtifactError("<context>: missing numeric field '<key>'").
double requireNumber(const Document& obj, const char* key, const std::string& context);
const Document& requireObject(const Document& obj, const char* key, const std::string& context);

} // namespace json
} // namespace envdiag
