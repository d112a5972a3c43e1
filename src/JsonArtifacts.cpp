#include "JsonArtifacts.h"

#include "DiagnosticTypes.h"

#include <filesystem>
#include <fstream>

namespace envdiag {
namespace json {

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

Document readDocument(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ArtifactError("cannot open " + path);
    }
    try {
        return Document::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ArtifactError("malformed JSON in " + path + ": " + e.what());
    }
}

const Document* member(const Document& obj, const char* key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<double> optNumber(const Document& obj, const char* key) {
    const Document* v = member(obj, key);
    if (!v || !v->is_number()) {
        return std::nullopt;
    }
    return v->get<double>();
}

std::optional<std::string> optString(const Document& obj, const char* key) {
    const Document* v = member(obj, key);
    if (!v || !v->is_string()) {
        return std::nullopt;
    }
    return v->get<std::string>();
}

double requireNumber(const Document& obj, const char* key, const std::string& context) {
    const auto v = optNumber(obj, key);
    if (!v) {
        throw ArtifactError(context + ": missing numeric field '" + key + "'");
    }
    return *v;
}

const Document& requireObject(const Document& obj, const char* key, const std::string& context) {
    const Document* v = member(obj, key);
    if (!v || !v->is_object()) {
        throw ArtifactError(context + ": missing object '" + key + "'");
    }
    return *v;
}

} // namespace json
} // namespace envdiag
