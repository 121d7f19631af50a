// src/Mappings/Descriptor.cpp
#include <Piston/Mappings/Descriptor.hpp>

#include <algorithm>

namespace Piston::Mappings {

namespace {
    const std::map<std::string, char>& primitiveTable() {
        static const std::map<std::string, char> table = {
            {"int", 'I'},
            {"double", 'D'},
            {"boolean", 'Z'},
            {"float", 'F'},
            {"long", 'J'},
            {"byte", 'B'},
            {"short", 'S'},
            {"char", 'C'},
            {"void", 'V'},
        };
        return table;
    }

    constexpr const char* kArrayMarker = "[]";
    constexpr std::size_t kArrayMarkerLength = 2;
}

ArrayStrip stripArrayMarkers(const std::string& token) {
    ArrayStrip result;
    result.base = token;
    while (result.base.size() >= kArrayMarkerLength &&
           result.base.compare(result.base.size() - kArrayMarkerLength, kArrayMarkerLength, kArrayMarker) == 0) {
        result.base.resize(result.base.size() - kArrayMarkerLength);
        ++result.dimensions;
    }
    return result;
}

std::optional<char> primitiveCode(const std::string& keyword) {
    const auto& table = primitiveTable();
    auto it = table.find(keyword);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string toInternalPath(const std::string& dottedName) {
    std::string path = dottedName;
    std::replace(path.begin(), path.end(), '.', '/');
    return path;
}

std::string referenceDescriptor(const std::string& dottedName) {
    return "L" + toInternalPath(dottedName) + ";";
}

std::string encodeUnmapped(const std::string& token) {
    ArrayStrip stripped = stripArrayMarkers(token);
    std::string base;
    if (auto code = primitiveCode(stripped.base)) {
        base = std::string(1, *code);
    } else {
        base = referenceDescriptor(stripped.base);
    }
    return std::string(stripped.dimensions, '[') + base;
}

std::string encodeDescriptor(const std::string& token, const NameTable& table) {
    ArrayStrip stripped = stripArrayMarkers(token);
    std::string base;
    if (auto code = primitiveCode(stripped.base)) {
        base = std::string(1, *code);
    } else {
        base = referenceDescriptor(stripped.base);
        auto it = table.find(base);
        if (it != table.end()) {
            // Obfuscated names may themselves be package-qualified
            base = referenceDescriptor(it->second);
        }
    }
    return std::string(stripped.dimensions, '[') + base;
}

} // namespace Piston::Mappings
