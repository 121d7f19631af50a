// src/Mappings/MappingLine.cpp
#include <Piston/Mappings/MappingLine.hpp>

#include <cctype>
#include <cstring>
#include <sstream>
#include <utility>

namespace Piston::Mappings {

namespace {
    std::vector<std::string> splitOn(const std::string& text, const std::string& delimiter) {
        std::vector<std::string> parts;
        std::size_t start = 0;
        std::size_t pos;
        while ((pos = text.find(delimiter, start)) != std::string::npos) {
            parts.push_back(text.substr(start, pos - start));
            start = pos + delimiter.size();
        }
        parts.push_back(text.substr(start));
        return parts;
    }

    std::vector<std::string> splitWhitespace(const std::string& text) {
        std::vector<std::string> tokens;
        std::istringstream stream(text);
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string trim(const std::string& text) {
        std::size_t first = 0;
        while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
            ++first;
        }
        std::size_t last = text.size();
        while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
            --last;
        }
        return text.substr(first, last - first);
    }

    std::string beforeFirst(const std::string& text, char c) {
        return text.substr(0, text.find(c));
    }

    // Drops a "12:14:" line-range prefix; a token without colons is returned unchanged
    std::string afterLast(const std::string& text, char c) {
        std::size_t pos = text.rfind(c);
        return pos == std::string::npos ? text : text.substr(pos + 1);
    }

    MappingLine skipped() {
        return MappingLine{};
    }

    MappingLine parseMember(const std::string& deobfSide, const std::string& obfSide) {
        std::vector<std::string> tokens = splitWhitespace(deobfSide);
        if (tokens.size() < 2) {
            return skipped();
        }

        const std::string& name = tokens[1];
        MappingLine line;
        if (name.find('(') != std::string::npos && name.find(')') != std::string::npos) {
            MethodMember method;
            method.obfuscatedName = trim(obfSide);
            method.functionName = beforeFirst(name, '(');
            method.returnType = afterLast(tokens[0], ':');

            std::string params = afterLast(name, '(');
            params = beforeFirst(params, ')');
            if (!params.empty()) {
                method.parameterTypes = splitOn(params, ",");
            }

            line.kind = LineKind::METHOD_MEMBER;
            line.data = std::move(method);
        } else {
            FieldMember field;
            field.obfuscatedName = trim(obfSide);
            field.fieldName = name;
            line.kind = LineKind::FIELD_MEMBER;
            line.data = std::move(field);
        }
        return line;
    }
}

std::string line_kind_to_string(LineKind kind) {
    switch (kind) {
        case LineKind::COMMENT: return "comment";
        case LineKind::CLASS_HEADER: return "class";
        case LineKind::METHOD_MEMBER: return "method";
        case LineKind::FIELD_MEMBER: return "field";
        case LineKind::SKIPPED: return "skipped";
    }
    return "skipped";
}

MappingLine MappingLine::parse(const std::string& rawLine) {
    std::string text = rawLine;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    if (!text.empty() && text.front() == '#') {
        MappingLine comment;
        comment.kind = LineKind::COMMENT;
        return comment;
    }

    std::vector<std::string> parts = splitOn(text, kSeparator);
    if (parts.size() < 2) {
        return skipped();
    }

    if (text.compare(0, std::strlen(kMemberIndent), kMemberIndent) == 0) {
        return parseMember(parts[0], parts[1]);
    }

    ClassHeader header;
    header.deobfuscatedName = parts[0];
    header.obfuscatedName = beforeFirst(trim(parts[1]), ':');

    MappingLine line;
    line.kind = LineKind::CLASS_HEADER;
    line.data = std::move(header);
    return line;
}

} // namespace Piston::Mappings
