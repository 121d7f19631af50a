// src/Mappings/MappingConverter.cpp
#include <Piston/Mappings/MappingConverter.hpp>
#include <Piston/Utils/Logger.hpp>

namespace Piston::Mappings {

static std::shared_ptr<spdlog::logger>& get_converter_logger() {
    static std::shared_ptr<spdlog::logger> converter_logger = Utils::Logger::GetOrCreateLogger("MappingConverter");
    return converter_logger;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

NameTable buildNameTable(const std::string& mappings, ConversionStats* stats) {
    NameTable table;
    std::size_t duplicates = 0;

    for (const auto& raw : splitLines(mappings)) {
        MappingLine line = MappingLine::parse(raw);
        if (line.kind != LineKind::CLASS_HEADER) {
            continue;
        }
        const auto& header = std::get<ClassHeader>(line.data);
        std::string key = encodeUnmapped(header.deobfuscatedName);

        auto [it, inserted] = table.insert_or_assign(key, header.obfuscatedName);
        if (!inserted) {
            ++duplicates;
            get_converter_logger()->debug("Duplicate class {} now maps to {}", header.deobfuscatedName, it->second);
        }
    }

    if (stats) {
        stats->duplicateClasses = duplicates;
        stats->nameTableSize = table.size();
    }
    get_converter_logger()->trace("Name table built with {} classes ({} duplicates).", table.size(), duplicates);
    return table;
}

std::string encodeMethodSignature(const MethodMember& method, const NameTable& table) {
    std::string signature = "(";
    for (const auto& param : method.parameterTypes) {
        signature += encodeDescriptor(param, table);
    }
    signature += ")";
    signature += encodeDescriptor(method.returnType, table);
    return signature;
}

std::optional<std::string> emitLine(const MappingLine& line, const NameTable& table) {
    switch (line.kind) {
        case LineKind::CLASS_HEADER: {
            const auto& header = std::get<ClassHeader>(line.data);
            return toInternalPath(header.obfuscatedName) + " " + toInternalPath(header.deobfuscatedName);
        }
        case LineKind::METHOD_MEMBER: {
            const auto& method = std::get<MethodMember>(line.data);
            return "\t" + method.obfuscatedName + " " + encodeMethodSignature(method, table) + " " + method.functionName;
        }
        case LineKind::FIELD_MEMBER: {
            const auto& field = std::get<FieldMember>(line.data);
            return "\t" + field.obfuscatedName + " " + field.fieldName;
        }
        case LineKind::COMMENT:
        case LineKind::SKIPPED:
            break;
    }
    return std::nullopt;
}

std::string convertMappings(const std::string& mappings, ConversionStats& stats) {
    stats = ConversionStats{};
    NameTable table = buildNameTable(mappings, &stats);

    std::string output;
    output.reserve(mappings.size());

    for (const auto& raw : splitLines(mappings)) {
        MappingLine line = MappingLine::parse(raw);
        switch (line.kind) {
            case LineKind::CLASS_HEADER: ++stats.classes; break;
            case LineKind::METHOD_MEMBER: ++stats.methods; break;
            case LineKind::FIELD_MEMBER: ++stats.fields; break;
            case LineKind::COMMENT: ++stats.comments; break;
            case LineKind::SKIPPED: ++stats.skipped; break;
        }

        if (auto emitted = emitLine(line, table)) {
            output += *emitted;
            output += '\n';
        }
    }

    get_converter_logger()->debug("Converted {} classes, {} methods, {} fields ({} comments, {} lines skipped).",
        stats.classes, stats.methods, stats.fields, stats.comments, stats.skipped);
    return output;
}

std::string convertMappings(const std::string& mappings) {
    ConversionStats stats;
    return convertMappings(mappings, stats);
}

} // namespace Piston::Mappings
