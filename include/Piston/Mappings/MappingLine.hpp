// include/Piston/Mappings/MappingLine.hpp
#ifndef PISTON_MAPPINGLINE_HPP
#define PISTON_MAPPINGLINE_HPP

#include <string>
#include <variant>
#include <vector>

namespace Piston::Mappings {

    enum class LineKind {
        COMMENT,
        CLASS_HEADER,
        METHOD_MEMBER,
        FIELD_MEMBER,
        SKIPPED,
    };

    std::string line_kind_to_string(LineKind kind);

    // "com.example.Foo -> x:"
    struct ClassHeader {
        std::string deobfuscatedName;
        std::string obfuscatedName;
    };

    // "    12:14:com.example.Foo get(int,long[]) -> c"
    struct MethodMember {
        std::string obfuscatedName;
        std::string functionName;
        std::vector<std::string> parameterTypes;
        std::string returnType;
    };

    // "    int count -> a"
    struct FieldMember {
        std::string obfuscatedName;
        std::string fieldName;
    };

    struct MappingLine {
        LineKind kind = LineKind::SKIPPED;
        std::variant<std::monostate, ClassHeader, MethodMember, FieldMember> data;

        // Classifies one line of a ProGuard mapping file. Never throws; malformed lines come back SKIPPED.
        static MappingLine parse(const std::string& line);
    };

    inline constexpr const char* kSeparator = " -> ";
    inline constexpr const char* kMemberIndent = "    ";

} // namespace Piston::Mappings

#endif // PISTON_MAPPINGLINE_HPP
