// include/Piston/Mappings/MappingConverter.hpp
#ifndef PISTON_MAPPINGCONVERTER_HPP
#define PISTON_MAPPINGCONVERTER_HPP

#include <Piston/Mappings/Descriptor.hpp>
#include <Piston/Mappings/MappingLine.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Piston::Mappings {

    // Per-invocation counters. Requesting them never changes the converted text.
    struct ConversionStats {
        std::size_t classes = 0;
        std::size_t methods = 0;
        std::size_t fields = 0;
        std::size_t comments = 0;
        std::size_t skipped = 0;
        std::size_t duplicateClasses = 0;
        std::size_t nameTableSize = 0;
    };

    // Splits on '\n'. A trailing '\r' is left for MappingLine::parse to drop.
    std::vector<std::string> splitLines(const std::string& text);

    /**
     * @brief First pass: collects every class header of a ProGuard mapping.
     * @param mappings Full mapping text.
     * @param stats Optional; receives duplicateClasses and nameTableSize.
     * @return Descriptor of each deobfuscated class name mapped to its obfuscated name.
     */
    NameTable buildNameTable(const std::string& mappings, ConversionStats* stats = nullptr);

    // "(I[Lx;)V" for a method taking (int, com.example.Foo[]) and returning void
    std::string encodeMethodSignature(const MethodMember& method, const NameTable& table);

    // Output line for one classified input line, without the trailing newline.
    // Comments and skipped lines produce std::nullopt.
    std::optional<std::string> emitLine(const MappingLine& line, const NameTable& table);

    /**
     * @brief Converts ProGuard mappings to the TSRG descriptor format.
     *
     * Class headers become "obf deobf" with internal names, members become tab-indented
     * "obf (params)ret name" or "obf name" lines. Malformed lines are dropped silently.
     */
    std::string convertMappings(const std::string& mappings);
    std::string convertMappings(const std::string& mappings, ConversionStats& stats);

} // namespace Piston::Mappings

#endif // PISTON_MAPPINGCONVERTER_HPP
