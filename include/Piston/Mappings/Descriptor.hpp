// include/Piston/Mappings/Descriptor.hpp
#ifndef PISTON_DESCRIPTOR_HPP
#define PISTON_DESCRIPTOR_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace Piston::Mappings {

    // Reference descriptor of a deobfuscated class ("Lcom/example/Foo;") -> raw obfuscated name.
    // Later insertions of the same key overwrite earlier ones.
    using NameTable = std::map<std::string, std::string>;

    struct ArrayStrip {
        std::string base;
        std::size_t dimensions = 0;
    };

    /**
     * @brief Removes every trailing "[]" from a type token.
     * @param token Raw type token, e.g. "int[][]".
     * @return The bare token and the number of markers removed.
     */
    ArrayStrip stripArrayMarkers(const std::string& token);

    /**
     * @brief Looks up the single-letter descriptor of a primitive keyword.
     * @param keyword Whole token; matching is exact and case-sensitive.
     * @return The descriptor letter, or std::nullopt for anything that is not one of the nine keywords.
     */
    std::optional<char> primitiveCode(const std::string& keyword);

    // "com.example.Foo" -> "com/example/Foo"
    std::string toInternalPath(const std::string& dottedName);

    // "com.example.Foo" -> "Lcom/example/Foo;"
    std::string referenceDescriptor(const std::string& dottedName);

    // Descriptor of a token without consulting any name table. This is the Name Table key form.
    std::string encodeUnmapped(const std::string& token);

    /**
     * @brief Encodes a type token as a JVM field descriptor.
     *
     * Array markers are counted first and re-applied as a "[" prefix. Reference types whose
     * descriptor is a key of @p table are replaced by the obfuscated class name.
     *
     * @param token Primitive keyword or dotted class name, optionally followed by "[]" markers.
     * @param table Class names collected from the same mapping file.
     */
    std::string encodeDescriptor(const std::string& token, const NameTable& table);

} // namespace Piston::Mappings

#endif // PISTON_DESCRIPTOR_HPP
