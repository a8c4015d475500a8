//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Resolved schema model: messages, fields and enums of one `.proto` file.
///
//===----------------------------------------------------------------------===//
#ifndef WIREGOLD_SCHEMA_SCHEMAMODEL_H
#define WIREGOLD_SCHEMA_SCHEMAMODEL_H

#include "wiregold/Domain/ScalarKind.h"
#include "wiregold/Domain/WireType.h"
#include "wiregold/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace wiregold
{

/// @brief Default-omission rule of a field.
enum class FieldPresence
{
    /// @brief Zero or empty values are not written and decode as absent.
    Implicit,

    /// @brief The value is written whenever it is set, zero included.
    Explicit,

    /// @brief The value is always written (map entry key and value).
    Always,
};

/// @brief Whether a field holds scalars or sub-messages.
enum class FieldCategory
{
    Scalar,
    Message,
};

/// @brief One resolved message field.
struct FieldSpec final
{
    /// @brief Field name as declared.
    std::string name;

    /// @brief Tag number.
    std::uint32_t number{0};

    /// @brief Scalar or message field.
    FieldCategory category{FieldCategory::Scalar};

    /// @brief Scalar kind; meaningful for scalar fields only.
    ScalarKind scalarKind{ScalarKind::Int32};

    /// @brief Fully-qualified enum or message type name, empty for primitives.
    std::string typeName;

    /// @brief Field is repeated.
    bool repeated{false};

    /// @brief Repeated field uses packed framing.
    bool packed{false};

    /// @brief Default-omission rule.
    FieldPresence presence{FieldPresence::Implicit};

    /// @brief Enclosing oneof name, empty outside a oneof.
    std::string oneofName;

    /// @brief Declaration position.
    DiagnosticSite location;

    [[nodiscard]] bool isMessage() const
    {
        return category == FieldCategory::Message;
    }

    /// @brief Wire type of one unpacked element.
    [[nodiscard]] WireType elementWireType() const;

    /// @brief Wire type written for the field on encode.
    [[nodiscard]] WireType wireType() const;
};

/// @brief One enum constant.
struct EnumValueSpec final
{
    std::string  name;
    std::int32_t number{0};
};

/// @brief One resolved enum type.
struct EnumSpec final
{
    /// @brief Fully-qualified name (`codec.middle.Status`).
    std::string fullName;

    /// @brief Constants in declaration order.
    std::vector<EnumValueSpec> values;

    [[nodiscard]] const EnumValueSpec* findByName(llvm::StringRef name) const;

    [[nodiscard]] const EnumValueSpec* findByNumber(std::int32_t number) const;
};

/// @brief One resolved message type.
struct MessageSpec final
{
    /// @brief Fully-qualified name (`codec.middle.Middle.Nested`).
    std::string fullName;

    /// @brief Name relative to the package (`Middle.Nested`).
    std::string localName;

    /// @brief Synthesized map-entry message.
    bool mapEntry{false};

    /// @brief Fields in declaration order.
    std::vector<FieldSpec> fields;

    /// @brief Declaration position.
    DiagnosticSite location;

    [[nodiscard]] const FieldSpec* findByName(llvm::StringRef name) const;

    [[nodiscard]] const FieldSpec* findByNumber(std::uint32_t number) const;
};

/// @brief All types declared by one schema file.
struct SchemaFile final
{
    /// @brief Path the file was read from.
    std::string path;

    /// @brief File name relative to its schema directory, as passed to the oracle.
    std::string fileName;

    /// @brief `proto2` or `proto3`.
    std::string syntax{"proto2"};

    /// @brief Declared package, empty when absent.
    std::string package;

    /// @brief Imported file names (recorded, not followed).
    std::vector<std::string> imports;

    /// @brief Messages in declaration order, nested and map-entry types included.
    std::vector<MessageSpec> messages;

    /// @brief Enums in declaration order, nested ones included.
    std::vector<EnumSpec> enums;

    [[nodiscard]] const MessageSpec* findMessage(llvm::StringRef fullName) const;

    [[nodiscard]] const EnumSpec* findEnum(llvm::StringRef fullName) const;

    /// @brief Looks up a message and fails with `SchemaNotFound` when absent.
    [[nodiscard]] llvm::Expected<const MessageSpec*> requireMessage(llvm::StringRef fullName) const;
};

}  // namespace wiregold

#endif  // WIREGOLD_SCHEMA_SCHEMAMODEL_H
