//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Oracle/TextFormat.h"

#include "wiregold/Domain/LiteralRender.h"
#include "wiregold/Support/GenerationError.h"

#include "llvm/Support/raw_ostream.h"

namespace wiregold
{
namespace
{

llvm::Error renderFields(const SchemaFile&   schema,
                         const MessageSpec&  message,
                         const MessageValue& value,
                         unsigned            depth,
                         llvm::raw_ostream&  out)
{
    for (const FieldValue& fieldValue : value.fields)
    {
        const FieldSpec* field = message.findByName(fieldValue.name);
        if (field == nullptr)
        {
            return makeGenerationError(GenerationErrorKind::SchemaNotFound,
                                       "text-format",
                                       message.fullName + "." + fieldValue.name,
                                       "field is not declared in " + schema.fileName);
        }

        if (field->isMessage())
        {
            auto nested = schema.requireMessage(field->typeName);
            if (!nested)
            {
                return nested.takeError();
            }
            for (const MessageValue& element : fieldValue.messages)
            {
                out.indent(depth * 2U) << field->name << " {\n";
                if (llvm::Error err = renderFields(schema, **nested, element, depth + 1U, out))
                {
                    return err;
                }
                out.indent(depth * 2U) << "}\n";
            }
            continue;
        }

        for (const ScalarValue& scalar : fieldValue.scalars)
        {
            if (!scalarFitsKind(field->scalarKind, scalar))
            {
                return makeGenerationError(GenerationErrorKind::UnsupportedFieldKind,
                                           "text-format",
                                           message.fullName + "." + field->name,
                                           "value does not fit field kind '" +
                                               scalarKindInfo(field->scalarKind).schemaName.str() + "'");
            }
            out.indent(depth * 2U) << field->name << ": "
                                   << renderScalarLiteral(LiteralGrammar::TextFormat, field->scalarKind, scalar)
                                   << "\n";
        }
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<std::string> renderTextFormatMessage(const SchemaFile&   schema,
                                                    const MessageSpec&  message,
                                                    const MessageValue& value)
{
    std::string              text;
    llvm::raw_string_ostream out(text);
    if (llvm::Error err = renderFields(schema, message, value, 0U, out))
    {
        return std::move(err);
    }
    out.flush();
    return text;
}

}  // namespace wiregold
