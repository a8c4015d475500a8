//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <string>

#include "wiregold/Oracle/TextFormat.h"
#include "wiregold/Schema/SchemaParser.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

bool runTextFormatTests()
{
    using wiregold::MessageValue;
    using wiregold::ScalarValue;

    wiregold::DiagnosticEngine diag;
    auto schema = wiregold::loadSchemaFile(std::string(WIREGOLD_SOURCE_DIR) + "/proto", "middle.proto", diag);
    if (!schema)
    {
        std::cerr << "middle.proto failed to load: " << llvm::toString(schema.takeError()) << "\n";
        return false;
    }
    const wiregold::MessageSpec* middle = schema->findMessage("codec.middle.Middle");
    if (middle == nullptr)
    {
        std::cerr << "codec.middle.Middle missing\n";
        return false;
    }

    {
        MessageValue nested;
        nested.set("count", ScalarValue::ofSigned(3)).set("flag", ScalarValue::ofBool(true));
        nested.set("note", ScalarValue::ofString("x"));

        MessageValue value;
        value.set("id", ScalarValue::ofSigned(7));
        value.append("values", {ScalarValue::ofSigned(1), ScalarValue::ofSigned(-2)});
        value.setMessage("nested", nested);
        value.set("status", ScalarValue::ofEnum("STATUS_OK"));
        value.append("tags", {ScalarValue::ofString("a b")});

        auto text = wiregold::renderTextFormatMessage(*schema, *middle, value);
        if (!text)
        {
            std::cerr << "text-format render failed: " << llvm::toString(text.takeError()) << "\n";
            return false;
        }
        const std::string expected = "id: 7\n"
                                     "values: 1\n"
                                     "values: -2\n"
                                     "nested {\n"
                                     "  count: 3\n"
                                     "  flag: true\n"
                                     "  note: \"x\"\n"
                                     "}\n"
                                     "status: STATUS_OK\n"
                                     "tags: \"a b\"\n";
        if (*text != expected)
        {
            std::cerr << "text-format output mismatch:\n" << *text;
            return false;
        }
    }

    {
        auto text = wiregold::renderTextFormatMessage(*schema, *middle, MessageValue{});
        if (!text || !text->empty())
        {
            llvm::consumeError(text.takeError());
            std::cerr << "an empty message must render as empty text\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.set("undeclared", ScalarValue::ofSigned(1));
        auto text = wiregold::renderTextFormatMessage(*schema, *middle, value);
        if (text)
        {
            std::cerr << "undeclared field must be rejected\n";
            return false;
        }
        const auto kind = wiregold::consumeGenerationErrorKind(text.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::SchemaNotFound)
        {
            std::cerr << "undeclared field must report schema-not-found\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.set("id", ScalarValue::ofString("seven"));
        auto text = wiregold::renderTextFormatMessage(*schema, *middle, value);
        if (text)
        {
            std::cerr << "mismatched value kind must be rejected\n";
            return false;
        }
        const auto kind = wiregold::consumeGenerationErrorKind(text.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::UnsupportedFieldKind)
        {
            std::cerr << "mismatched value kind must report unsupported-field-kind\n";
            return false;
        }
    }

    return true;
}
