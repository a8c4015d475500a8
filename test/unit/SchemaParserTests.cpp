//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <string>

#include "wiregold/Schema/SchemaParser.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

namespace
{

const std::string kProtoDir = std::string(WIREGOLD_SOURCE_DIR) + "/proto";

bool expectKind(llvm::Error err, wiregold::GenerationErrorKind expected, const char* label)
{
    const auto kind = wiregold::consumeGenerationErrorKind(std::move(err));
    if (!kind || *kind != expected)
    {
        std::cerr << label << ": expected " << wiregold::generationErrorKindName(expected).str() << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runSchemaParserTests()
{
    using wiregold::FieldPresence;
    using wiregold::GenerationErrorKind;
    using wiregold::ScalarKind;

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::loadSchemaFile(kProtoDir, "middle.proto", diag);
        if (!schema)
        {
            std::cerr << "middle.proto failed to load: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        if (schema->syntax != "proto3" || schema->package != "codec.middle" || schema->fileName != "middle.proto")
        {
            std::cerr << "middle.proto header mismatch\n";
            return false;
        }
        const wiregold::MessageSpec* middle = schema->findMessage("codec.middle.Middle");
        const wiregold::MessageSpec* nested = schema->findMessage("codec.middle.Middle.Nested");
        if (middle == nullptr || nested == nullptr || nested->localName != "Middle.Nested")
        {
            std::cerr << "middle.proto messages not resolved\n";
            return false;
        }
        const wiregold::FieldSpec* values       = middle->findByName("values");
        const wiregold::FieldSpec* packedValues = middle->findByName("packed_values");
        const wiregold::FieldSpec* label        = middle->findByName("label");
        const wiregold::FieldSpec* nestedField  = middle->findByNumber(6);
        const wiregold::FieldSpec* status       = middle->findByName("status");
        const wiregold::FieldSpec* tags         = middle->findByName("tags");
        if (values == nullptr || packedValues == nullptr || label == nullptr || nestedField == nullptr ||
            status == nullptr || tags == nullptr)
        {
            std::cerr << "middle.proto fields missing\n";
            return false;
        }
        if (!values->repeated || values->packed || !packedValues->packed ||
            packedValues->scalarKind != ScalarKind::SInt32 || tags->packed)
        {
            std::cerr << "packing flags mismatch\n";
            return false;
        }
        if (label->presence != FieldPresence::Implicit || nestedField->presence != FieldPresence::Explicit ||
            !nestedField->isMessage() || nestedField->typeName != "codec.middle.Middle.Nested")
        {
            std::cerr << "presence or nested type resolution mismatch\n";
            return false;
        }
        if (status->scalarKind != ScalarKind::Enum || status->typeName != "codec.middle.Status")
        {
            std::cerr << "enum field resolution mismatch\n";
            return false;
        }
        const wiregold::EnumSpec* statusEnum = schema->findEnum("codec.middle.Status");
        if (statusEnum == nullptr || statusEnum->findByNumber(2) == nullptr ||
            statusEnum->findByNumber(2)->name != "STATUS_FAIL")
        {
            std::cerr << "enum constants mismatch\n";
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::loadSchemaFile(kProtoDir, "difficult.proto", diag);
        if (!schema)
        {
            std::cerr << "difficult.proto failed to load: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        const wiregold::MessageSpec* difficult = schema->findMessage("codec.difficult.Difficult");
        if (difficult == nullptr)
        {
            std::cerr << "codec.difficult.Difficult missing\n";
            return false;
        }
        const wiregold::FieldSpec* counts = difficult->findByName("counts");
        if (counts == nullptr || !counts->isMessage() || !counts->repeated ||
            counts->typeName != "codec.difficult.Difficult.CountsEntry")
        {
            std::cerr << "map field must become a repeated entry message\n";
            return false;
        }
        const wiregold::MessageSpec* entry = schema->findMessage(counts->typeName);
        if (entry == nullptr || !entry->mapEntry || entry->fields.size() != 2U ||
            entry->fields[0].scalarKind != ScalarKind::String || entry->fields[1].scalarKind != ScalarKind::Int32 ||
            entry->fields[0].presence != FieldPresence::Always)
        {
            std::cerr << "map entry message mismatch\n";
            return false;
        }
        const wiregold::FieldSpec* text   = difficult->findByName("text");
        const wiregold::FieldSpec* number = difficult->findByName("number");
        if (text == nullptr || number == nullptr || text->oneofName != "choice" || number->oneofName != "choice" ||
            text->presence != FieldPresence::Explicit)
        {
            std::cerr << "oneof members mismatch\n";
            return false;
        }
        const wiregold::FieldSpec* scores = difficult->findByName("scores");
        if (scores == nullptr || !scores->packed || scores->scalarKind != ScalarKind::Double)
        {
            std::cerr << "proto3 repeated double must pack by default\n";
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::loadSchemaFile(kProtoDir, "simple.proto", diag);
        if (!schema)
        {
            std::cerr << "simple.proto failed to load: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        const wiregold::MessageSpec* wrapper = schema->findMessage("codec.simple.Int32Value");
        if (wrapper == nullptr || wrapper->fields.size() != 1U ||
            wrapper->fields.front().presence != FieldPresence::Explicit)
        {
            std::cerr << "optional proto3 field must carry explicit presence\n";
            return false;
        }
        auto missing = schema->requireMessage("codec.simple.Missing");
        if (missing || !expectKind(missing.takeError(), GenerationErrorKind::SchemaNotFound, "requireMessage"))
        {
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::loadSchemaFile(kProtoDir, "absent.proto", diag);
        if (schema || !expectKind(schema.takeError(), GenerationErrorKind::SchemaNotFound, "missing file"))
        {
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::parseSchemaText("inline.proto",
                                                "syntax = \"proto3\";\n"
                                                "package demo;\n"
                                                "message A { Unknown thing = 1; }\n",
                                                diag);
        if (schema || !expectKind(schema.takeError(), GenerationErrorKind::UnsupportedFieldKind, "unknown type"))
        {
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::parseSchemaText("inline.proto",
                                                "syntax = \"proto3\";\n"
                                                "message A { repeated string names = 1 [packed = true]; }\n",
                                                diag);
        if (schema || !expectKind(schema.takeError(), GenerationErrorKind::UnsupportedFieldKind, "packed string"))
        {
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema =
            wiregold::parseSchemaText("broken.proto", "syntax = \"proto3\";\nmessage A { int32 = 1; }\n", diag);
        if (schema)
        {
            std::cerr << "syntax error must fail the parse\n";
            return false;
        }
        llvm::consumeError(schema.takeError());
        if (!diag.hasErrors() || diag.diagnostics().front().site.file != "broken.proto" ||
            diag.diagnostics().front().site.line != 2U)
        {
            std::cerr << "syntax error must be reported at its source location\n";
            return false;
        }
    }

    {
        wiregold::DiagnosticEngine diag;
        auto schema = wiregold::parseSchemaText("proto2.proto",
                                                "syntax = \"proto2\";\n"
                                                "message B { optional int32 a = 1; repeated int32 b = 2; }\n",
                                                diag);
        if (!schema)
        {
            std::cerr << "proto2 schema failed: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        const wiregold::MessageSpec* b = schema->findMessage("B");
        if (b == nullptr || b->findByName("b") == nullptr || b->findByName("b")->packed ||
            b->findByName("a")->presence != FieldPresence::Explicit)
        {
            std::cerr << "proto2 defaults mismatch\n";
            return false;
        }
    }

    return true;
}
