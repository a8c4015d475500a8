//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wiregold/Corpus/MalformedCorpus.h"
#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Emit/CodecContract.h"
#include "wiregold/Emit/GoldenModel.h"
#include "wiregold/Schema/SchemaParser.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

namespace
{

bool expectContains(std::string_view rendered, std::string_view needle, const char* artifact)
{
    if (rendered.find(needle) == std::string_view::npos)
    {
        std::cerr << artifact << " artifact is missing: " << needle << "\n";
        return false;
    }
    return true;
}

bool expectAll(std::string_view rendered, const std::vector<std::string>& needles, const char* artifact)
{
    bool ok = true;
    for (const std::string& needle : needles)
    {
        ok = expectContains(rendered, needle, artifact) && ok;
    }
    return ok;
}

const std::string kProtoDir = std::string(WIREGOLD_SOURCE_DIR) + "/proto";

bool runScalarArtifactTests(const wiregold::CodecContract& contract)
{
    using wiregold::ScalarKind;
    using wiregold::ScalarValue;

    std::vector<wiregold::ScalarGoldenTable> tables;
    tables.push_back({ScalarKind::Int32,
                      "codec.simple.Int32Value",
                      {{wiregold::makeBytes({0x08, 0x80, 0x01}), ScalarValue::ofSigned(128)}}});
    tables.push_back({ScalarKind::SInt32,
                      "codec.simple.SInt32Value",
                      {{wiregold::makeBytes({0x08, 0x01}), ScalarValue::ofSigned(-1)}}});
    tables.push_back({ScalarKind::Enum,
                      "codec.simple.EnumValue",
                      {{wiregold::makeBytes({0x08, 0x01}), ScalarValue::ofEnum("SIMPLE_ENUM_ONE", 1)}}});
    tables.push_back({ScalarKind::Float,
                      "codec.simple.FloatValue",
                      {{wiregold::makeBytes({0x0D, 0x00, 0x00, 0xC0, 0x3F}), ScalarValue::ofUnsigned(0x3FC00000U)}}});

    const wiregold::ArtifactHeader header{"simple.proto", wiregold::goldenEntryPointName("simple")};
    const std::string rendered = wiregold::renderScalarArtifact(contract, header, tables);

    bool ok = expectAll(rendered,
                        {
                            "// Code generated by wiregold-gen from simple.proto. DO NOT EDIT.",
                            "#include \"protobuf/Codec.h\"",
                            "using Bytes = std::vector<std::uint8_t>;",
                            "std::int32_t decodeInt32(const Bytes& bytes)",
                            "if (tag.number != 1U || tag.wireType != 0U)",
                            "return protobuf::readInt32(reader);",
                            "return protobuf::readSInt32(reader).value;",
                            "protobuf::writeEnum(writer, protobuf::Enum{value});",
                            "std::uint32_t floatBits(const float value)",
                            "return floatBits(protobuf::readFloat(reader));",
                            "protobuf::writeFloat(writer, floatFromBits(value));",
                            "protobuf::writeTag(writer, 1U, 5U);",
                            "{\"CIAB\", 128},",
                            "{\"CAE=\", -1},",
                            "{\"DQAAwD8=\", 0x3FC00000U},",
                            "{\"Int32\", &checkInt32},",
                            "bool runCodecSimpleGoldenTests()",
                        },
                        "scalar");
    if (rendered.find("doubleBits(") != std::string::npos)
    {
        std::cerr << "scalar artifact emitted double helpers without a double table\n";
        ok = false;
    }

    const std::string empty = wiregold::renderScalarArtifact(contract, header, {});
    if (empty.find("kChecks") != std::string::npos || !expectContains(empty, "return true;", "empty scalar"))
    {
        std::cerr << "empty scalar artifact must not declare a check table\n";
        ok = false;
    }
    return ok;
}

bool runMessageArtifactTests(const wiregold::CodecContract& contract)
{
    using wiregold::MessageValue;
    using wiregold::ScalarValue;

    wiregold::DiagnosticEngine diag;
    auto middleSchema    = wiregold::loadSchemaFile(kProtoDir, "middle.proto", diag);
    auto difficultSchema = wiregold::loadSchemaFile(kProtoDir, "difficult.proto", diag);
    if (!middleSchema || !difficultSchema)
    {
        llvm::consumeError(middleSchema.takeError());
        llvm::consumeError(difficultSchema.takeError());
        std::cerr << "artifact tests could not load schemas\n";
        return false;
    }

    bool ok = true;
    {
        MessageValue nested;
        nested.set("count", ScalarValue::ofSigned(3)).set("flag", ScalarValue::ofBool(true));
        nested.set("note", ScalarValue::ofString("x"));
        MessageValue expected;
        expected.set("id", ScalarValue::ofSigned(1));
        expected.append("packed_values", {ScalarValue::ofSigned(-1)});
        expected.setMessage("nested", nested);
        expected.set("status", ScalarValue::ofEnum("STATUS_OK", 1));

        const wiregold::MessageSpec* root = middleSchema->findMessage("codec.middle.Middle");
        const wiregold::ArtifactHeader header{"middle.proto", wiregold::goldenEntryPointName("middle")};
        auto rendered = wiregold::renderMessageArtifact(contract,
                                                        header,
                                                        *middleSchema,
                                                        *root,
                                                        {{"seed-1", wiregold::makeBytes({0x08, 0x01}), expected}});
        if (!rendered)
        {
            std::cerr << "middle artifact failed: " << llvm::toString(rendered.takeError()) << "\n";
            return false;
        }
        ok = expectAll(*rendered,
                       {
                           "struct MiddleNested",
                           "std::optional<MiddleNested> nested{};",
                           "std::vector<std::int32_t> packed_values{};",
                           "bool operator==(const Middle&) const = default;",
                           "case 3U: {",
                           "protobuf::readPacked(reader, [&](protobuf::Reader& packed) { "
                           "value.packed_values.push_back(protobuf::readSInt32(packed).value); });",
                           "value.nested = decodeMiddleNested(nested);",
                           "protobuf::skipUnknown(reader, tag.wireType);",
                           "if (value.id != 0)",
                           "\"seed-1\",",
                           "\"CAE=\",",
                           "Middle{.id = 1, .packed_values = {-1}, .nested = MiddleNested{.count = 3LL, .flag = true, "
                           ".note = \"x\"}, .status = 1 /* STATUS_OK */},",
                           "return runCheck(\"Middle\", &checkMiddle);",
                           "bool runCodecMiddleGoldenTests()",
                       },
                       "middle") &&
             ok;
        if (rendered->find("struct MiddleNested") > rendered->find("struct Middle\n"))
        {
            std::cerr << "nested structs must precede their parent\n";
            ok = false;
        }
    }

    {
        MessageValue expected;
        expected.set("ratio", ScalarValue::ofDouble(1.5));
        expected.set("number", ScalarValue::ofSigned(5));

        const wiregold::MessageSpec* root = difficultSchema->findMessage("codec.difficult.Difficult");
        const wiregold::ArtifactHeader header{"difficult.proto", wiregold::goldenEntryPointName("difficult")};
        auto rendered =
            wiregold::renderMessageArtifact(contract, header, *difficultSchema, *root, {{"seed-0", {}, expected}});
        if (!rendered)
        {
            std::cerr << "difficult artifact failed: " << llvm::toString(rendered.takeError()) << "\n";
            return false;
        }
        ok = expectAll(*rendered,
                       {
                           "struct DifficultItem",
                           "struct DifficultCountsEntry",
                           "std::vector<DifficultCountsEntry> counts{};",
                           "std::optional<std::string> text{};",
                           "std::uint64_t ratio{};",
                           "value.text.reset();",
                           "value.number.reset();",
                           "std::uint64_t doubleBits(const double value)",
                           ".ratio = 0x3FF8000000000000ULL",
                           ".number = 5",
                       },
                       "difficult") &&
             ok;
    }

    {
        MessageValue expected;
        expected.set("id", ScalarValue::ofString("one"));
        const wiregold::MessageSpec* root = middleSchema->findMessage("codec.middle.Middle");
        auto rendered = wiregold::renderMessageArtifact(contract, {"middle.proto", "run"}, *middleSchema, *root,
                                                        {{"bad", {}, expected}});
        const auto kind = rendered ? std::nullopt : wiregold::consumeGenerationErrorKind(rendered.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::UnsupportedFieldKind)
        {
            std::cerr << "ill-typed expected value must report unsupported-field-kind\n";
            ok = false;
        }
    }

    {
        auto recursive = wiregold::parseSchemaText("node.proto",
                                                   "syntax = \"proto3\";\n"
                                                   "message Node { int32 id = 1; Node next = 2; }\n",
                                                   diag);
        if (!recursive)
        {
            std::cerr << "recursive schema failed to parse: " << llvm::toString(recursive.takeError()) << "\n";
            return false;
        }
        const wiregold::MessageSpec& node = recursive->messages.front();
        auto rendered = wiregold::renderMessageArtifact(contract, {"node.proto", "run"}, *recursive, node, {});
        const auto kind = rendered ? std::nullopt : wiregold::consumeGenerationErrorKind(rendered.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::UnsupportedFieldKind)
        {
            std::cerr << "recursive messages must be rejected\n";
            ok = false;
        }
    }

    return ok;
}

bool runMalformedArtifactTests(const wiregold::CodecContract& contract)
{
    const wiregold::ArtifactHeader header{"hand-authored malformed inputs",
                                          wiregold::goldenEntryPointName("malformed")};
    const std::string rendered = wiregold::renderMalformedArtifact(contract, header, wiregold::buildMalformedCorpus());
    bool ok = expectAll(rendered,
                        {
                            "bool checkUnknownWireType()",
                            "bool checkTruncatedString()",
                            "bool checkInvalidString()",
                            "decodeFixture(\"Dg==\")",
                            "(void) protobuf::readTag(reader);",
                            "(void) protobuf::readString(reader);",
                            "catch (const protobuf::DecodeError& error)",
                            "if (error.kind() != protobuf::DecodeErrorKind::TruncatedStream)",
                            "if (error.kind() != protobuf::DecodeErrorKind::InvalidEncoding)",
                            "if (!runCheck(\"unknown_wire_type\", &checkUnknownWireType))",
                            "bool runCodecMalformedGoldenTests()",
                        },
                        "malformed");
    if (rendered.find("checkUnknownWireType()") > rendered.find("checkTruncatedString()"))
    {
        std::cerr << "malformed checks must keep corpus order\n";
        ok = false;
    }
    return ok;
}

}  // namespace

bool runArtifactEmitterTests()
{
    if (wiregold::goldenEntryPointName("middle") != "runCodecMiddleGoldenTests" ||
        wiregold::goldenArtifactFileName("difficult") != "codec_difficult_test.cpp")
    {
        std::cerr << "artifact naming mismatch\n";
        return false;
    }

    const wiregold::CodecContract nestedContract("acme/pb/Codec.h", "acme::pb");
    if (nestedContract.readExpr(wiregold::ScalarKind::SInt64, "r") != "acme::pb::readSInt64(r).value" ||
        nestedContract.writeTagExpr("w", 7U, wiregold::WireType::LengthDelimited) != "acme::pb::writeTag(w, 7U, 2U)")
    {
        std::cerr << "nested codec namespace spelling mismatch\n";
        return false;
    }

    const wiregold::CodecContract contract("protobuf/Codec.h", "protobuf");
    bool ok = runScalarArtifactTests(contract);
    ok      = runMessageArtifactTests(contract) && ok;
    ok      = runMalformedArtifactTests(contract) && ok;
    return ok;
}
