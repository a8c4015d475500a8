//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

#include "wiregold/Canon/Canonicalize.h"
#include "wiregold/Schema/SchemaParser.h"
#include "wiregold/Support/Diagnostics.h"
#include "wiregold/Support/GenerationError.h"

namespace
{

const std::string kProtoDir = std::string(WIREGOLD_SOURCE_DIR) + "/proto";

bool expectMalformed(llvm::Error err, const char* label)
{
    const auto kind = wiregold::consumeGenerationErrorKind(std::move(err));
    if (!kind || *kind != wiregold::GenerationErrorKind::MalformedOracleOutput)
    {
        std::cerr << label << ": expected malformed-oracle-output\n";
        return false;
    }
    return true;
}

bool runScalarCanonicalization(const wiregold::SchemaFile& simple)
{
    using wiregold::ScalarKind;
    using wiregold::ScalarValue;

    {
        auto bits = wiregold::floatBitsFromEncoded(wiregold::makeBytes({0x0D, 0x00, 0x00, 0xC0, 0x3F}));
        if (!bits || *bits != 0x3FC00000U)
        {
            llvm::consumeError(bits.takeError());
            std::cerr << "float bits must come from the four payload octets\n";
            return false;
        }
        auto shortBits = wiregold::doubleBitsFromEncoded(wiregold::makeBytes({0x09, 0x00}));
        if (shortBits || !expectMalformed(shortBits.takeError(), "short double"))
        {
            return false;
        }
    }

    const wiregold::MessageSpec* int32Value = simple.findMessage("codec.simple.Int32Value");
    const wiregold::MessageSpec* enumValue  = simple.findMessage("codec.simple.EnumValue");
    const wiregold::MessageSpec* floatValue = simple.findMessage("codec.simple.FloatValue");
    if (int32Value == nullptr || enumValue == nullptr || floatValue == nullptr)
    {
        std::cerr << "simple.proto wrapper messages missing\n";
        return false;
    }

    {
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *int32Value,
                                                      ScalarKind::Int32,
                                                      ScalarValue::ofSigned(128),
                                                      wiregold::makeBytes({0x08, 0x80, 0x01}));
        if (!value || !value->isSigned() || value->asSigned() != 128)
        {
            llvm::consumeError(value.takeError());
            std::cerr << "int32 128 canonicalization mismatch\n";
            return false;
        }
    }

    {
        // Explicit presence keeps a zero value on the wire.
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *int32Value,
                                                      ScalarKind::Int32,
                                                      ScalarValue::ofSigned(0),
                                                      wiregold::makeBytes({0x08, 0x00}));
        if (!value || value->asSigned() != 0)
        {
            llvm::consumeError(value.takeError());
            std::cerr << "explicit zero canonicalization mismatch\n";
            return false;
        }
    }

    {
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *int32Value,
                                                      ScalarKind::Int32,
                                                      ScalarValue::ofSigned(128),
                                                      wiregold::makeBytes({0x08, 0x01}));
        if (value || !expectMalformed(value.takeError(), "oracle disagreement"))
        {
            return false;
        }
    }

    {
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *enumValue,
                                                      ScalarKind::Enum,
                                                      ScalarValue::ofEnum("SIMPLE_ENUM_MAX"),
                                                      wiregold::makeBytes({0x08, 0xFF, 0xFF, 0xFF, 0xFF, 0x07}));
        if (!value || !value->isEnum() || value->asEnum().number != 2147483647 ||
            value->asEnum().name != "SIMPLE_ENUM_MAX")
        {
            llvm::consumeError(value.takeError());
            std::cerr << "enum canonicalization must resolve the declared number\n";
            return false;
        }
    }

    {
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *floatValue,
                                                      ScalarKind::Float,
                                                      ScalarValue::ofDouble(3.1415927),
                                                      wiregold::makeBytes({0x0D, 0xDB, 0x0F, 0x49, 0x40}));
        if (!value || !value->isUnsigned() || value->asUnsigned() != 0x40490FDBU)
        {
            llvm::consumeError(value.takeError());
            std::cerr << "float canonicalization must keep the oracle bit pattern\n";
            return false;
        }
    }

    {
        // NaN keeps the encoder's exact quiet-NaN payload.
        auto value = wiregold::canonicalizeScalarCase(simple,
                                                      *floatValue,
                                                      ScalarKind::Float,
                                                      ScalarValue::ofDouble(std::numeric_limits<double>::quiet_NaN()),
                                                      wiregold::makeBytes({0x0D, 0x00, 0x00, 0xC0, 0x7F}));
        if (!value || !value->isUnsigned() || value->asUnsigned() != 0x7FC00000U)
        {
            llvm::consumeError(value.takeError());
            std::cerr << "float NaN canonicalization must keep the oracle bit pattern\n";
            return false;
        }
        const wiregold::ByteString doubleNaN =
            wiregold::makeBytes({0x09, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x7F});
        auto doubleBits = wiregold::doubleBitsFromEncoded(doubleNaN);
        if (!doubleBits || *doubleBits != 0x7FF8000000000000ULL)
        {
            llvm::consumeError(doubleBits.takeError());
            std::cerr << "double NaN bits must come from the eight payload octets\n";
            return false;
        }
    }

    return true;
}

bool runCompositeCanonicalization(const wiregold::SchemaFile& middleSchema, const wiregold::SchemaFile& difficultSchema)
{
    using wiregold::MessageValue;
    using wiregold::ScalarValue;

    const wiregold::MessageSpec* middle    = middleSchema.findMessage("codec.middle.Middle");
    const wiregold::MessageSpec* difficult = difficultSchema.findMessage("codec.difficult.Difficult");
    if (middle == nullptr || difficult == nullptr)
    {
        std::cerr << "composite root messages missing\n";
        return false;
    }

    {
        MessageValue defaults;
        defaults.set("id", ScalarValue::ofSigned(0));
        defaults.set("label", ScalarValue::ofString(""));
        auto encoded = wiregold::encodeMessage(middleSchema, *middle, defaults);
        if (!encoded || !encoded->empty())
        {
            llvm::consumeError(encoded.takeError());
            std::cerr << "implicit-presence defaults must encode to zero bytes\n";
            return false;
        }
        auto canonical = wiregold::canonicalizeCompositeCase(middleSchema, *middle, defaults, wiregold::ByteString{});
        if (!canonical || !canonical->empty())
        {
            llvm::consumeError(canonical.takeError());
            std::cerr << "all-default case must canonicalize to an empty value\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.append("packed_values", {});
        auto encoded = wiregold::encodeMessage(middleSchema, *middle, value);
        if (!encoded || !encoded->empty())
        {
            llvm::consumeError(encoded.takeError());
            std::cerr << "an empty packed field must contribute zero bytes\n";
            return false;
        }

        auto decoded = wiregold::decodeMessage(middleSchema, *middle, wiregold::makeBytes({0x1A, 0x00}));
        if (!decoded)
        {
            std::cerr << "empty packed block failed to decode: " << llvm::toString(decoded.takeError()) << "\n";
            return false;
        }
        const wiregold::FieldValue* packedValues = decoded->find("packed_values");
        if ((packedValues != nullptr && !packedValues->scalars.empty()) || !decoded->empty())
        {
            std::cerr << "an empty packed block must decode to an empty sequence\n";
            return false;
        }
        auto reencoded = wiregold::encodeMessage(middleSchema, *middle, *decoded);
        if (!reencoded || !reencoded->empty())
        {
            llvm::consumeError(reencoded.takeError());
            std::cerr << "an empty packed sequence must re-encode to nothing\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.append("packed_values", {ScalarValue::ofSigned(-1), ScalarValue::ofSigned(1)});
        value.append("values", {ScalarValue::ofSigned(5)});
        auto encoded = wiregold::encodeMessage(middleSchema, *middle, value);
        const wiregold::ByteString expected = wiregold::makeBytes({0x10, 0x05, 0x1A, 0x02, 0x01, 0x02});
        if (!encoded || *encoded != expected)
        {
            llvm::consumeError(encoded.takeError());
            std::cerr << "packed and unpacked repeated encodings mismatch\n";
            return false;
        }
    }

    {
        // Field 9 is not declared on Middle and must be skipped.
        auto decoded =
            wiregold::decodeMessage(middleSchema, *middle, wiregold::makeBytes({0x48, 0x01, 0x08, 0x05}));
        if (!decoded)
        {
            std::cerr << "unknown field skip failed: " << llvm::toString(decoded.takeError()) << "\n";
            return false;
        }
        const wiregold::FieldValue* id = decoded->find("id");
        if (id == nullptr || id->scalars.size() != 1U || id->scalars.front().asSigned() != 5 ||
            decoded->fields.size() != 1U)
        {
            std::cerr << "unknown field must not appear in the decoded value\n";
            return false;
        }
    }

    {
        // Last oneof member on the wire wins.
        auto decoded = wiregold::decodeMessage(difficultSchema,
                                               *difficult,
                                               wiregold::makeBytes({0x3A, 0x01, 0x61, 0x40, 0x05}));
        if (!decoded)
        {
            std::cerr << "oneof decode failed: " << llvm::toString(decoded.takeError()) << "\n";
            return false;
        }
        if (decoded->find("text") != nullptr || decoded->find("number") == nullptr)
        {
            std::cerr << "oneof member must replace its sibling\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.set("id", ScalarValue::ofSigned(1));
        auto canonical =
            wiregold::canonicalizeCompositeCase(middleSchema, *middle, value, wiregold::makeBytes({0x08, 0x02}));
        if (canonical || !expectMalformed(canonical.takeError(), "composite disagreement"))
        {
            return false;
        }
    }

    {
        MessageValue entry;
        entry.set("key", ScalarValue::ofString("a")).set("value", ScalarValue::ofSigned(0));
        MessageValue value;
        value.appendMessage("counts", entry);
        auto encoded = wiregold::encodeMessage(difficultSchema, *difficult, value);
        // Map entries always carry both key and value.
        const wiregold::ByteString expected = wiregold::makeBytes({0x32, 0x05, 0x0A, 0x01, 0x61, 0x10, 0x00});
        if (!encoded || *encoded != expected)
        {
            llvm::consumeError(encoded.takeError());
            std::cerr << "map entry encoding mismatch\n";
            return false;
        }
    }

    {
        MessageValue value;
        value.set("status", ScalarValue::ofEnum("STATUS_MISSING"));
        auto canonical = wiregold::canonicalizeCompositeCase(middleSchema, *middle, value, wiregold::ByteString{});
        const auto kind = canonical ? std::nullopt : wiregold::consumeGenerationErrorKind(canonical.takeError());
        if (!kind || *kind != wiregold::GenerationErrorKind::SchemaNotFound)
        {
            std::cerr << "undeclared enum constant must report schema-not-found\n";
            return false;
        }
    }

    return true;
}

}  // namespace

bool runCanonicalizeTests()
{
    wiregold::DiagnosticEngine diag;
    auto simple    = wiregold::loadSchemaFile(kProtoDir, "simple.proto", diag);
    auto middle    = wiregold::loadSchemaFile(kProtoDir, "middle.proto", diag);
    auto difficult = wiregold::loadSchemaFile(kProtoDir, "difficult.proto", diag);
    if (!simple || !middle || !difficult)
    {
        llvm::consumeError(simple.takeError());
        llvm::consumeError(middle.takeError());
        llvm::consumeError(difficult.takeError());
        std::cerr << "canonicalize tests could not load schemas\n";
        return false;
    }

    bool ok = runScalarCanonicalization(*simple);
    ok      = runCompositeCanonicalization(*middle, *difficult) && ok;
    return ok;
}
