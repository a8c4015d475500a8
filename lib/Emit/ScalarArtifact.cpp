//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Scalar-tier artifact: one decode/encode pair and literal table per kind.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/LiteralRender.h"
#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Emit/EmitCommon.h"

#include "llvm/Support/Base64.h"

#include <sstream>

namespace wiregold
{

namespace
{

std::string valueType(const ScalarKindInfo& info)
{
    return info.floatBits ? floatBitsStorageType(info.kind).str() : info.cppStorageType.str();
}

std::string functionStem(const ScalarKindInfo& info)
{
    return info.floatBits ? info.codecSuffix.str() + "Bits" : info.codecSuffix.str();
}

void emitDecodeFunction(std::ostream& out, const CodecContract& contract, const ScalarGoldenTable& table)
{
    const ScalarKindInfo& info = scalarKindInfo(table.kind);
    const std::string     type = valueType(info);

    emitLine(out, 0, type + " decode" + functionStem(info) + "(const Bytes& bytes)");
    emitLine(out, 0, "{");
    emitLine(out, 1, contract.qualify("Reader") + " reader(bytes);");
    emitLine(out, 1, "const " + contract.qualify("Tag") + " tag = " + contract.qualify("readTag") + "(reader);");
    emitLine(out, 1, "if (tag.number != 1U || tag.wireType != " + wireTypeLiteral(info.wireType) + ")");
    emitLine(out, 1, "{");
    emitLine(out, 2, "throw std::runtime_error(\"unexpected tag in " + table.messageType + " fixture\");");
    emitLine(out, 1, "}");
    emitLine(out,
             1,
             "return " + (info.floatBits ? contract.readBitsExpr(info.kind, "reader")
                                         : contract.readExpr(info.kind, "reader")) +
                 ";");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

void emitEncodeFunction(std::ostream& out, const CodecContract& contract, const ScalarGoldenTable& table)
{
    const ScalarKindInfo& info  = scalarKindInfo(table.kind);
    const std::string     type  = valueType(info);
    const bool            byRef = info.wireType == WireType::LengthDelimited;

    emitLine(out,
             0,
             "Bytes encode" + functionStem(info) + "(" + (byRef ? "const " + type + "& value" : "const " + type + " value") +
                 ")");
    emitLine(out, 0, "{");
    emitLine(out, 1, contract.qualify("Writer") + " writer;");
    emitLine(out, 1, contract.writeTagExpr("writer", 1U, info.wireType) + ";");
    emitLine(out,
             1,
             (info.floatBits ? contract.writeBitsExpr(info.kind, "writer", "value")
                             : contract.writeExpr(info.kind, "writer", "value")) +
                 ";");
    emitLine(out, 1, "return writer.bytes();");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

void emitCaseTable(std::ostream& out, const ScalarGoldenTable& table)
{
    const ScalarKindInfo& info = scalarKindInfo(table.kind);
    const std::string     name = info.codecSuffix.str();

    emitLine(out, 0, "struct " + name + "Case");
    emitLine(out, 0, "{");
    emitLine(out, 1, "const char* fixture;");
    emitLine(out, 1, valueType(info) + " expected;");
    emitLine(out, 0, "};");
    emitLine(out, 0, "");
    emitLine(out, 0, "const " + name + "Case k" + name + "Cases[] = {");
    for (const ScalarGoldenEntry& entry : table.entries)
    {
        emitLine(out,
                 1,
                 "{\"" + llvm::encodeBase64(entry.fixture) + "\", " +
                     renderScalarLiteral(LiteralGrammar::Cpp, table.kind, entry.expected) + "},");
    }
    emitLine(out, 0, "};");
    emitLine(out, 0, "");
}

void emitCheckFunction(std::ostream& out, const ScalarGoldenTable& table)
{
    const ScalarKindInfo& info = scalarKindInfo(table.kind);
    const std::string     name = info.codecSuffix.str();
    const std::string     stem = functionStem(info);

    emitLine(out, 0, "bool check" + name + "()");
    emitLine(out, 0, "{");
    emitLine(out, 1, "for (const " + name + "Case& item : k" + name + "Cases)");
    emitLine(out, 1, "{");
    emitLine(out, 2, "const Bytes fixture = decodeFixture(item.fixture);");
    emitLine(out, 2, "if (decode" + stem + "(fixture) != item.expected)");
    emitLine(out, 2, "{");
    emitLine(out, 3, "std::cerr << \"" + name + " decode mismatch for fixture \" << item.fixture << '\\n';");
    emitLine(out, 3, "return false;");
    emitLine(out, 2, "}");
    emitLine(out, 2, "const Bytes encoded = encode" + stem + "(item.expected);");
    emitLine(out, 2, "if (encoded != fixture)");
    emitLine(out, 2, "{");
    emitLine(out,
             3,
             "std::cerr << \"" + name +
                 " encode mismatch for fixture \" << item.fixture << \": got \" << hexOf(encoded) << '\\n';");
    emitLine(out, 3, "return false;");
    emitLine(out, 2, "}");
    emitLine(out, 1, "}");
    emitLine(out, 1, "return true;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

}  // namespace

std::string renderScalarArtifact(const CodecContract&                  contract,
                                 const ArtifactHeader&                 header,
                                 const std::vector<ScalarGoldenTable>& tables)
{
    PreludeOptions options;
    options.hexOf = true;
    for (const ScalarGoldenTable& table : tables)
    {
        options.floatBits  = options.floatBits || table.kind == ScalarKind::Float;
        options.doubleBits = options.doubleBits || table.kind == ScalarKind::Double;
    }

    std::ostringstream out;
    contract.emitPrelude(out, header.source, options);

    for (const ScalarGoldenTable& table : tables)
    {
        emitLine(out, 0, "// " + table.messageType);
        emitLine(out, 0, "");
        emitDecodeFunction(out, contract, table);
        emitEncodeFunction(out, contract, table);
        emitCaseTable(out, table);
        emitCheckFunction(out, table);
    }

    if (!tables.empty())
    {
        emitLine(out, 0, "struct NamedCheck");
        emitLine(out, 0, "{");
        emitLine(out, 1, "const char* name;");
        emitLine(out, 1, "bool (*run)();");
        emitLine(out, 0, "};");
        emitLine(out, 0, "");
        emitLine(out, 0, "const NamedCheck kChecks[] = {");
        for (const ScalarGoldenTable& table : tables)
        {
            const std::string name = scalarKindInfo(table.kind).codecSuffix.str();
            emitLine(out, 1, "{\"" + name + "\", &check" + name + "},");
        }
        emitLine(out, 0, "};");
        emitLine(out, 0, "");
    }
    emitLine(out, 0, "}  // namespace");
    emitLine(out, 0, "");
    emitLine(out, 0, "bool " + header.entryPoint + "()");
    emitLine(out, 0, "{");
    if (!tables.empty())
    {
        emitLine(out, 1, "for (const NamedCheck& check : kChecks)");
        emitLine(out, 1, "{");
        emitLine(out, 2, "if (!runCheck(check.name, check.run))");
        emitLine(out, 2, "{");
        emitLine(out, 3, "return false;");
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
    }
    emitLine(out, 1, "return true;");
    emitLine(out, 0, "}");
    return out.str();
}

}  // namespace wiregold
