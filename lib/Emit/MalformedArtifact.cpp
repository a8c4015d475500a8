//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Emit/ArtifactEmitter.h"
#include "wiregold/Emit/EmitCommon.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Base64.h"

#include <sstream>

namespace wiregold
{

namespace
{

/// `truncated_string` -> `TruncatedString`.
std::string camelName(llvm::StringRef snake)
{
    std::string out;
    bool        upper = true;
    for (const char c : snake)
    {
        if (c == '_' || c == '-')
        {
            upper = true;
            continue;
        }
        out.push_back(upper ? llvm::toUpper(c) : c);
        upper = false;
    }
    return out;
}

void emitCaseCheck(std::ostream& out, const CodecContract& contract, const MalformedCase& item)
{
    const std::string quotedName = "\"" + item.name + "\"";
    emitLine(out, 0, "bool check" + camelName(item.name) + "()");
    emitLine(out, 0, "{");
    emitLine(out, 1, "const Bytes fixture = decodeFixture(\"" + llvm::encodeBase64(item.bytes) + "\");");
    emitLine(out, 1, contract.qualify("Reader") + " reader(fixture);");

    std::string failingCall;
    switch (item.operation)
    {
    case FailingOperation::ReadTag:
        failingCall = contract.qualify("readTag") + "(reader)";
        break;
    case FailingOperation::ReadString:
        emitLine(out, 1, "const " + contract.qualify("Tag") + " tag = " + contract.qualify("readTag") + "(reader);");
        emitLine(out, 1, "if (tag.number != 1U || tag.wireType != " + wireTypeLiteral(WireType::LengthDelimited) + ")");
        emitLine(out, 1, "{");
        emitLine(out, 2, "std::cerr << " + quotedName + " << \": unexpected leading tag\\n\";");
        emitLine(out, 2, "return false;");
        emitLine(out, 1, "}");
        failingCall = contract.readExpr(ScalarKind::String, "reader");
        break;
    }

    emitLine(out, 1, "try");
    emitLine(out, 1, "{");
    emitLine(out, 2, "(void) " + failingCall + ";");
    emitLine(out, 1, "}");
    emitLine(out, 1, "catch (const " + contract.qualify("DecodeError") + "& error)");
    emitLine(out, 1, "{");
    emitLine(out,
             2,
             "if (error.kind() != " + contract.qualify("DecodeErrorKind") + "::" +
                 decodeFailureName(item.expected).str() + ")");
    emitLine(out, 2, "{");
    emitLine(out,
             3,
             "std::cerr << " + quotedName + " << \": expected " + decodeFailureName(item.expected).str() +
                 ", got \" << error.what() << '\\n';");
    emitLine(out, 3, "return false;");
    emitLine(out, 2, "}");
    emitLine(out, 2, "return true;");
    emitLine(out, 1, "}");
    emitLine(out, 1, "std::cerr << " + quotedName + " << \": decode unexpectedly succeeded\\n\";");
    emitLine(out, 1, "return false;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

}  // namespace

std::string renderMalformedArtifact(const CodecContract&              contract,
                                    const ArtifactHeader&             header,
                                    const std::vector<MalformedCase>& cases)
{
    std::ostringstream out;
    contract.emitPrelude(out, header.source, PreludeOptions{});

    for (const MalformedCase& item : cases)
    {
        emitCaseCheck(out, contract, item);
    }

    emitLine(out, 0, "}  // namespace");
    emitLine(out, 0, "");
    emitLine(out, 0, "bool " + header.entryPoint + "()");
    emitLine(out, 0, "{");
    for (const MalformedCase& item : cases)
    {
        emitLine(out, 1, "if (!runCheck(\"" + item.name + "\", &check" + camelName(item.name) + "))");
        emitLine(out, 1, "{");
        emitLine(out, 2, "return false;");
        emitLine(out, 1, "}");
    }
    emitLine(out, 1, "return true;");
    emitLine(out, 0, "}");
    return out.str();
}

}  // namespace wiregold
