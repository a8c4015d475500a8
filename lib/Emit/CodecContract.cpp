//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Emit/CodecContract.h"

#include "wiregold/Emit/EmitCommon.h"

#include "llvm/ADT/Twine.h"

#include <utility>

namespace wiregold
{

CodecContract::CodecContract(std::string header, std::string codecNamespace)
    : header_(std::move(header))
    , namespace_(std::move(codecNamespace))
{
}

std::string CodecContract::qualify(llvm::StringRef symbol) const
{
    if (namespace_.empty())
    {
        return symbol.str();
    }
    return namespace_ + "::" + symbol.str();
}

std::string CodecContract::readExpr(const ScalarKind kind, llvm::StringRef reader) const
{
    const ScalarKindInfo& info = scalarKindInfo(kind);
    std::string           out  = qualify(("read" + info.codecSuffix).str()) + "(" + reader.str() + ")";
    if (info.unwrap)
    {
        out += ".value";
    }
    return out;
}

std::string CodecContract::readBitsExpr(const ScalarKind kind, llvm::StringRef reader) const
{
    const llvm::StringRef helper = kind == ScalarKind::Float ? "floatBits" : "doubleBits";
    return helper.str() + "(" + readExpr(kind, reader) + ")";
}

std::string CodecContract::writeExpr(const ScalarKind kind, llvm::StringRef writer, llvm::StringRef value) const
{
    const ScalarKindInfo& info    = scalarKindInfo(kind);
    std::string           operand = value.str();
    if (kind == ScalarKind::Enum)
    {
        operand = qualify("Enum") + "{" + operand + "}";
    }
    return qualify(("write" + info.codecSuffix).str()) + "(" + writer.str() + ", " + operand + ")";
}

std::string CodecContract::writeBitsExpr(const ScalarKind kind, llvm::StringRef writer, llvm::StringRef bits) const
{
    const llvm::StringRef helper = kind == ScalarKind::Float ? "floatFromBits" : "doubleFromBits";
    return writeExpr(kind, writer, (helper + "(" + bits + ")").str());
}

std::string CodecContract::writeTagExpr(llvm::StringRef writer, const std::uint32_t number, const WireType wireType) const
{
    return qualify("writeTag") + "(" + writer.str() + ", " + std::to_string(number) + "U, " +
           wireTypeLiteral(wireType) + ")";
}

void CodecContract::emitPrelude(std::ostream& out, llvm::StringRef source, const PreludeOptions& options) const
{
    emitLine(out, 0, renderGeneratedBanner(source));
    emitLine(out, 0, "");
    emitLine(out, 0, "#include \"" + header_ + "\"");
    emitLine(out, 0, "");
    for (const char* include :
         {"cstdint", "cstring", "exception", "iostream", "limits", "optional", "stdexcept", "string", "vector"})
    {
        emitLine(out, 0, std::string("#include <") + include + ">");
    }
    emitLine(out, 0, "");
    emitLine(out, 0, "namespace");
    emitLine(out, 0, "{");
    emitLine(out, 0, "");
    emitLine(out, 0, "using Bytes = std::vector<std::uint8_t>;");
    emitLine(out, 0, "");

    emitLine(out, 0, "int base64Digit(const char c)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "if (c >= 'A' && c <= 'Z')");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return c - 'A';");
    emitLine(out, 1, "}");
    emitLine(out, 1, "if (c >= 'a' && c <= 'z')");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return c - 'a' + 26;");
    emitLine(out, 1, "}");
    emitLine(out, 1, "if (c >= '0' && c <= '9')");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return c - '0' + 52;");
    emitLine(out, 1, "}");
    emitLine(out, 1, "if (c == '+')");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return 62;");
    emitLine(out, 1, "}");
    emitLine(out, 1, "if (c == '/')");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return 63;");
    emitLine(out, 1, "}");
    emitLine(out, 1, "return -1;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");

    emitLine(out, 0, "Bytes decodeFixture(const char* text)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "Bytes         out;");
    emitLine(out, 1, "std::uint32_t buffer = 0;");
    emitLine(out, 1, "int           bits   = 0;");
    emitLine(out, 1, "for (const char* p = text; *p != '\\0' && *p != '='; ++p)");
    emitLine(out, 1, "{");
    emitLine(out, 2, "const int digit = base64Digit(*p);");
    emitLine(out, 2, "if (digit < 0)");
    emitLine(out, 2, "{");
    emitLine(out, 3, "throw std::invalid_argument(\"invalid base64 fixture\");");
    emitLine(out, 2, "}");
    emitLine(out, 2, "buffer = (buffer << 6U) | static_cast<std::uint32_t>(digit);");
    emitLine(out, 2, "bits += 6;");
    emitLine(out, 2, "if (bits >= 8)");
    emitLine(out, 2, "{");
    emitLine(out, 3, "bits -= 8;");
    emitLine(out, 3, "out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFU));");
    emitLine(out, 2, "}");
    emitLine(out, 1, "}");
    emitLine(out, 1, "return out;");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");

    struct FloatHelper
    {
        bool        wanted;
        const char* type;
        const char* bitsType;
    };
    for (const FloatHelper& helper : {FloatHelper{options.floatBits, "float", "std::uint32_t"},
                                      FloatHelper{options.doubleBits, "double", "std::uint64_t"}})
    {
        if (!helper.wanted)
        {
            continue;
        }
        const std::string type     = helper.type;
        const std::string bitsType = helper.bitsType;
        emitLine(out, 0, bitsType + " " + type + "Bits(const " + type + " value)");
        emitLine(out, 0, "{");
        emitLine(out, 1, bitsType + " bits = 0;");
        emitLine(out, 1, "std::memcpy(&bits, &value, sizeof bits);");
        emitLine(out, 1, "return bits;");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
        emitLine(out, 0, type + " " + type + "FromBits(const " + bitsType + " bits)");
        emitLine(out, 0, "{");
        emitLine(out, 1, type + " value = 0;");
        emitLine(out, 1, "std::memcpy(&value, &bits, sizeof value);");
        emitLine(out, 1, "return value;");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
    }

    if (options.hexOf)
    {
        emitLine(out, 0, "std::string hexOf(const Bytes& bytes)");
        emitLine(out, 0, "{");
        emitLine(out, 1, "static constexpr char kDigits[] = \"0123456789abcdef\";");
        emitLine(out, 1, "std::string           out;");
        emitLine(out, 1, "for (const std::uint8_t byte : bytes)");
        emitLine(out, 1, "{");
        emitLine(out, 2, "out.push_back(kDigits[byte >> 4U]);");
        emitLine(out, 2, "out.push_back(kDigits[byte & 0x0FU]);");
        emitLine(out, 1, "}");
        emitLine(out, 1, "return out;");
        emitLine(out, 0, "}");
        emitLine(out, 0, "");
    }

    emitLine(out, 0, "bool runCheck(const char* name, bool (*check)())");
    emitLine(out, 0, "{");
    emitLine(out, 1, "try");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return check();");
    emitLine(out, 1, "}");
    emitLine(out, 1, "catch (const std::exception& ex)");
    emitLine(out, 1, "{");
    emitLine(out, 2, "std::cerr << name << \": unexpected exception: \" << ex.what() << '\\n';");
    emitLine(out, 2, "return false;");
    emitLine(out, 1, "}");
    emitLine(out, 0, "}");
    emitLine(out, 0, "");
}

std::string wireTypeLiteral(const WireType type)
{
    return std::to_string(wireTypeBits(type)) + "U";
}

}  // namespace wiregold
