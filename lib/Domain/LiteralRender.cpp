//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements literal rendering for the oracle text grammar and generated C++.
///
/// Both grammars must stay injective over the corpus: two distinct corpus
/// values never render to the same literal.
///
//===----------------------------------------------------------------------===//

#include "wiregold/Domain/LiteralRender.h"

#include "llvm/ADT/bit.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cmath>
#include <limits>

namespace wiregold
{
namespace
{

void appendOctalEscape(std::string& out, const std::uint8_t byte)
{
    out.push_back('\\');
    out.push_back(static_cast<char>('0' + ((byte >> 6U) & 0x3U)));
    out.push_back(static_cast<char>('0' + ((byte >> 3U) & 0x7U)));
    out.push_back(static_cast<char>('0' + (byte & 0x7U)));
}

std::string escapeQuoted(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (const char c : text)
    {
        const auto byte = static_cast<std::uint8_t>(c);
        switch (c)
        {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (byte >= 0x20U && byte < 0x7FU)
            {
                out.push_back(c);
            }
            else
            {
                appendOctalEscape(out, byte);
            }
            break;
        }
    }
    out.push_back('"');
    return out;
}

std::string hexByte(const std::uint8_t byte)
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << llvm::format_hex(byte, 4);
    os.flush();
    return out;
}

std::string renderSignedCpp(const std::int64_t value, const std::uint32_t bitWidth)
{
    if (bitWidth <= 32U)
    {
        if (value == std::numeric_limits<std::int32_t>::min())
        {
            return "(-2147483647 - 1)";
        }
        return std::to_string(value);
    }
    if (value == std::numeric_limits<std::int64_t>::min())
    {
        return "(-9223372036854775807LL - 1)";
    }
    return std::to_string(value) + "LL";
}

std::string renderUnsignedCpp(const std::uint64_t value, const std::uint32_t bitWidth)
{
    return std::to_string(value) + (bitWidth <= 32U ? "U" : "ULL");
}

std::string renderRealTextFormat(const double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value > 0 ? "inf" : "-inf";
    }
    return formatRealDigits(value, 17);
}

std::string renderRealCpp(const double value, const ScalarKind kind)
{
    const bool            single = kind == ScalarKind::Float;
    const llvm::StringRef type   = single ? "float" : "double";
    if (std::isnan(value))
    {
        return "std::numeric_limits<" + type.str() + ">::quiet_NaN()";
    }
    if (std::isinf(value))
    {
        return std::string(value > 0 ? "" : "-") + "std::numeric_limits<" + type.str() + ">::infinity()";
    }

    std::string text = formatRealDigits(value, single ? 9U : 17U);
    if (text.find_first_of(".e") == std::string::npos)
    {
        text += ".0";
    }
    if (single)
    {
        text += "F";
    }
    return text;
}

std::string renderBytesCpp(const ByteString& bytes)
{
    std::string out = "std::vector<std::uint8_t>{";
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if (i != 0)
        {
            out += ", ";
        }
        out += hexByte(bytes[i]);
    }
    out += "}";
    return out;
}

std::string renderTextFormat(const ScalarKind kind, const ScalarValue& value)
{
    const ScalarKindInfo& info = scalarKindInfo(kind);
    switch (info.domain)
    {
    case ValueDomain::Boolean:
        return value.asBool() ? "true" : "false";
    case ValueDomain::EnumNumber: {
        const EnumSymbol& symbol = value.asEnum();
        return symbol.name.empty() ? std::to_string(symbol.number) : symbol.name;
    }
    case ValueDomain::Floating:
        if (value.isUnsigned())
        {
            return kind == ScalarKind::Float
                       ? renderRealTextFormat(llvm::bit_cast<float>(static_cast<std::uint32_t>(value.asUnsigned())))
                       : renderRealTextFormat(llvm::bit_cast<double>(value.asUnsigned()));
        }
        return renderRealTextFormat(value.asDouble());
    case ValueDomain::Text:
        return quoteTextFormatString(value.asString());
    case ValueDomain::Binary:
        return quoteTextFormatBytes(value.asBytes());
    case ValueDomain::Signed:
        return std::to_string(value.asSigned());
    case ValueDomain::Unsigned:
        return std::to_string(value.asUnsigned());
    }
    return {};
}

std::string renderCpp(const ScalarKind kind, const ScalarValue& value)
{
    const ScalarKindInfo& info = scalarKindInfo(kind);
    switch (info.domain)
    {
    case ValueDomain::Boolean:
        return value.asBool() ? "true" : "false";
    case ValueDomain::EnumNumber:
        return renderSignedCpp(value.asEnum().number, 32U);
    case ValueDomain::Floating:
        if (value.isUnsigned())
        {
            return renderCppBitsLiteral(kind, value.asUnsigned());
        }
        return renderRealCpp(value.asDouble(), kind);
    case ValueDomain::Text:
        return quoteCppString(value.asString());
    case ValueDomain::Binary:
        return renderBytesCpp(value.asBytes());
    case ValueDomain::Signed:
        return renderSignedCpp(value.asSigned(), info.bitWidth);
    case ValueDomain::Unsigned:
        return renderUnsignedCpp(value.asUnsigned(), info.bitWidth);
    }
    return {};
}

}  // namespace

bool scalarFitsKind(const ScalarKind kind, const ScalarValue& value)
{
    switch (scalarKindInfo(kind).domain)
    {
    case ValueDomain::Boolean:
        return value.isBool();
    case ValueDomain::EnumNumber:
        return value.isEnum();
    case ValueDomain::Floating:
        return value.isDouble() || value.isUnsigned();
    case ValueDomain::Text:
        return value.isString();
    case ValueDomain::Binary:
        return value.isBytes();
    case ValueDomain::Signed:
        return value.isSigned();
    case ValueDomain::Unsigned:
        return value.isUnsigned();
    }
    return false;
}

std::string renderScalarLiteral(const LiteralGrammar grammar, const ScalarKind kind, const ScalarValue& value)
{
    switch (grammar)
    {
    case LiteralGrammar::TextFormat:
        return renderTextFormat(kind, value);
    case LiteralGrammar::Cpp:
        return renderCpp(kind, value);
    }
    return {};
}

std::string normalizeExponent(llvm::StringRef formatted)
{
    const std::size_t ePos = formatted.find_first_of("eE");
    if (ePos == llvm::StringRef::npos)
    {
        return formatted.str();
    }

    llvm::StringRef exponent = formatted.substr(ePos + 1);
    std::string     sign;
    if (exponent.consume_front("-"))
    {
        sign = "-";
    }
    else
    {
        exponent.consume_front("+");
    }
    exponent = exponent.ltrim('0');
    if (exponent.empty())
    {
        exponent = "0";
    }
    return formatted.substr(0, ePos).str() + "e" + sign + exponent.str();
}

std::string formatRealDigits(const double value, const unsigned significantDigits)
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    os << llvm::format("%.*g", static_cast<int>(significantDigits), value);
    os.flush();
    return normalizeExponent(out);
}

std::string renderCppBitsLiteral(const ScalarKind kind, const std::uint64_t bits)
{
    std::string              out;
    llvm::raw_string_ostream os(out);
    if (kind == ScalarKind::Float)
    {
        os << "0x" << llvm::format_hex_no_prefix(bits & 0xFFFFFFFFULL, 8, true) << "U";
    }
    else
    {
        os << "0x" << llvm::format_hex_no_prefix(bits, 16, true) << "ULL";
    }
    os.flush();
    return out;
}

std::string quoteTextFormatString(llvm::StringRef text)
{
    return escapeQuoted(text);
}

std::string quoteTextFormatBytes(llvm::ArrayRef<std::uint8_t> bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string           out;
    out.reserve(bytes.size() * 4 + 2);
    out.push_back('"');
    for (const std::uint8_t byte : bytes)
    {
        out.append("\\x");
        out.push_back(kDigits[byte >> 4U]);
        out.push_back(kDigits[byte & 0xFU]);
    }
    out.push_back('"');
    return out;
}

std::string quoteCppString(llvm::StringRef text)
{
    const std::string quoted = escapeQuoted(text);
    if (text.find('\0') == llvm::StringRef::npos)
    {
        return quoted;
    }
    return "std::string(" + quoted + ", " + std::to_string(text.size()) + ")";
}

}  // namespace wiregold
