//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Corpus/ScalarCorpus.h"

#include <cstdint>
#include <initializer_list>
#include <limits>

namespace wiregold
{
namespace
{

std::vector<ScalarValue> signedValues(std::initializer_list<std::int64_t> values)
{
    std::vector<ScalarValue> out;
    for (const std::int64_t value : values)
    {
        out.push_back(ScalarValue::ofSigned(value));
    }
    return out;
}

std::vector<ScalarValue> unsignedValues(std::initializer_list<std::uint64_t> values)
{
    std::vector<ScalarValue> out;
    for (const std::uint64_t value : values)
    {
        out.push_back(ScalarValue::ofUnsigned(value));
    }
    return out;
}

std::vector<ScalarValue> realValues(std::initializer_list<double> values)
{
    std::vector<ScalarValue> out;
    for (const double value : values)
    {
        out.push_back(ScalarValue::ofDouble(value));
    }
    return out;
}

constexpr std::int64_t  kInt64Min  = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t  kInt64Max  = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t  kInt32Min  = std::numeric_limits<std::int32_t>::min();
constexpr std::int64_t  kInt32Max  = std::numeric_limits<std::int32_t>::max();
constexpr std::uint64_t kUInt64Max = std::numeric_limits<std::uint64_t>::max();
constexpr double        kNaN       = std::numeric_limits<double>::quiet_NaN();
constexpr double        kInf       = std::numeric_limits<double>::infinity();

std::vector<ScalarValue> valuesFor(const ScalarKind kind)
{
    switch (kind)
    {
    case ScalarKind::Int32:
        return signedValues({0,         1,         -1,        2,          -2,          42,        -42,       1000,
                             -1000,     12345,     -12345,    127,        128,         255,       256,       16383,
                             16384,     2097151,   2097152,   268435455,  268435456,   1000000000, -1000000000,
                             123456789, -123456789, kInt32Max, kInt32Min, -128,        -129,      -16384});
    case ScalarKind::Int64:
        return signedValues({0,
                             1,
                             -1,
                             2,
                             -2,
                             42,
                             -42,
                             1000,
                             -1000,
                             12345,
                             -12345,
                             127,
                             128,
                             255,
                             256,
                             16383,
                             16384,
                             2097151,
                             2097152,
                             268435455,
                             268435456,
                             34359738367,
                             34359738368,
                             4398046511103,
                             4398046511104,
                             562949953421311,
                             562949953421312,
                             72057594037927935,
                             72057594037927936,
                             9007199254740991,
                             -9007199254740991,
                             987654321012345,
                             -987654321012345,
                             kInt64Max,
                             kInt64Min});
    case ScalarKind::UInt32:
        return unsignedValues({0,     1,     42,      127,     128,       255,       256,        1024,       65535,     65536,
                               16383, 16384, 2097151, 2097152, 268435455, 268435456, 3000000000, 4000000000, 4294967295});
    case ScalarKind::UInt64:
        return unsignedValues({0,
                               1,
                               42,
                               127,
                               128,
                               255,
                               256,
                               16383,
                               16384,
                               2097151,
                               2097152,
                               268435455,
                               268435456,
                               34359738367,
                               34359738368,
                               4398046511103,
                               4398046511104,
                               562949953421311,
                               562949953421312,
                               72057594037927935,
                               72057594037927936,
                               9007199254740992,
                               10000000000000000000ULL,
                               kUInt64Max});
    case ScalarKind::SInt32:
        return signedValues({0, -1, 1, -2, 2, 63, -63, 64, -64, 1024, -1024, 8191, -8191, 8192, -8192, 123456, -123456,
                             kInt32Max, kInt32Min});
    case ScalarKind::SInt64:
        return signedValues({0,
                             -1,
                             1,
                             -2,
                             2,
                             63,
                             -63,
                             64,
                             -64,
                             1024,
                             -1024,
                             8191,
                             -8191,
                             8192,
                             -8192,
                             123456789,
                             -123456789,
                             987654321012345,
                             -987654321012345,
                             kInt64Max,
                             kInt64Min});
    case ScalarKind::Bool:
        return {ScalarValue::ofBool(false), ScalarValue::ofBool(true)};
    case ScalarKind::Enum:
        return {ScalarValue::ofEnum("SIMPLE_ENUM_ZERO"),
                ScalarValue::ofEnum("SIMPLE_ENUM_ONE"),
                ScalarValue::ofEnum("SIMPLE_ENUM_TWO"),
                ScalarValue::ofEnum("SIMPLE_ENUM_MAX")};
    case ScalarKind::Fixed32:
        return unsignedValues({0, 1, 305419896, 2147483647, 2147483648, 4294967295, 3735928559, 3405691582});
    case ScalarKind::Fixed64:
        return unsignedValues({0,
                               1,
                               81985529216486895ULL,
                               9223372036854775807ULL,
                               9223372036854775808ULL,
                               kUInt64Max,
                               1311768467750121217ULL,
                               16045690984833335023ULL});
    case ScalarKind::SFixed32:
        return signedValues({0, 1, -1, 123456789, -123456789, kInt32Max, kInt32Min, -1000000000});
    case ScalarKind::SFixed64:
        return signedValues(
            {0, 1, -1, 987654321012345, -987654321012345, kInt64Max, kInt64Min, -1000000000000000000LL});
    case ScalarKind::Float:
        return realValues({0.0, -1.0, 1.5, -2.25, 3.1415927, 1e-20, 1e20, kNaN, kInf, -kInf});
    case ScalarKind::Double:
        return realValues({0.0, -1.0, 1.5, -2.25, 3.141592653589793, 1e-300, 1e300, kNaN, kInf, -kInf});
    case ScalarKind::Bytes:
        return {ScalarValue::ofBytes(ByteString{}),
                ScalarValue::ofBytes(makeBytes({0x00})),
                ScalarValue::ofBytes(makeBytes({0x01, 0x02})),
                ScalarValue::ofBytes(makeBytes({0x00, 0xFF})),
                ScalarValue::ofBytes(makeBytes({0x00, 0xFF, 0x10, 0x20})),
                ScalarValue::ofBytes(byteRange(5)),
                ScalarValue::ofBytes(byteRange(16)),
                ScalarValue::ofBytes(makeBytes({0xDE, 0xAD, 0xBE, 0xEF})),
                ScalarValue::ofBytes(ByteString(8, 0x00)),
                ScalarValue::ofBytes(ByteString(12, 0xAB))};
    case ScalarKind::String:
        return {ScalarValue::ofString(""),
                ScalarValue::ofString("a"),
                ScalarValue::ofString("hello"),
                ScalarValue::ofString("with spaces"),
                ScalarValue::ofString("symbols !@#$%^&*()_+{}|:<>?[]\\;',./"),
                ScalarValue::ofString("line\nbreak"),
                ScalarValue::ofString("tab\tindent"),
                ScalarValue::ofString("unicode \xE4\xB8\xAD\xE6\x96\x87"),
                ScalarValue::ofString("mixed 123"),
                ScalarValue::ofString("slashes \\\\ path")};
    }
    return {};
}

}  // namespace

std::string scalarWrapperMessage(const ScalarKind kind)
{
    return "codec.simple." + scalarKindInfo(kind).codecSuffix.str() + "Value";
}

ScalarCorpus buildScalarCorpus(const ScalarKind kind)
{
    return ScalarCorpus{kind, scalarWrapperMessage(kind), valuesFor(kind)};
}

std::vector<ScalarCorpus> buildScalarCorpora()
{
    std::vector<ScalarCorpus> out;
    for (const ScalarKind kind : allScalarKinds())
    {
        out.push_back(buildScalarCorpus(kind));
    }
    return out;
}

}  // namespace wiregold
