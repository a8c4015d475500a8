//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "wiregold/Corpus/CompositeCorpus.h"

#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace wiregold
{
namespace
{

constexpr std::int32_t  kInt32Min  = std::numeric_limits<std::int32_t>::min();
constexpr std::int32_t  kInt32Max  = std::numeric_limits<std::int32_t>::max();
constexpr std::int64_t  kInt64Min  = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t  kInt64Max  = std::numeric_limits<std::int64_t>::max();
constexpr std::uint64_t kUInt64Max = std::numeric_limits<std::uint64_t>::max();

template <typename T>
const T& pick(const std::vector<T>& pool, const std::size_t caseIndex, const std::size_t multiplier)
{
    return pool[syntheticPoolIndex(caseIndex, multiplier, pool.size())];
}

//===----------------------------------------------------------------------===//
// codec.middle.Middle
//===----------------------------------------------------------------------===//

struct NestedRow final
{
    std::int64_t count{0};
    bool         flag{false};
    std::string  note;
};

struct MiddleRow final
{
    std::int32_t              id{0};
    std::vector<std::int32_t> values;
    std::vector<std::int32_t> packedValues;
    std::string               label;
    ByteString                data;
    std::optional<NestedRow>  nested;
    std::optional<std::string> status;
    std::vector<std::string>  tags;
};

std::vector<ScalarValue> signedList(const std::vector<std::int32_t>& values)
{
    std::vector<ScalarValue> out;
    for (const std::int32_t value : values)
    {
        out.push_back(ScalarValue::ofSigned(value));
    }
    return out;
}

std::vector<ScalarValue> stringList(const std::vector<std::string>& values)
{
    std::vector<ScalarValue> out;
    for (const std::string& value : values)
    {
        out.push_back(ScalarValue::ofString(value));
    }
    return out;
}

std::vector<ScalarValue> doubleList(const std::vector<double>& values)
{
    std::vector<ScalarValue> out;
    for (const double value : values)
    {
        out.push_back(ScalarValue::ofDouble(value));
    }
    return out;
}

// `id` is always written; empty label/data and absent nested/status are left out.
MessageValue middleValue(const MiddleRow& row)
{
    MessageValue value;
    value.set("id", ScalarValue::ofSigned(row.id));
    if (!row.values.empty())
    {
        value.append("values", signedList(row.values));
    }
    if (!row.packedValues.empty())
    {
        value.append("packed_values", signedList(row.packedValues));
    }
    if (!row.label.empty())
    {
        value.set("label", ScalarValue::ofString(row.label));
    }
    if (!row.data.empty())
    {
        value.set("data", ScalarValue::ofBytes(row.data));
    }
    if (row.nested.has_value())
    {
        MessageValue nested;
        nested.set("count", ScalarValue::ofSigned(row.nested->count));
        nested.set("flag", ScalarValue::ofBool(row.nested->flag));
        nested.set("note", ScalarValue::ofString(row.nested->note));
        value.setMessage("nested", std::move(nested));
    }
    if (row.status.has_value())
    {
        value.set("status", ScalarValue::ofEnum(*row.status));
    }
    if (!row.tags.empty())
    {
        value.append("tags", stringList(row.tags));
    }
    return value;
}

std::vector<MiddleRow> middleSeeds()
{
    return {
        MiddleRow{0, {}, {}, "", {}, std::nullopt, std::nullopt, {}},
        MiddleRow{1, {1}, {0}, "nested-empty", makeBytes({0x00}), NestedRow{0, false, ""}, "STATUS_OK", {"a"}},
        MiddleRow{-1, {-1, -2}, {-1}, "neg", makeBytes({0xFF}), NestedRow{-1, true, "neg"}, "STATUS_FAIL", {"neg"}},
        MiddleRow{kInt32Max,
                  {kInt32Max},
                  {kInt32Min, kInt32Max},
                  "max",
                  makeBytes({0x00, 0xFF}),
                  NestedRow{kInt64Max, true, "max"},
                  "STATUS_OK",
                  {"edge"}},
        MiddleRow{kInt32Min,
                  {kInt32Min},
                  {0, 1},
                  "min",
                  makeBytes({0x10, 0x20, 0x30}),
                  NestedRow{kInt64Min, false, "min"},
                  "STATUS_FAIL",
                  {"edge", "min"}},
        MiddleRow{42, {}, {123456}, "tags-only", {}, std::nullopt, "STATUS_OK", {"t1", "t2", "t3"}},
    };
}

MiddleRow middleSynthetic(const std::size_t i)
{
    static const std::vector<std::int32_t> ids =
        {0, 1, -1, 2, -2, 127, 128, 1024, -1024, 16384, -16384, kInt32Max, kInt32Min};
    static const std::vector<std::vector<std::int32_t>> values = {
        {},
        {0},
        {1, 2, 3},
        {-1, -2},
        {127, 128, 129},
        {1024, 2048},
        {-1024, 1024},
        {kInt32Max},
        {kInt32Min},
        {1000, -1000},
        {0, 0, 0},
    };
    static const std::vector<std::vector<std::int32_t>> packed = {
        {},
        {0},
        {1, -1},
        {63, -63, 64, -64},
        {8191, -8191, 8192, -8192},
        {123456},
        {-123456},
        {kInt32Min, kInt32Max},
        {5, 6, 7, 8},
    };
    static const std::vector<std::string> labels =
        {"", "alpha", "beta", "gamma", "delta", "with space", "symbols-!@#", "path\\\\slash"};
    static const std::vector<ByteString> data = {
        {},
        makeBytes({0x00}),
        makeBytes({0x01, 0x02}),
        makeBytes({0xFF}),
        makeBytes({0x00, 0xFF, 0x10, 0x20}),
        byteRange(5),
        byteRange(16),
        makeBytes({0xDE, 0xAD, 0xBE, 0xEF}),
        ByteString(8, 0xAB),
    };
    static const std::vector<std::optional<NestedRow>> nested = {
        std::nullopt,
        NestedRow{0, false, ""},
        NestedRow{1, true, "n"},
        NestedRow{-1, true, "neg"},
        NestedRow{123456789, false, "note"},
        NestedRow{kInt64Max, true, "max"},
        NestedRow{kInt64Min, false, "min"},
    };
    static const std::vector<std::optional<std::string>> statuses =
        {std::nullopt, "STATUS_UNSPECIFIED", "STATUS_OK", "STATUS_FAIL"};
    static const std::vector<std::vector<std::string>> tags = {
        {},
        {"a"},
        {"x", "y"},
        {"tag-one", "tag-two", "tag-three"},
        {"dup", "dup"},
        {"edge"},
        {"m1", "m2", "m3", "m4"},
    };

    return MiddleRow{pick(ids, i, 1),
                     pick(values, i, 3),
                     pick(packed, i, 5),
                     pick(labels, i, 7),
                     pick(data, i, 11),
                     pick(nested, i, 13),
                     pick(statuses, i, 17),
                     pick(tags, i, 19)};
}

//===----------------------------------------------------------------------===//
// codec.difficult.Difficult
//===----------------------------------------------------------------------===//

struct ItemRow final
{
    std::string   name;
    ByteString    raw;
    std::uint64_t code{0};
};

using CountRow = std::pair<std::string, std::int32_t>;

/// Exactly one of `text`/`number` is set, or neither.
struct ChoiceRow final
{
    std::optional<std::string>  text;
    std::optional<std::int32_t> number;
};

struct DifficultRow final
{
    std::uint64_t         big{0};
    std::int32_t          zigzag{0};
    double                ratio{0.0};
    std::vector<double>   scores;
    std::vector<ItemRow>  items;
    std::vector<CountRow> counts;
    ChoiceRow             choice;
    ByteString            payload;
};

// Scalars `big`, `zigzag` and `ratio` are always written. Every item writes
// all three members and every map entry writes key and value.
MessageValue difficultValue(const DifficultRow& row)
{
    MessageValue value;
    value.set("big", ScalarValue::ofUnsigned(row.big));
    value.set("zigzag", ScalarValue::ofSigned(row.zigzag));
    value.set("ratio", ScalarValue::ofDouble(row.ratio));
    if (!row.scores.empty())
    {
        value.append("scores", doubleList(row.scores));
    }
    for (const ItemRow& item : row.items)
    {
        MessageValue entry;
        entry.set("name", ScalarValue::ofString(item.name));
        entry.set("raw", ScalarValue::ofBytes(item.raw));
        entry.set("code", ScalarValue::ofUnsigned(item.code));
        value.appendMessage("items", std::move(entry));
    }
    for (const CountRow& count : row.counts)
    {
        MessageValue entry;
        entry.set("key", ScalarValue::ofString(count.first));
        entry.set("value", ScalarValue::ofSigned(count.second));
        value.appendMessage("counts", std::move(entry));
    }
    if (row.choice.text.has_value())
    {
        value.set("text", ScalarValue::ofString(*row.choice.text));
    }
    if (row.choice.number.has_value())
    {
        value.set("number", ScalarValue::ofSigned(*row.choice.number));
    }
    if (!row.payload.empty())
    {
        value.set("payload", ScalarValue::ofBytes(row.payload));
    }
    return value;
}

ChoiceRow textChoice(std::string text)
{
    return ChoiceRow{std::move(text), std::nullopt};
}

ChoiceRow numberChoice(const std::int32_t number)
{
    return ChoiceRow{std::nullopt, number};
}

std::vector<DifficultRow> difficultSeeds()
{
    return {
        DifficultRow{0, 0, 0.0, {}, {}, {}, ChoiceRow{}, {}},
        DifficultRow{1,
                     -1,
                     1.5,
                     {1.25, -2.5},
                     {ItemRow{"a", makeBytes({0x01}), 1}},
                     {{"a", 1}, {"b", 2}},
                     textChoice("hello"),
                     makeBytes({0x00, 0x01})},
        DifficultRow{kUInt64Max,
                     123456,
                     -3.5,
                     {0.0, 99.5},
                     {ItemRow{"first", makeBytes({0xFF, 0x00}), 0x123456789ABCDEF0ULL}},
                     {{"max", kInt32Max}},
                     numberChoice(0),
                     makeBytes({0xFF})},
        DifficultRow{9223372036854775808ULL,
                     kInt32Min,
                     2.0,
                     {},
                     {ItemRow{"x", {}, 0}, ItemRow{"y", makeBytes({0x10, 0x20}), 999}},
                     {{"dup", 1}, {"dup", 2}},
                     textChoice("world"),
                     makeBytes({0x10, 0x20, 0x30})},
        DifficultRow{999,
                     -999,
                     3.14159,
                     {1e-3, 1e3},
                     {ItemRow{"mix", makeBytes({0x00, 0xFF}), 0x0F0E0D0C0B0A0908ULL}, ItemRow{"tail", byteRange(8), 7}},
                     {{"alpha", 100}, {"beta", 200}, {"gamma", 300}},
                     numberChoice(kInt32Max),
                     makeBytes({0x00, 0xFF, 0x10, 0x20})},
        DifficultRow{1234567890123456789ULL,
                     12345,
                     1e-9,
                     {123.456, 789.012},
                     {ItemRow{"m", makeBytes({0x01, 0x02, 0x03}), 123456789}},
                     {{"k", kInt32Min}},
                     numberChoice(-1),
                     makeBytes({0x7F})},
    };
}

DifficultRow difficultSynthetic(const std::size_t i)
{
    static const std::vector<std::uint64_t> bigs = {0,
                                                    1,
                                                    127,
                                                    128,
                                                    16384,
                                                    4294967295ULL,
                                                    4294967296ULL,
                                                    9223372036854775808ULL,
                                                    kUInt64Max,
                                                    1234567890123456789ULL};
    static const std::vector<std::int32_t> zigzags =
        {0, 1, -1, 2, -2, 63, -63, 64, -64, 123456, -123456, kInt32Max, kInt32Min};
    static const std::vector<double> ratios = {0.0, 1.5, -3.5, 0.125, 3.14159, 1e-9, 1e6, -2.25};
    static const std::vector<std::vector<double>> scores = {
        {},
        {0.0},
        {1.25, -2.5},
        {0.0, 99.5},
        {1e-3, 1e3},
        {-1.0, -2.0, -3.0},
        {123.456, 789.012},
        {0.125, 0.25, 0.5, 1.0},
    };
    static const std::vector<std::vector<ItemRow>> items = {
        {},
        {ItemRow{"a", makeBytes({0x01}), 1}},
        {ItemRow{"first", makeBytes({0xFF, 0x00}), 0x123456789ABCDEF0ULL}},
        {ItemRow{"x", {}, 0}, ItemRow{"y", makeBytes({0x10, 0x20}), 999}},
        {ItemRow{"big", byteRange(4), kUInt64Max}},
        {ItemRow{"empty-raw", {}, 42}},
        {ItemRow{"mix", makeBytes({0x00, 0xFF}), 0x0F0E0D0C0B0A0908ULL}, ItemRow{"tail", byteRange(8), 7}},
    };
    static const std::vector<std::vector<CountRow>> counts = {
        {},
        {{"a", 1}, {"b", 2}},
        {{"max", kInt32Max}},
        {{"x", -1}, {"y", 7}},
        {{"dup", 1}, {"dup", 2}},
        {{"zero", 0}},
        {{"neg", kInt32Min}, {"pos", kInt32Max}},
    };
    static const std::vector<ChoiceRow> choices = {
        textChoice("hello"),
        numberChoice(42),
        textChoice("world"),
        numberChoice(0),
        textChoice("choice text"),
        numberChoice(-1),
    };
    static const std::vector<ByteString> payloads = {
        {},
        makeBytes({0xFF}),
        makeBytes({0x00, 0x01}),
        makeBytes({0x10, 0x20, 0x30}),
        makeBytes({0x00, 0xFF, 0x10, 0x20}),
        byteRange(8),
    };

    return DifficultRow{pick(bigs, i, 1),
                        pick(zigzags, i, 3),
                        pick(ratios, i, 5),
                        pick(scores, i, 7),
                        pick(items, i, 11),
                        pick(counts, i, 13),
                        pick(choices, i, 17),
                        pick(payloads, i, 19)};
}

}  // namespace

CompositeCorpus buildMiddleCorpus(const std::uint32_t syntheticCount)
{
    CompositeCorpus corpus{kMiddleSchemaFile, kMiddleMessageType, {}};
    std::size_t     seedIndex = 0;
    for (const MiddleRow& row : middleSeeds())
    {
        corpus.cases.push_back(CompositeCase{"seed-" + std::to_string(seedIndex++), middleValue(row)});
    }
    for (std::uint32_t i = 0; i < syntheticCount; ++i)
    {
        corpus.cases.push_back(CompositeCase{"synthetic-" + std::to_string(i), middleValue(middleSynthetic(i))});
    }
    return corpus;
}

CompositeCorpus buildDifficultCorpus(const std::uint32_t syntheticCount)
{
    CompositeCorpus corpus{kDifficultSchemaFile, kDifficultMessageType, {}};
    std::size_t     seedIndex = 0;
    for (const DifficultRow& row : difficultSeeds())
    {
        corpus.cases.push_back(CompositeCase{"seed-" + std::to_string(seedIndex++), difficultValue(row)});
    }
    for (std::uint32_t i = 0; i < syntheticCount; ++i)
    {
        corpus.cases.push_back(
            CompositeCase{"synthetic-" + std::to_string(i), difficultValue(difficultSynthetic(i))});
    }
    return corpus;
}

}  // namespace wiregold
