#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FormatConverter.hpp"
#include "ErrorHandler.hpp"
#include "TestResults.hpp"

using namespace pgresult;
using namespace pgresult::test;
using ::testing::HasSubstr;
using ::testing::Not;

class FormatConverterTest : public ::testing::Test {
protected:
    ResultHandle people() {
        return ResultHandle(makeResult(
            {{"id", kInt4}, {"name", kText}, {"email", kText}},
            {{std::string("1"), std::string("John Doe"), std::string("john@example.com")},
             {std::string("2"), std::string("Jane Smith"), std::string("jane@example.com")}}));
    }
};

// CSV conversion tests
TEST_F(FormatConverterTest, ToCSVBasic) {
    auto result = people();
    auto csv = FormatConverter::toCSV(result);

    EXPECT_EQ(csv,
              "id,name,email\n"
              "1,John Doe,john@example.com\n"
              "2,Jane Smith,jane@example.com\n");
}

TEST_F(FormatConverterTest, ToCSVNoHeader) {
    CSVOptions options;
    options.includeHeader = false;

    auto result = people();
    auto csv = FormatConverter::toCSV(result, options);

    EXPECT_THAT(csv, Not(HasSubstr("id,name,email")));
    EXPECT_THAT(csv, HasSubstr("1,John Doe,john@example.com"));
}

TEST_F(FormatConverterTest, ToCSVCustomDelimiter) {
    CSVOptions options;
    options.delimiter = ';';

    auto result = people();
    auto csv = FormatConverter::toCSV(result, options);

    EXPECT_THAT(csv, HasSubstr("id;name;email"));
    EXPECT_THAT(csv, HasSubstr("1;John Doe;john@example.com"));
}

TEST_F(FormatConverterTest, ToCSVWithNull) {
    ResultHandle result(makeResult({{"id", kInt4}, {"name", kText}, {"email", kText}},
                                   {{std::string("1"), std::nullopt, std::string("john@example.com")}}));

    auto csv = FormatConverter::toCSV(result);

    // NULL values should be empty in CSV
    EXPECT_THAT(csv, HasSubstr("1,,john@example.com"));
}

TEST_F(FormatConverterTest, ToCSVWithQuotesAndCommas) {
    ResultHandle result(makeResult({{"id", kInt4}, {"name", kText}},
                                   {{std::string("1"), std::string("John \"JD\" Doe")},
                                    {std::string("2"), std::string("Doe, John")}}));

    auto csv = FormatConverter::toCSV(result);

    EXPECT_THAT(csv, HasSubstr("\"John \"\"JD\"\" Doe\""));
    EXPECT_THAT(csv, HasSubstr("\"Doe, John\""));
}

TEST_F(FormatConverterTest, ToCSVKeepsDuplicateColumns) {
    ResultHandle result(makeResult({{"v", kText}, {"v", kText}},
                                   {{std::string("left"), std::string("right")}}));

    EXPECT_EQ(FormatConverter::toCSV(result), "v,v\nleft,right\n");
}

TEST_F(FormatConverterTest, ToCSVEmptyResultHasHeaderOnly) {
    ResultHandle result(makeResult({{"id", kInt4}}, {}));
    EXPECT_EQ(FormatConverter::toCSV(result), "id\n");
}

TEST_F(FormatConverterTest, EscapeCSVField) {
    EXPECT_EQ(FormatConverter::escapeCSVField("plain"), "plain");
    EXPECT_EQ(FormatConverter::escapeCSVField("a\nb"), "\"a\nb\"");

    CSVOptions quoteAll;
    quoteAll.quoteAll = true;
    EXPECT_EQ(FormatConverter::escapeCSVField("plain", quoteAll), "\"plain\"");
}

// JSON conversion tests
TEST_F(FormatConverterTest, ToJSONHydratesIntegers) {
    JSONOptions options;
    options.pretty = false;

    auto result = people();
    auto parsed = json::parse(FormatConverter::toJSON(result, options));

    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["id"], 1);
    EXPECT_EQ(parsed[0]["name"], "John Doe");
    EXPECT_EQ(parsed[1]["email"], "jane@example.com");
}

TEST_F(FormatConverterTest, ToJSONTypeHints) {
    ResultHandle result(makeResult({{"flag", kBool}, {"ratio", kFloat8}, {"amount", kNumeric}, {"odd", 999999}},
                                   {{std::string("t"), std::string("0.5"), std::string("12.25"), std::string("7")},
                                    {std::string("f"), std::string("NaN"), std::string("1"), std::string("8")}}));

    auto parsed = json::parse(FormatConverter::toJSON(result));

    EXPECT_EQ(parsed[0]["flag"], true);
    EXPECT_EQ(parsed[1]["flag"], false);
    EXPECT_DOUBLE_EQ(parsed[0]["ratio"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(parsed[0]["amount"].get<double>(), 12.25);
    // NaN has no JSON number form
    EXPECT_EQ(parsed[1]["ratio"], "NaN");
    // Unknown type stays text
    EXPECT_EQ(parsed[0]["odd"], "7");
}

TEST_F(FormatConverterTest, ToJSONNullHandling) {
    ResultHandle result(makeResult({{"id", kInt4}, {"note", kText}},
                                   {{std::string("1"), std::nullopt}}));

    auto withNull = json::parse(FormatConverter::toJSON(result));
    ASSERT_TRUE(withNull[0].contains("note"));
    EXPECT_TRUE(withNull[0]["note"].is_null());

    JSONOptions options;
    options.includeNull = false;
    auto withoutNull = json::parse(FormatConverter::toJSON(result, options));
    EXPECT_FALSE(withoutNull[0].contains("note"));
}

TEST_F(FormatConverterTest, ToJSONKeepsColumnOrder) {
    JSONOptions options;
    options.pretty = false;

    ResultHandle result(makeResult({{"name", kText}, {"id", kInt4}},
                                   {{std::string("x"), std::string("1")}}));

    EXPECT_EQ(FormatConverter::toJSON(result, options), "[{\"name\":\"x\",\"id\":1}]");
}

TEST_F(FormatConverterTest, ToJSONDuplicateColumnUsesItsOwnType) {
    JSONOptions options;
    options.pretty = false;

    ResultHandle result(makeResult({{"v", kInt4}, {"v", kText}},
                                   {{std::string("1"), std::string("2")}}));

    // The rightmost "v" is text, so its value stays a string
    EXPECT_EQ(FormatConverter::toJSON(result, options), "[{\"v\":\"2\"}]");
}

TEST_F(FormatConverterTest, ToJSONDuplicateColumnRightmostNullIsSkipped) {
    JSONOptions options;
    options.pretty = false;
    options.includeNull = false;

    ResultHandle result(makeResult({{"v", kText}, {"w", kText}, {"v", kText}},
                                   {{std::string("left"), std::string("w"), std::nullopt}}));

    EXPECT_EQ(FormatConverter::toJSON(result, options), "[{\"w\":\"w\"}]");
}

TEST_F(FormatConverterTest, ToJSONObjectFormat) {
    JSONOptions options;
    options.arrayFormat = false;

    auto result = people();
    auto parsed = json::parse(FormatConverter::toJSON(result, options));

    ASSERT_TRUE(parsed.is_object());
    ASSERT_TRUE(parsed.contains("rows"));
    EXPECT_EQ(parsed["rows"].size(), 2u);
}

TEST_F(FormatConverterTest, ToJSONCompact) {
    JSONOptions options;
    options.pretty = false;

    auto result = people();
    auto text = FormatConverter::toJSON(result, options);

    EXPECT_THAT(text, Not(HasSubstr("\n")));
}

TEST_F(FormatConverterTest, RowToJSON) {
    auto result = people();
    auto parsed = json::parse(FormatConverter::rowToJSON(result, 1));

    EXPECT_EQ(parsed["id"], 2);
    EXPECT_EQ(parsed["name"], "Jane Smith");
    EXPECT_THROW(FormatConverter::rowToJSON(result, 2), OutOfBoundsError);
}

TEST_F(FormatConverterTest, DescribeColumns) {
    ResultHandle result(makeResult({{"id", kInt4}, {"mystery", InvalidOid}}, {}));

    auto parsed = json::parse(FormatConverter::describe(result));

    EXPECT_EQ(parsed["status"], "PGRES_TUPLES_OK");
    EXPECT_EQ(parsed["rows"], 0);
    EXPECT_EQ(parsed["fields"], 2);
    EXPECT_EQ(parsed["affected_rows"], 0);
    ASSERT_EQ(parsed["columns"].size(), 2u);
    EXPECT_EQ(parsed["columns"][0]["name"], "id");
    EXPECT_EQ(parsed["columns"][0]["type"], "int4");
    EXPECT_EQ(parsed["columns"][0]["oid"], 23);
    EXPECT_TRUE(parsed["columns"][1]["type"].is_null());
    EXPECT_TRUE(parsed["columns"][1]["oid"].is_null());
}

TEST_F(FormatConverterTest, DescribeDuplicateColumns) {
    ResultHandle result(makeResult({{"v", kInt4}, {"v", kText}}, {}));

    auto parsed = json::parse(FormatConverter::describe(result));

    ASSERT_EQ(parsed["columns"].size(), 2u);
    EXPECT_EQ(parsed["columns"][0]["type"], "int4");
    EXPECT_EQ(parsed["columns"][1]["type"], "text");
    EXPECT_EQ(parsed["columns"][1]["oid"], 25);
}

TEST_F(FormatConverterTest, FreedResultFails) {
    auto result = people();
    result.free();

    EXPECT_THROW(FormatConverter::toCSV(result), OutOfBoundsError);
    EXPECT_THROW(FormatConverter::toJSON(result), OutOfBoundsError);
    EXPECT_THROW(FormatConverter::describe(result), OutOfBoundsError);
}

// Type classification
TEST_F(FormatConverterTest, TypeClassification) {
    EXPECT_TRUE(FormatConverter::isIntegerType("int8"));
    EXPECT_TRUE(FormatConverter::isFloatType("numeric"));
    EXPECT_TRUE(FormatConverter::isBooleanType("bool"));
    EXPECT_FALSE(FormatConverter::isIntegerType("text"));
    EXPECT_FALSE(FormatConverter::isBooleanType("int4"));
}
