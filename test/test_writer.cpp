#include <chrono>
#include <limits>
#include <string>

#include <boost/uuid/string_generator.hpp>

#include "helpers.hpp"

using namespace datomic::edn;

TEST(writer, write_scalars)
{
  EXPECT_EQ(write(Value()), "nil");
  EXPECT_EQ(write(true), "true");
  EXPECT_EQ(write(false), "false");
  EXPECT_EQ(write(42), "42");
  EXPECT_EQ(write(-7), "-7");
}

TEST(writer, write_float_stays_a_float)
{
  EXPECT_EQ(write(3.14), "3.14");
  EXPECT_EQ(write(1.0), "1.0");
  EXPECT_EQ(write(-0.5), "-0.5");
  EXPECT_EQ(read(write(1e16)), Value(1e16));
  EXPECT_EQ(read(write(6.22e-18)), Value(6.22e-18));
}

TEST(writer, write_non_finite_float)
{
  EXPECT_EQ(write(std::numeric_limits<double>::infinity()), "##Inf");
  EXPECT_EQ(write(-std::numeric_limits<double>::infinity()), "##-Inf");
  EXPECT_EQ(write(std::numeric_limits<double>::quiet_NaN()), "##NaN");
}

TEST(writer, write_string_escapes)
{
  EXPECT_EQ(write("hello"), R"("hello")");
  EXPECT_EQ(write("say \"hi\""), R"("say \"hi\"")");
  EXPECT_EQ(write("a\\b"), R"("a\\b")");
  EXPECT_EQ(write("line1\nline2\r\tend"), R"("line1\nline2\r\tend")");
  EXPECT_EQ(write("你"), "\"你\"");
}

TEST(writer, write_keyword_verbatim)
{
  EXPECT_EQ(write(":person/name"), ":person/name");
}

TEST(writer, write_quoted_ignores_leading_colon)
{
  EXPECT_EQ(writeQuoted(":not-a-keyword"), R"(":not-a-keyword")");
  EXPECT_EQ(writeQuoted("a \"b\""), R"("a \"b\"")");
  EXPECT_THROW(writeQuoted("\xff"), EdnWriteException);
}

TEST(writer, write_invalid_utf8_string)
{
  EXPECT_THROW(write(std::string("bad \xff byte")), EdnWriteException);
}

TEST(writer, write_instant)
{
  EXPECT_EQ(write(utcInstant(2023, 1, 15, 10, 30)), R"(#inst "2023-01-15T10:30:00+00:00")");
  EXPECT_EQ(write(utcInstant(2012, 9, 10, 23, 51, 55, 840000)), R"(#inst "2012-09-10T23:51:55.840000+00:00")");
  EXPECT_EQ(write(Instant::naive(timePoint(2023, 1, 15, 10, 30))), R"(#inst "2023-01-15T10:30:00Z")");
  EXPECT_EQ(write(Instant::naive(timePoint(2023, 1, 15, 10, 30, 0, 5))), R"(#inst "2023-01-15T10:30:00.000005Z")");
}

TEST(writer, write_instant_in_its_offset)
{
  Instant instant{timePoint(2023, 1, 15, 5, 0), std::chrono::minutes{330}};
  EXPECT_EQ(write(instant), R"(#inst "2023-01-15T10:30:00+05:30")");

  Instant pacific{timePoint(2023, 1, 15, 18, 0), std::chrono::minutes{-480}};
  EXPECT_EQ(write(pacific), R"(#inst "2023-01-15T10:00:00-08:00")");
}

TEST(writer, write_instant_out_of_range)
{
  EXPECT_THROW(write(utcInstant(0, 12, 31)), EdnWriteException);
}

TEST(writer, write_uuid)
{
  boost::uuids::string_generator gen;
  EXPECT_EQ(write(gen("F81D4FAE7DEC11D0A76500A0C91E6BF6")), R"(#uuid "f81d4fae-7dec-11d0-a765-00a0c91e6bf6")");
}

TEST(writer, write_collections)
{
  EXPECT_EQ(write(Sequence{1, 2, 3}), "[1 2 3]");
  EXPECT_EQ(write(Sequence{}), "[]");
  EXPECT_EQ(write(Set{1, "two"}), R"(#{1 "two"})");
  EXPECT_EQ(write(Set{}), "#{}");
  EXPECT_EQ(write(Map{{":name", "Alice"}, {":age", 30}}), R"({:name "Alice" :age 30})");
  EXPECT_EQ(write(Map{}), "{}");
  EXPECT_EQ(write(Map{{":data", Value(Sequence{1, Value(Map{{":nested", true}})})}}), "{:data [1 {:nested true}]}");
}

TEST(writer, indent_option_has_no_effect)
{
  Value value = read("{:a [1 2] :b #{3}}");
  EXPECT_EQ(write(value, {.indent = 4}), write(value));
}

TEST(writer, round_trip_shared_subset)
{
  boost::uuids::string_generator gen;
  Value value(Map{
      {":nil", Value()},
      {":flags", Value(Sequence{true, false})},
      {":count", -12},
      {":ratio", 0.25},
      {":name", "some text\twith\nescapes"},
      {":at", utcInstant(2021, 6, 30, 23, 59, 59, 123456)},
      {":id", gen("550e8400-e29b-41d4-a716-446655440000")},
      {":rows", Value(Sequence{Value(Sequence{1, "a"}), Value(Sequence{2, "b"})})},
      {":nested", Value(Map{{":empty", Value(Map{})}})},
  });

  EXPECT_EQ(read(write(value)), value);
}

TEST(writer, round_trip_set)
{
  Value value(Set{1, 2.5, ":kw", Value(Sequence{3})});
  EXPECT_EQ(read(write(value)), value);
}

TEST(writer, transaction_report_shape)
{
  Value report = read("{:db-before {:basis-t 1000} :db-after {:basis-t 1001} "
                      ":tx-data [[13194139534313 50 #inst \"2023-01-15T10:30:00.000-00:00\" 13194139534313 true]] "
                      ":tempids {-9223350046623220288 17592186045418}}");
  const Map &map = report.as<Map>();
  EXPECT_EQ(map.at(":db-after").as<Map>().at(":basis-t"), Value(1001));
  const Sequence &datoms = map.at(":tx-data").as<Sequence>();
  ASSERT_EQ(datoms.size(), 1u);
  EXPECT_EQ(datoms[0].as<Sequence>()[2], Value(utcInstant(2023, 1, 15, 10, 30)));
  EXPECT_EQ(read(write(report)), report);
}

TEST(pprint, one_element_per_line)
{
  EXPECT_EQ(pprint(read("[1 2 [3 4]]")), "[1\n 2\n [3\n  4]]");
  EXPECT_EQ(pprint(read("#{1 2}")), "#{1\n  2}");
}

TEST(pprint, map_values_align_after_their_key)
{
  EXPECT_EQ(pprint(read("{:a 1 :b [2 3]}")), "{:a 1\n :b [2\n     3]}");
}

TEST(pprint, atoms_and_empty_collections)
{
  EXPECT_EQ(pprint(read(":kw")), ":kw");
  EXPECT_EQ(pprint(read("[]")), "[]");
  EXPECT_EQ(pprint(read("{}")), "{}");
}

TEST(pprint, single_line_matches_write)
{
  Value value = read("{:a [1 2] :b #{3} :c \"x\"}");
  EXPECT_EQ(pprint(value, 0, false), write(value));
}

TEST(pprint, output_reads_back)
{
  Value value = read("{:a [1 {:b #{2 3}}] :c (4 5)}");
  EXPECT_EQ(read(pprint(value, 2)), value);
}
