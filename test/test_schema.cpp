#include <stdexcept>
#include <string>
#include <vector>

#include "helpers.hpp"
#include "schema/schema.hpp"

using namespace datomic;

TEST(schema, minimal_attribute)
{
  schema::Attribute name{.ident = ":person/name", .valueType = std::string(schema::typeString)};
  EXPECT_EQ(schema::attribute(name),
            "{:db/ident :person/name :db/valueType :db.type/string :db/cardinality :db.cardinality/one}");
}

TEST(schema, attribute_with_every_option)
{
  schema::Attribute email{
      .ident = ":person/email",
      .valueType = std::string(schema::typeString),
      .doc = "Primary email address",
      .cardinality = std::string(schema::cardinalityMany),
      .unique = std::string(schema::uniqueIdentity),
      .index = true,
      .fulltext = true,
      .noHistory = true,
  };
  EXPECT_EQ(schema::attribute(email),
            "{:db/ident :person/email :db/valueType :db.type/string :db/cardinality :db.cardinality/many "
            ":db/doc \"Primary email address\" :db/unique :db.unique/identity "
            ":db/index true :db/fulltext true :db/noHistory true}");
}

TEST(schema, idents_must_be_keywords)
{
  schema::Attribute bad{.ident = "person/name", .valueType = std::string(schema::typeString)};
  EXPECT_THROW(schema::attribute(bad), std::invalid_argument);

  schema::Attribute badType{.ident = ":person/name", .valueType = "string"};
  EXPECT_THROW(schema::attributeValue(badType), std::invalid_argument);

  schema::Attribute badUnique{.ident = ":person/name", .valueType = std::string(schema::typeString), .unique = ":"};
  EXPECT_THROW(schema::attributeValue(badUnique), std::invalid_argument);
}

TEST(schema, schema_is_a_vector_of_maps)
{
  std::vector<schema::Attribute> attributes{
      {.ident = ":person/name", .valueType = std::string(schema::typeString)},
      {.ident = ":person/age", .valueType = std::string(schema::typeLong)},
  };
  EXPECT_EQ(schema::schema(attributes),
            "[{:db/ident :person/name :db/valueType :db.type/string :db/cardinality :db.cardinality/one} "
            "{:db/ident :person/age :db/valueType :db.type/long :db/cardinality :db.cardinality/one}]");
  EXPECT_EQ(schema::schema({}), "[]");
}

TEST(schema, attribute_text_reads_back)
{
  schema::Attribute friends{
      .ident = ":person/friends",
      .valueType = std::string(schema::typeRef),
      .doc = "People this person \"knows\"",
      .cardinality = std::string(schema::cardinalityMany),
  };
  edn::Value text = edn::read(schema::attribute(friends));
  EXPECT_EQ(text, edn::Value(schema::attributeValue(friends)));
  EXPECT_EQ(text.as<edn::Map>().at(":db/doc"), edn::Value("People this person \"knows\""));
}

TEST(schema, doc_starting_with_colon_stays_a_string)
{
  schema::Attribute mood{
      .ident = ":person/mood",
      .valueType = std::string(schema::typeString),
      .doc = ":-) happy people",
  };
  std::string text = schema::attribute(mood);
  EXPECT_EQ(text, "{:db/ident :person/mood :db/valueType :db.type/string :db/cardinality :db.cardinality/one "
                  ":db/doc \":-) happy people\"}");
  EXPECT_EQ(edn::read(text), edn::Value(schema::attributeValue(mood)));
  EXPECT_EQ(edn::read(schema::schema({mood})), edn::Value(edn::Sequence{schema::attributeValue(mood)}));
}
