#include <boost/test/unit_test.hpp>
#include <fr/model/Descriptor.hpp>

#include <stdexcept>
#include <string>

using namespace fr::model;

BOOST_AUTO_TEST_SUITE(DescriptorTestSuite)

BOOST_AUTO_TEST_CASE(test_parse_modifiers) {
  BOOST_CHECK_EQUAL(parseModifiers(""), 0u);
  BOOST_CHECK_EQUAL(parseModifiers("private"), static_cast<uint32_t>(PRIVATE));
  BOOST_CHECK_EQUAL(parseModifiers("public static final"), static_cast<uint32_t>(PUBLIC | STATIC | FINAL));
  BOOST_CHECK_EQUAL(parseModifiers("Public, Transient"), static_cast<uint32_t>(PUBLIC | TRANSIENT));
  BOOST_CHECK_THROW(parseModifiers("public sealed"), std::invalid_argument);

  BOOST_CHECK_EQUAL(modifiersToString(PROTECTED | VOLATILE), "protected volatile");
  BOOST_CHECK_EQUAL(modifiersToString(0), "");
}

BOOST_AUTO_TEST_CASE(test_declare_fields) {
  TypeDescription type{"Point", {}};
  type.declare("x", "int").declare("y", "int", PUBLIC | FINAL);

  BOOST_REQUIRE_EQUAL(type.fields.size(), 2u);
  BOOST_CHECK_EQUAL(type.fields[0].declaringType, "Point");
  BOOST_CHECK_EQUAL(type.fields[0].modifiers, static_cast<uint32_t>(PRIVATE));
  BOOST_CHECK(type.fields[1].isFinal());
  BOOST_CHECK(!type.fields[1].isStatic());
}

BOOST_AUTO_TEST_CASE(test_describe) {
  TypeDescription type{"Point", {}};
  type.declare("x", "int", PUBLIC | STATIC);

  BOOST_CHECK_EQUAL(Descriptors::describe(type), "Point[1 fields]");
  BOOST_CHECK_EQUAL(Descriptors::describe(type.fields.front()), "public static int Point.x");
  BOOST_CHECK_EQUAL(Descriptors::describe(FieldDescription{"raw", "int", 0, "Point"}), "int Point.raw");
  BOOST_CHECK_EQUAL(Descriptors::describe(Value{true}), "bool(true)");
  BOOST_CHECK_EQUAL(Descriptors::describe(Value{int64_t{1}}), "int64(1)");
  BOOST_CHECK_EQUAL(Descriptors::describe(Value{2.5}), "double(2.5)");
  BOOST_CHECK_EQUAL(Descriptors::describe(Value{std::string("abc")}), "string(abc)");
}

BOOST_AUTO_TEST_CASE(test_value_hash) {
  BOOST_CHECK_EQUAL(Descriptors::hashValue(Value{int64_t{3}}), Descriptors::hashValue(Value{int64_t{3}}));
  BOOST_CHECK(Value{int64_t{1}} != Value{1.0});
}

BOOST_AUTO_TEST_SUITE_END()
