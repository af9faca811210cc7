// file      : tests/validator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>

#include <catch2/catch.hpp>

#include <ddlgen/validator.hxx>

#include "helpers.hxx"

using namespace std;

namespace
{
  void
  validate (string const& xml)
  {
    options ops (make_options ("pgsql"));
    auto_ptr<semantics::unit> u (load (xml, ops));

    validator v;
    v.validate (ops, *u, semantics::path ("test.xml"));
  }
}

TEST_CASE ("valid mapping passes validation", "[validator]")
{
  CHECK_NOTHROW (
    validate (
      "<mapping>"
      "  <key-generator name=\"SEQUENCE\" alias=\"seq\"/>"
      "  <class name=\"A\" key-generator=\"Seq\">"
      "    <map-to table=\"a\"/>"
      "    <field name=\"id\" type=\"integer\" identity=\"true\">"
      "      <sql/>"
      "    </field>"
      "    <field name=\"name\" type=\"string\"><sql/></field>"
      "    <field name=\"bs\" type=\"B\">"
      "      <sql many-table=\"a_b\"/>"
      "    </field>"
      "    <index columns=\"name\"/>"
      "  </class>"
      "  <class name=\"B\" key-generator=\"uuid\">"
      "    <map-to table=\"b\"/>"
      "    <field name=\"id\" type=\"char(36)\" identity=\"true\">"
      "      <sql/>"
      "    </field>"
      "  </class>"
      "</mapping>"));
}

TEST_CASE ("missing identity is only a warning", "[validator]")
{
  CHECK_NOTHROW (
    validate (
      "<mapping>"
      "  <class name=\"Log\">"
      "    <map-to table=\"log\"/>"
      "    <field name=\"text\" type=\"string\"><sql/></field>"
      "  </class>"
      "</mapping>"));
}

TEST_CASE ("mapping problems fail validation", "[validator]")
{
  SECTION ("undeclared key generator")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <class name=\"A\" key-generator=\"my_seq\">"
        "    <map-to table=\"a\"/>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("unknown strategy")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <key-generator name=\"hilo\" alias=\"h\"/>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("key generator with unknown strategy is not declared")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <key-generator name=\"hilo\" alias=\"h\"/>"
        "  <class name=\"A\" key-generator=\"h\">"
        "    <map-to table=\"a\"/>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("index on undeclared member")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <class name=\"A\">"
        "    <map-to table=\"a\"/>"
        "    <field name=\"id\" type=\"integer\" identity=\"true\">"
        "      <sql/>"
        "    </field>"
        "    <index columns=\"id code\"/>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("many-to-many table of a persistent class")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <class name=\"A\">"
        "    <map-to table=\"a\"/>"
        "    <field name=\"id\" type=\"integer\" identity=\"true\">"
        "      <sql/>"
        "    </field>"
        "    <field name=\"bs\" type=\"B\">"
        "      <sql many-table=\"b\"/>"
        "    </field>"
        "  </class>"
        "  <class name=\"B\">"
        "    <map-to table=\"b\"/>"
        "    <field name=\"id\" type=\"integer\" identity=\"true\">"
        "      <sql/>"
        "    </field>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("identity of its own type")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <class name=\"Node\">"
        "    <map-to table=\"node\"/>"
        "    <field name=\"id\" type=\"Node\" identity=\"true\">"
        "      <sql/>"
        "    </field>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }

  SECTION ("identities referring to each other")
  {
    CHECK_THROWS_AS (
      validate (
        "<mapping>"
        "  <class name=\"A\">"
        "    <map-to table=\"a\"/>"
        "    <field name=\"id\" type=\"B\" identity=\"true\">"
        "      <sql name=\"b_id\"/>"
        "    </field>"
        "  </class>"
        "  <class name=\"B\">"
        "    <map-to table=\"b\"/>"
        "    <field name=\"id\" type=\"A\" identity=\"true\">"
        "      <sql name=\"a_id\"/>"
        "    </field>"
        "  </class>"
        "</mapping>"),
      validator::failed);
  }
}

TEST_CASE ("index may name inherited members and columns", "[validator]")
{
  CHECK_NOTHROW (
    validate (
      "<mapping>"
      "  <class name=\"P\">"
      "    <map-to table=\"p\"/>"
      "    <field name=\"id\" type=\"integer\" identity=\"true\">"
      "      <sql name=\"pid\"/>"
      "    </field>"
      "  </class>"
      "  <class name=\"C\" extends=\"P\">"
      "    <map-to table=\"c\"/>"
      "    <field name=\"code\" type=\"string\">"
      "      <sql name=\"code_c\"/>"
      "    </field>"
      "    <index columns=\"id pid code code_c\"/>"
      "  </class>"
      "</mapping>"));
}
