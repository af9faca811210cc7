// file      : tests/junction.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>

#include <catch2/catch.hpp>

#include <ddlgen/relational/model.hxx>

#include "helpers.hxx"

using namespace std;
using semantics::strings;

namespace sema_rel = semantics::relational;

namespace
{
  typedef cutl::shared_ptr<sema_rel::model> model_ptr;

  strings
  seq (char const* a, char const* b = 0, char const* c = 0)
  {
    strings r;
    r.push_back (a);

    if (b != 0)
      r.push_back (b);

    if (c != 0)
      r.push_back (c);

    return r;
  }

  // Build the model keeping the mapping alive alongside it.
  //
  struct fixture
  {
    explicit
    fixture (string const& xml)
        : ops (make_options ("pgsql")), unit (load (xml, ops))
    {
    }

    model_ptr
    build ()
    {
      return ::build (*unit, ops);
    }

    options ops;
    auto_ptr<semantics::unit> unit;
  };

  char const authors[] =
    "<mapping>"
    "  <class name=\"A\" key-generator=\"identity\">"
    "    <map-to table=\"a\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"bs\" type=\"B\" collection=\"set\">"
    "      <sql many-table=\"a_b\"/>"
    "    </field>"
    "  </class>"
    "  <class name=\"B\">"
    "    <map-to table=\"b\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"title\" type=\"string\"><sql/></field>"
    "  </class>"
    "</mapping>";
}

TEST_CASE ("many-to-many member produces a junction table", "[junction]")
{
  fixture f (authors);
  model_ptr m (f.build ());

  // Junction tables follow the class tables.
  //
  CHECK (table_names (*m) == seq ("a", "b", "a_b"));

  sema_rel::table& j (table (*m, "a_b"));
  CHECK (column_names (j) == seq ("a", "b"));

  sema_rel::column& a (*j.find<sema_rel::column> ("a"));
  sema_rel::column& b (*j.find<sema_rel::column> ("b"));

  CHECK (a.identity ());
  CHECK (b.identity ());
  CHECK (!a.null ());
  CHECK (!b.null ());
  CHECK (a.type () == "INTEGER");
  CHECK (b.type () == "INTEGER");

  CHECK (j.primary_key_ ().name () == "pk_a_b");
  CHECK (key_columns (j.primary_key_ ()) == seq ("a", "b"));
}

TEST_CASE ("junction table refers to both sides", "[junction]")
{
  fixture f (authors);
  model_ptr m (f.build ());

  sema_rel::table& j (table (*m, "a_b"));

  sema_rel::foreign_key* fa (j.find<sema_rel::foreign_key> ("a_b_a"));
  REQUIRE (fa != 0);
  CHECK (fa->referenced_table () == "a");
  CHECK (key_columns (*fa) == seq ("a"));
  CHECK (fa->referenced_columns () == seq ("id"));
  CHECK (fa->relation () == sema_rel::foreign_key::one_one);

  sema_rel::foreign_key* fb (j.find<sema_rel::foreign_key> ("a_b_b"));
  REQUIRE (fb != 0);
  CHECK (fb->referenced_table () == "b");
  CHECK (key_columns (*fb) == seq ("b"));
  CHECK (fb->referenced_columns () == seq ("id"));
  CHECK (fb->relation () == sema_rel::foreign_key::one_one);
}

TEST_CASE ("many-to-many member has no columns in its own table",
           "[junction]")
{
  fixture f (authors);
  model_ptr m (f.build ());

  CHECK (column_names (table (*m, "a")) == seq ("id"));
  CHECK (table (*m, "a").find<sema_rel::foreign_key> ("a_bs") == 0);
}

TEST_CASE ("junction table uses the owner's key generator", "[junction]")
{
  fixture f (authors);
  model_ptr m (f.build ());

  sema_rel::key_generator* kg (table (*m, "a_b").key_generator_ ());
  REQUIRE (kg != 0);
  CHECK (kg->strategy () == "IDENTITY");

  CHECK (table (*m, "b").key_generator_ () == 0);
}

TEST_CASE ("junction column names", "[junction]")
{
  fixture f (
    "<mapping>"
    "  <class name=\"A\">"
    "    <map-to table=\"a\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"bs\" type=\"B\">"
    "      <sql name=\"b_id\" many-table=\"a_b\" many-key=\"a_id\"/>"
    "    </field>"
    "  </class>"
    "  <class name=\"B\">"
    "    <map-to table=\"b\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "  </class>"
    "</mapping>");

  model_ptr m (f.build ());

  sema_rel::table& j (table (*m, "a_b"));
  CHECK (column_names (j) == seq ("a_id", "b_id"));
  CHECK (key_columns (j.primary_key_ ()) == seq ("a_id", "b_id"));

  sema_rel::foreign_key* fb (j.find<sema_rel::foreign_key> ("a_b_b"));
  REQUIRE (fb != 0);
  CHECK (key_columns (*fb) == seq ("b_id"));
}

TEST_CASE ("relation declared on both sides", "[junction]")
{
  fixture f (
    "<mapping>"
    "  <class name=\"A\">"
    "    <map-to table=\"a\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"bs\" type=\"B\"><sql many-table=\"a_b\"/></field>"
    "  </class>"
    "  <class name=\"B\">"
    "    <map-to table=\"b\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"as\" type=\"A\"><sql many-table=\"a_b\"/></field>"
    "  </class>"
    "</mapping>");

  model_ptr m (f.build ());

  CHECK (table_names (*m) == seq ("a", "b", "a_b"));
  CHECK (column_names (table (*m, "a_b")) == seq ("a", "b"));
}

TEST_CASE ("relation of a class with itself", "[junction]")
{
  fixture f (
    "<mapping>"
    "  <class name=\"Person\">"
    "    <map-to table=\"person\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"friends\" type=\"Person\">"
    "      <sql many-table=\"friendship\"/>"
    "    </field>"
    "  </class>"
    "</mapping>");

  model_ptr m (f.build ());

  sema_rel::table& j (table (*m, "friendship"));
  CHECK (column_names (j) == seq ("person"));
  CHECK (key_columns (j.primary_key_ ()) == seq ("person"));
}

TEST_CASE ("relation of a class with itself with named columns",
           "[junction]")
{
  fixture f (
    "<mapping>"
    "  <class name=\"Person\">"
    "    <map-to table=\"person\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"friends\" type=\"Person\">"
    "      <sql name=\"friend_id\" many-table=\"friendship\""
    "           many-key=\"person_id\"/>"
    "    </field>"
    "  </class>"
    "</mapping>");

  model_ptr m (f.build ());

  sema_rel::table& j (table (*m, "friendship"));
  CHECK (column_names (j) == seq ("person_id", "friend_id"));
  CHECK (key_columns (j.primary_key_ ()) == seq ("person_id", "friend_id"));

  sema_rel::foreign_key* fp (
    j.find<sema_rel::foreign_key> ("friendship_person"));
  REQUIRE (fp != 0);
  CHECK (fp->referenced_table () == "person");
  CHECK (key_columns (*fp) == seq ("person_id"));

  sema_rel::foreign_key* ff (
    j.find<sema_rel::foreign_key> ("friendship_friend_id"));
  REQUIRE (ff != 0);
  CHECK (ff->referenced_table () == "person");
  CHECK (key_columns (*ff) == seq ("friend_id"));
  CHECK (ff->referenced_columns () == seq ("id"));
}

TEST_CASE ("junction with composite identity", "[junction]")
{
  fixture f (
    "<mapping>"
    "  <class name=\"A\">"
    "    <map-to table=\"a\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"bs\" type=\"B\"><sql many-table=\"a_b\"/></field>"
    "  </class>"
    "  <class name=\"B\" identity=\"x y\">"
    "    <map-to table=\"b\"/>"
    "    <field name=\"x\" type=\"integer\"><sql/></field>"
    "    <field name=\"y\" type=\"varchar(8)\"><sql/></field>"
    "  </class>"
    "</mapping>");

  model_ptr m (f.build ());

  sema_rel::table& j (table (*m, "a_b"));
  CHECK (column_names (j) == seq ("a", "b_x", "b_y"));
  CHECK (j.find<sema_rel::column> ("b_y")->type () == "VARCHAR(8)");

  sema_rel::foreign_key* fb (j.find<sema_rel::foreign_key> ("a_b_b"));
  REQUIRE (fb != 0);
  CHECK (fb->referenced_columns () == seq ("x", "y"));
}

TEST_CASE ("invalid many-to-many targets", "[junction]")
{
  SECTION ("class without table")
  {
    fixture f (
      "<mapping>"
      "  <class name=\"B\">"
      "    <field name=\"id\" type=\"integer\" identity=\"true\"/>"
      "  </class>"
      "  <class name=\"A\">"
      "    <map-to table=\"a\"/>"
      "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
      "    <field name=\"bs\" type=\"B\"><sql many-table=\"a_b\"/></field>"
      "  </class>"
      "</mapping>");

    CHECK_THROWS_AS (f.build (), relational::model::structural_error);
  }

  SECTION ("unknown class")
  {
    fixture f (
      "<mapping>"
      "  <class name=\"A\">"
      "    <map-to table=\"a\"/>"
      "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
      "    <field name=\"bs\" type=\"B\"><sql many-table=\"a_b\"/></field>"
      "  </class>"
      "</mapping>");

    CHECK_THROWS_AS (f.build (), relational::model::type_not_found);
  }
}
