// file      : tests/key-generator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>
#include <iostream>

#include <catch2/catch.hpp>

#include <ddlgen/context.hxx>
#include <ddlgen/relational/context.hxx>
#include <ddlgen/relational/key-generator.hxx>

#include "helpers.hxx"

using namespace std;

namespace sema_rel = semantics::relational;

TEST_CASE ("built-in strategies are always registered", "[key-generator]")
{
  options ops (make_options ("pgsql"));
  semantics::unit u (semantics::path ("test.xml"));
  auto_ptr<context> ctx (create_context (cerr, u, ops, 0));

  sema_rel::model m;
  relational::key_generator_registry kgr (m);

  char const* const ss[] = {"MAX", "HIGH-LOW", "UUID", "IDENTITY", "SEQUENCE"};

  for (size_t i (0); i < sizeof (ss) / sizeof (ss[0]); ++i)
  {
    sema_rel::key_generator* kg (kgr.find (ss[i]));
    REQUIRE (kg != 0);
    CHECK (kg->strategy () == ss[i]);
    CHECK (kg->parameters ().empty ());
  }

  // Lookup is case-insensitive.
  //
  CHECK (kgr.find ("identity") == kgr.find ("IDENTITY"));
  CHECK (kgr.find ("high-low") != 0);
  CHECK (kgr.find ("GUID") == 0);
}

TEST_CASE ("strategy names", "[key-generator]")
{
  typedef relational::key_generator_registry registry;

  CHECK (registry::known_strategy ("SEQUENCE"));
  CHECK (registry::known_strategy ("sequence"));
  CHECK (registry::known_strategy ("high-low"));
  CHECK (!registry::known_strategy ("hilo"));
  CHECK (!registry::known_strategy (""));
}

TEST_CASE ("declared key generators", "[key-generator]")
{
  options ops (make_options ("pgsql"));
  auto_ptr<semantics::unit> u (
    load ("<mapping>"
          "  <key-generator name=\"sequence\" alias=\"order_seq\">"
          "    <param name=\"sequence\" value=\"orders_{0}\"/>"
          "    <param name=\"increment\" value=\"10\"/>"
          "  </key-generator>"
          "  <key-generator name=\"MAX\" alias=\"order_seq\"/>"
          "  <key-generator name=\"hilo\" alias=\"bad\"/>"
          "</mapping>",
          ops));

  auto_ptr<context> ctx (create_context (cerr, *u, ops, 0));

  sema_rel::model m;
  relational::key_generator_registry kgr (m);

  semantics::unit::declares_iterator i (u->declares_begin ());
  semantics::key_generator& seq (i->key_generator ());
  ++i;
  semantics::key_generator& max (i->key_generator ());
  ++i;
  semantics::key_generator& bad (i->key_generator ());

  SECTION ("strategy is upper-cased and parameters are kept")
  {
    REQUIRE (kgr.insert (seq));

    sema_rel::key_generator* kg (kgr.find ("ORDER_SEQ"));
    REQUIRE (kg != 0);
    CHECK (kg->name () == "order_seq");
    CHECK (kg->strategy () == "SEQUENCE");
    CHECK (kg->parameter_value ("sequence") == "orders_{0}");
    CHECK (kg->parameter_value ("increment") == "10");
    CHECK (kg->parameter_value ("cache", "1") == "1");
  }

  SECTION ("later declaration replaces earlier one")
  {
    REQUIRE (kgr.insert (seq));
    REQUIRE (kgr.insert (max));

    sema_rel::key_generator* kg (kgr.find ("order_seq"));
    REQUIRE (kg != 0);
    CHECK (kg->strategy () == "MAX");
    CHECK (kg->parameters ().empty ());
  }

  SECTION ("unknown strategy is refused")
  {
    CHECK (!kgr.insert (bad));
    CHECK (kgr.find ("bad") == 0);
  }
}

TEST_CASE ("sequence name of a table", "[key-generator]")
{
  options ops (make_options ("pgsql"));
  auto_ptr<semantics::unit> u (
    load ("<mapping>"
          "  <key-generator name=\"SEQUENCE\" alias=\"named\">"
          "    <param name=\"sequence\" value=\"seq_{0}_{0}\"/>"
          "  </key-generator>"
          "  <class name=\"A\" key-generator=\"sequence\">"
          "    <map-to table=\"a\"/>"
          "    <field name=\"id\" type=\"integer\" identity=\"true\">"
          "      <sql/>"
          "    </field>"
          "  </class>"
          "  <class name=\"B\" key-generator=\"named\">"
          "    <map-to table=\"b\"/>"
          "    <field name=\"id\" type=\"integer\" identity=\"true\">"
          "      <sql/>"
          "    </field>"
          "  </class>"
          "  <class name=\"C\">"
          "    <map-to table=\"c\"/>"
          "    <field name=\"id\" type=\"integer\" identity=\"true\">"
          "      <sql/>"
          "    </field>"
          "  </class>"
          "</mapping>",
          ops));

  cutl::shared_ptr<sema_rel::model> m (build (*u, ops));

  CHECK (relational::context::sequence_name (table (*m, "a")) == "a_seq");
  CHECK (relational::context::sequence_name (table (*m, "b")) == "seq_b_b");
  CHECK (relational::context::sequence_name (table (*m, "c")).empty ());
}
