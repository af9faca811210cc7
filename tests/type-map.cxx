// file      : tests/type-map.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>
#include <iostream>

#include <catch2/catch.hpp>

#include <ddlgen/context.hxx>
#include <ddlgen/relational/context.hxx>

#include "helpers.hxx"

using namespace std;

namespace
{
  // Resolve the type name in the context of the database.
  //
  string
  resolve (options const& ops, string const& type)
  {
    semantics::unit u (semantics::path ("test.xml"));
    auto_ptr<context> ctx (create_context (cerr, u, ops, 0));
    return relational::context::current ().database_type (type);
  }

  string
  resolve (char const* db, string const& type)
  {
    return resolve (make_options (db), type);
  }
}

TEST_CASE ("type names are case-insensitive", "[type-map]")
{
  CHECK (resolve ("pgsql", "integer") == "INTEGER");
  CHECK (resolve ("pgsql", "Integer") == "INTEGER");
  CHECK (resolve ("pgsql", " BIGINT ") == "BIGINT");
}

TEST_CASE ("mapping type aliases", "[type-map]")
{
  CHECK (resolve ("pgsql", "string") == "VARCHAR(32)");
  CHECK (resolve ("pgsql", "int") == "INTEGER");
  CHECK (resolve ("pgsql", "long") == "BIGINT");
  CHECK (resolve ("pgsql", "short") == "SMALLINT");
  CHECK (resolve ("pgsql", "boolean") == "BOOLEAN");
  CHECK (resolve ("pgsql", "big-decimal") == "NUMERIC(10,0)");
  CHECK (resolve ("mysql", "byte") == "TINYINT");
  CHECK (resolve ("oracle", "string") == "VARCHAR2(32)");
  CHECK (resolve ("sqlite", "string") == "TEXT");
}

TEST_CASE ("explicit type arguments", "[type-map]")
{
  CHECK (resolve ("pgsql", "varchar(100)") == "VARCHAR(100)");
  CHECK (resolve ("pgsql", "numeric(12, 2)") == "NUMERIC(12, 2)");
  CHECK (resolve ("mysql", "char(3)") == "CHAR(3)");
  CHECK (resolve ("oracle", "decimal(8,3)") == "NUMBER(8,3)");
}

TEST_CASE ("default type arguments", "[type-map]")
{
  CHECK (resolve ("mysql", "char") == "CHAR(1)");
  CHECK (resolve ("mysql", "varchar") == "VARCHAR(32)");
  CHECK (resolve ("mysql", "decimal") == "DECIMAL(10,0)");

  options ops (
    make_options ("mysql",
                  "--varchar-length", "255",
                  "--numeric-precision", "18"));

  CHECK (resolve (ops, "varchar") == "VARCHAR(255)");
  CHECK (resolve (ops, "numeric") == "NUMERIC(18,0)");
}

TEST_CASE ("conversion parameters are ignored", "[type-map]")
{
  CHECK (resolve ("pgsql", "timestamp[yyyy-MM-dd]") == "TIMESTAMP");
  CHECK (resolve ("pgsql", "char[01]") == "CHAR(1)");
}

TEST_CASE ("dialect type names", "[type-map]")
{
  CHECK (resolve ("pgsql", "double") == "DOUBLE PRECISION");
  CHECK (resolve ("pgsql", "blob") == "BYTEA");
  CHECK (resolve ("mysql", "clob") == "LONGTEXT");
  CHECK (resolve ("oracle", "bigint") == "NUMBER(19)");
  CHECK (resolve ("oracle", "bit") == "NUMBER(1)");
  CHECK (resolve ("sqlite", "timestamp") == "TEXT");
  CHECK (resolve ("sqlite", "varchar(10)") == "TEXT");
}

TEST_CASE ("unknown type names have no mapping", "[type-map]")
{
  CHECK (resolve ("pgsql", "Product").empty ());
  CHECK (resolve ("pgsql", "").empty ());
  CHECK (resolve ("sqlite", "interval").empty ());
}
