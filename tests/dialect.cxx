// file      : tests/dialect.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>

#include <catch2/catch.hpp>

#include "helpers.hxx"

using namespace std;

namespace
{
  char const catalog[] =
    "<mapping>"
    "  <class name=\"Category\">"
    "    <map-to table=\"cat\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"name\" type=\"varchar\" required=\"true\">"
    "      <sql/>"
    "    </field>"
    "  </class>"
    "  <class name=\"Item\" key-generator=\"identity\">"
    "    <map-to table=\"item\"/>"
    "    <field name=\"id\" type=\"integer\" identity=\"true\"><sql/></field>"
    "    <field name=\"name\" type=\"varchar\"><sql/></field>"
    "    <field name=\"category\" type=\"Category\">"
    "      <sql name=\"cat_id\"/>"
    "    </field>"
    "  </class>"
    "</mapping>";
}

TEST_CASE ("mysql", "[dialect]")
{
  string s (emit (catalog,
                  make_options ("mysql",
                                "--omit-header",
                                "--mysql-engine",
                                "InnoDB")));

  CHECK (s ==
         "DROP TABLE IF EXISTS cat;\n"
         "\n"
         "CREATE TABLE cat (\n"
         "  id INTEGER NOT NULL,\n"
         "  name VARCHAR(32) NOT NULL\n"
         ")\n"
         " ENGINE=InnoDB;\n"
         "\n"
         "ALTER TABLE cat\n"
         "  ADD CONSTRAINT pk_cat PRIMARY KEY (id);\n"
         "\n"
         "DROP TABLE IF EXISTS item;\n"
         "\n"
         "CREATE TABLE item (\n"
         "  id INTEGER NOT NULL AUTO_INCREMENT PRIMARY KEY,\n"
         "  name VARCHAR(32),\n"
         "  cat_id INTEGER\n"
         ")\n"
         " ENGINE=InnoDB;\n"
         "\n"
         "ALTER TABLE item\n"
         "  ADD CONSTRAINT item_category FOREIGN KEY (cat_id)\n"
         "    REFERENCES cat (id);\n"
         "\n");
}

TEST_CASE ("mysql without engine", "[dialect]")
{
  string s (emit (catalog, make_options ("mysql", "--omit-header")));

  CHECK (count (s, "ENGINE") == 0);
  CHECK (count (s, "  cat_id INTEGER\n);\n") == 1);
}

TEST_CASE ("mysql quoting and schema", "[dialect]")
{
  string s (emit (catalog,
                  make_options ("mysql",
                                "--omit-header",
                                "--quote-identifiers",
                                "--schema-name",
                                "shop")));

  CHECK (s.compare (0, 37, "CREATE DATABASE IF NOT EXISTS `shop`;") == 0);
  CHECK (count (s, "CREATE TABLE `item` (\n") == 1);
}

TEST_CASE ("sqlite", "[dialect]")
{
  string s (emit (catalog, make_options ("sqlite", "--omit-header")));

  CHECK (s ==
         "DROP TABLE IF EXISTS cat;\n"
         "\n"
         "CREATE TABLE cat (\n"
         "  id INTEGER NOT NULL,\n"
         "  name TEXT NOT NULL,\n"
         "  CONSTRAINT pk_cat PRIMARY KEY (id)\n"
         ");\n"
         "\n"
         "DROP TABLE IF EXISTS item;\n"
         "\n"
         "CREATE TABLE item (\n"
         "  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,\n"
         "  name TEXT,\n"
         "  cat_id INTEGER,\n"
         "  CONSTRAINT item_category FOREIGN KEY (cat_id)\n"
         "    REFERENCES cat (id)\n"
         ");\n"
         "\n");
}

TEST_CASE ("pgsql", "[dialect]")
{
  string s (emit (catalog, make_options ("pgsql", "--omit-header")));

  CHECK (count (s,
                "CREATE TABLE item (\n"
                "  id SERIAL NOT NULL,\n") == 1);

  CHECK (count (s,
                "ALTER TABLE item\n"
                "  ADD CONSTRAINT pk_item PRIMARY KEY (id);\n") == 1);

  CHECK (count (s, "SEQUENCE") == 0);
}

TEST_CASE ("pgsql sequences", "[dialect]")
{
  char const xml[] =
    "<mapping>"
    "  <key-generator name=\"SEQUENCE\" alias=\"order_gen\">"
    "    <param name=\"sequence\" value=\"order_ids\"/>"
    "  </key-generator>"
    "  <class name=\"Order\" key-generator=\"order_gen\">"
    "    <map-to table=\"orders\"/>"
    "    <field name=\"id\" type=\"long\" identity=\"true\"><sql/></field>"
    "  </class>"
    "  <class name=\"Refund\" key-generator=\"order_gen\">"
    "    <map-to table=\"refund\"/>"
    "    <field name=\"id\" type=\"long\" identity=\"true\"><sql/></field>"
    "  </class>"
    "</mapping>";

  string s (emit (xml, make_options ("pgsql", "--omit-header")));

  // The sequence is shared by both tables.
  //
  CHECK (count (s, "CREATE SEQUENCE order_ids;\n\n") == 1);
  CHECK (count (s, "DROP SEQUENCE IF EXISTS order_ids;\n\n") == 2);

  // Sequence values are not generated by the column.
  //
  CHECK (count (s, "  id BIGINT NOT NULL\n") == 2);
  CHECK (count (s, "SERIAL") == 0);
}

TEST_CASE ("oracle", "[dialect]")
{
  string s (emit (catalog, make_options ("oracle", "--omit-header")));

  string prologue (
    "SET FEEDBACK OFF;\n"
    "WHENEVER SQLERROR EXIT FAILURE;\n"
    "WHENEVER OSERROR EXIT FAILURE;\n"
    "\n");

  CHECK (s.compare (0, prologue.size (), prologue) == 0);
  CHECK (s.size () > 6);
  CHECK (s.compare (s.size () - 6, 6, "EXIT;\n") == 0);

  CHECK (count (s,
                "BEGIN\n"
                "  BEGIN\n"
                "    EXECUTE IMMEDIATE 'DROP TABLE cat CASCADE CONSTRAINTS';\n"
                "  EXCEPTION\n"
                "    WHEN OTHERS THEN\n"
                "      IF SQLCODE != -942 THEN RAISE; END IF;\n"
                "  END;\n"
                "END;\n"
                "/\n"
                "\n") == 1);

  CHECK (count (s,
                "  BEGIN\n"
                "    EXECUTE IMMEDIATE 'DROP SEQUENCE item_seq';\n"
                "  EXCEPTION\n"
                "    WHEN OTHERS THEN\n"
                "      IF SQLCODE != -2289 THEN RAISE; END IF;\n"
                "  END;\n"
                "END;\n"
                "/\n") == 1);

  CHECK (count (s,
                "CREATE TABLE cat (\n"
                "  id INTEGER NOT NULL,\n"
                "  name VARCHAR2(32) NOT NULL\n"
                ");\n") == 1);

  CHECK (count (s,
                "CREATE SEQUENCE item_seq\n"
                "  START WITH 1 INCREMENT BY 1;\n") == 1);

  CHECK (count (s,
                "CREATE OR REPLACE TRIGGER item_trg\n"
                "  BEFORE INSERT ON item\n"
                "  FOR EACH ROW\n"
                "BEGIN\n"
                "  SELECT item_seq.NEXTVAL INTO :new.id FROM DUAL;\n"
                "END;\n"
                "/\n") == 1);

  // No sequence for a table without a key generator.
  //
  CHECK (count (s, "CREATE SEQUENCE") == 1);
}
