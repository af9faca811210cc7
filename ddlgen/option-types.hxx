// file      : ddlgen/option-types.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_OPTION_TYPES_HXX
#define DDLGEN_OPTION_TYPES_HXX

#include <iosfwd>

struct database
{
  enum value
  {
    // Keep in alphabetic order.
    //
    mysql,
    oracle,
    pgsql,
    sqlite
  };

  database (value v = value (0)) : v_ (v) {}
  operator value () const {return v_;}

  const char*
  string () const;

private:
  value v_;
};

std::istream&
operator>> (std::istream&, database&);

std::ostream&
operator<< (std::ostream&, database);

// Order in which DDL statements are grouped in the output.
//
struct ddl_group
{
  enum value
  {
    // Keep in alphabetic order.
    //
    table, // All statements for a table before the next table.
    type   // All statements of one kind before the next kind.
  };

  ddl_group (value v = value (0)) : v_ (v) {}
  operator value () const {return v_;}

  const char*
  string () const;

private:
  value v_;
};

std::istream&
operator>> (std::istream&, ddl_group&);

std::ostream&
operator<< (std::ostream&, ddl_group);

#endif // DDLGEN_OPTION_TYPES_HXX
