// file      : ddlgen/option-types.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <cctype>    // std::tolower
#include <istream>
#include <ostream>
#include <algorithm> // std::lower_bound

#include <ddlgen/option-types.hxx>

using namespace std;

//
// database
//

static const char* database_[] =
{
  "mysql",
  "oracle",
  "pgsql",
  "sqlite"
};

const char* database::
string () const
{
  return database_[v_];
}

istream&
operator>> (istream& is, database& db)
{
  string s;
  is >> s;

  if (!is.fail ())
  {
    const char** e (database_ + sizeof (database_) / sizeof (char*));
    const char** i (lower_bound (database_, e, s));

    if (i != e && *i == s)
      db = database::value (i - database_);
    else
      is.setstate (istream::failbit);
  }

  return is;
}

ostream&
operator<< (ostream& os, database db)
{
  return os << db.string ();
}

//
// ddl_group
//

static const char* ddl_group_[] =
{
  "table",
  "type"
};

const char* ddl_group::
string () const
{
  return ddl_group_[v_];
}

istream&
operator>> (istream& is, ddl_group& g)
{
  string s;
  is >> s;

  if (!is.fail ())
  {
    // Grouping mode names are matched case-insensitively.
    //
    for (string::size_type i (0); i < s.size (); ++i)
      s[i] = static_cast<char> (tolower (s[i]));

    const char** e (ddl_group_ + sizeof (ddl_group_) / sizeof (char*));
    const char** i (lower_bound (ddl_group_, e, s));

    if (i != e && *i == s)
      g = ddl_group::value (i - ddl_group_);
    else
      is.setstate (istream::failbit);
  }

  return is;
}

ostream&
operator<< (ostream& os, ddl_group g)
{
  return os << g.string ();
}
