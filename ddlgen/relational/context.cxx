// file      : ddlgen/relational/context.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cassert>
#include <sstream>

#include <ddlgen/relational/context.hxx>

using namespace std;

namespace relational
{
  namespace
  {
    // Type names commonly used in mapping documents that are not SQL
    // type names.
    //
    struct type_alias
    {
      const char* const name;
      const char* const sql_name;
    };

    type_alias const type_aliases[] =
    {
      {"BIG-DECIMAL", "NUMERIC"},
      {"BOOL", "BOOLEAN"},
      {"BYTE", "TINYINT"},
      {"INT", "INTEGER"},
      {"LONG", "BIGINT"},
      {"SHORT", "SMALLINT"},
      {"STRING", "VARCHAR"}
    };

    string
    trim (string const& s)
    {
      string::size_type b (s.find_first_not_of (" \t\n\r"));

      if (b == string::npos)
        return string ();

      string::size_type e (s.find_last_not_of (" \t\n\r"));
      return string (s, b, e - b + 1);
    }
  }

  context* context::current_;

  context::
  ~context ()
  {
    if (current_ == this)
      current_ = 0;
  }

  context::
  context ()
      : data_ (current ().data_),
        model (current ().model)
  {
  }

  context::
  context (data* d, sema_rel::model* m)
      : data_ (d),
        model (m)
  {
    assert (current_ == 0);
    current_ = this;
  }

  void context::
  populate (type_map_entry const* e, size_t n)
  {
    for (size_t i (0); i < n; ++i)
    {
      type_map_type::value_type v (
        e[i].name, db_type_type (e[i].db_type, e[i].kind));

      data_->type_map_.insert (v);
    }
  }

  string context::
  database_type (string const& type)
  {
    // Everything starting from '[' is a conversion parameter that has
    // no effect on DDL.
    //
    string n (type, 0, type.find ('['));
    string args;

    string::size_type p (n.find ('('));
    if (p != string::npos)
    {
      string::size_type e (n.find (')', p));
      args = trim (
        string (n, p + 1, e != string::npos ? e - p - 1 : string::npos));
      n.resize (p);
    }

    n = upcase (trim (n));

    if (n.empty ())
      return string ();

    for (size_t i (0); i < sizeof (type_aliases) / sizeof (type_alias); ++i)
    {
      if (n == type_aliases[i].name)
      {
        n = type_aliases[i].sql_name;
        break;
      }
    }

    return current ().database_type_impl (n, args);
  }

  bool context::
  auto_column (sema_rel::column& c)
  {
    sema_rel::key_generator* kg (c.key_generator_ ());

    if (kg == 0 || kg->strategy () != "IDENTITY" || !c.identity ())
      return false;

    sema_rel::primary_key& pk (c.table ().primary_key_ ());
    return pk.contains_size () == 1 && pk.contains_column (c);
  }

  string context::
  sequence_name (sema_rel::table& t)
  {
    sema_rel::key_generator* kg (t.key_generator_ ());
    string r (kg != 0 ? kg->parameter_value ("sequence", "{0}_seq") : "");

    for (string::size_type p (r.find ("{0}")); p != string::npos;
         p = r.find ("{0}", p + t.name ().size ()))
      r.replace (p, 3, t.name ());

    return r;
  }

  string context::
  database_type_impl (string const& name, string const& args)
  {
    type_map_type::const_iterator i (data_->type_map_.find (name));

    if (i == data_->type_map_.end ())
      return string ();

    db_type_type const& t (i->second);
    ostringstream os;
    os << t.type;

    switch (t.kind)
    {
    case param_none:
      break;
    case param_fixed_length:
      {
        os << '(';

        if (args.empty ())
          os << options.char_length ();
        else
          os << args;

        os << ')';
        break;
      }
    case param_variable_length:
      {
        os << '(';

        if (args.empty ())
          os << options.varchar_length ();
        else
          os << args;

        os << ')';
        break;
      }
    case param_precision:
      {
        os << '(';

        if (args.empty ())
          os << options.numeric_precision () << ','
             << options.numeric_scale ();
        else
          os << args;

        os << ')';
        break;
      }
    }

    return os.str ();
  }

  string context::
  quote_string_impl (string const& s) const
  {
    string r;
    r.reserve (s.size ());
    r += '\'';

    for (string::size_type i (0), n (s.size ()); i < n; ++i)
    {
      if (s[i] == '\'')
        r += "''";
      else
        r += s[i];
    }

    r += '\'';
    return r;
  }

  string context::
  quote_id_impl (string const& id) const
  {
    string r;
    r.reserve (id.size ());
    r += '"';
    r += id;
    r += '"';
    return r;
  }
}
