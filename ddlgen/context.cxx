// file      : ddlgen/context.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::toupper
#include <cassert>
#include <algorithm>

#include <ddlgen/context.hxx>

#include <ddlgen/relational/mysql/context.hxx>
#include <ddlgen/relational/oracle/context.hxx>
#include <ddlgen/relational/pgsql/context.hxx>
#include <ddlgen/relational/sqlite/context.hxx>

using namespace std;

auto_ptr<context>
create_context (ostream& os,
                semantics::unit& unit,
                options const& ops,
                semantics::relational::model* m)
{
  auto_ptr<context> r;

  switch (ops.database ())
  {
  case database::mysql:
    {
      r.reset (new relational::mysql::context (os, unit, ops, m));
      break;
    }
  case database::oracle:
    {
      r.reset (new relational::oracle::context (os, unit, ops, m));
      break;
    }
  case database::pgsql:
    {
      r.reset (new relational::pgsql::context (os, unit, ops, m));
      break;
    }
  case database::sqlite:
    {
      r.reset (new relational::sqlite::context (os, unit, ops, m));
      break;
    }
  }

  return r;
}

context::
~context ()
{
  if (current_ == this)
    current_ = 0;
}

context::
context (ostream& os_,
         semantics::unit& u,
         options_type const& ops,
         data_ptr d)
    : data_ (d ? d : data_ptr (new (shared) data (os_))),
      os (data_->os_),
      unit (u),
      options (ops),
      db (options.database ())
{
  assert (current_ == 0);
  current_ = this;
}

context::
context ()
  : data_ (current ().data_),
    os (current ().os),
    unit (current ().unit),
    options (current ().options),
    db (current ().db)
{
}

context* context::current_;

bool context::
explicit_identity (semantics::class_& c)
{
  for (semantics::scope::names_iterator i (c.names_begin ());
       i != c.names_end (); ++i)
  {
    semantics::data_member* m (
      dynamic_cast<semantics::data_member*> (&i->named ()));

    if (m != 0 && m->get<bool> ("id", false))
      return true;
  }

  return false;
}

bool context::
identity (semantics::class_& c, semantics::data_member& m)
{
  if (explicit_identity (c))
    return m.get<bool> ("id", false);

  if (!c.count ("identity"))
    return false;

  strings const& ids (c.get<strings> ("identity"));
  return find (ids.begin (), ids.end (), m.name ()) != ids.end ();
}

context::data_members context::
identity_members (semantics::class_& c)
{
  data_members r;

  for (semantics::scope::names_iterator i (c.names_begin ());
       i != c.names_end (); ++i)
  {
    semantics::data_member* m (
      dynamic_cast<semantics::data_member*> (&i->named ()));

    if (m != 0 &&
        persistent (*m) &&
        !many_to_many (*m) &&
        identity (c, *m))
      r.push_back (m);
  }

  return r;
}

semantics::class_* context::
find_class (string const& name) const
{
  return unit.find<semantics::class_> (name);
}

context::strings context::
identity_types (semantics::class_& c)
{
  class_set s;
  return identity_types (c, s);
}

context::strings context::
identity_types (semantics::class_& c, class_set& s)
{
  if (!s.insert (&c).second)
    throw identity_cycle (c);

  data_members ids (identity_members (c));
  strings r;

  if (ids.empty ())
  {
    if (semantics::class_* b = c.base ())
      r = identity_types (*b, s);
  }

  for (data_members::iterator i (ids.begin ()); i != ids.end (); ++i)
  {
    semantics::data_member& m (**i);

    if (m.count ("sql-type"))
      r.push_back (m.get<string> ("sql-type"));
    else if (semantics::class_* rc = find_class (m.type ()))
    {
      strings t (identity_types (*rc, s));
      r.insert (r.end (), t.begin (), t.end ());
    }
    else
      r.push_back (m.type ());
  }

  s.erase (&c);
  return r;
}

context::strings context::
identity_columns (semantics::class_& c, bool inherited)
{
  class_set s;
  return identity_columns (c, inherited, s);
}

context::strings context::
identity_columns (semantics::class_& c, bool inherited, class_set& s)
{
  if (!s.insert (&c).second)
    throw identity_cycle (c);

  data_members ids (identity_members (c));
  strings r;

  if (ids.empty ())
  {
    semantics::class_* b (c.base ());

    if (inherited && b != 0)
      r = identity_columns (*b, true, s);
  }

  for (data_members::iterator i (ids.begin ()); i != ids.end (); ++i)
  {
    strings n (column_names (**i, s));
    r.insert (r.end (), n.begin (), n.end ());
  }

  s.erase (&c);
  return r;
}

context::strings context::
column_names (semantics::data_member& m)
{
  class_set s;
  return column_names (m, s);
}

context::strings context::
column_names (semantics::data_member& m, class_set& s)
{
  if (m.count ("column"))
    return m.get<strings> ("column");

  strings r;

  // A reference to a class with a composite identity gets one column
  // per identity column, prefixed with the member name.
  //
  if (!m.count ("sql-type"))
  {
    if (semantics::class_* rc = find_class (m.type ()))
    {
      strings ic (identity_columns (*rc, true, s));

      if (ic.size () > 1)
      {
        for (strings::iterator i (ic.begin ()); i != ic.end (); ++i)
          r.push_back (m.name () + "_" + *i);

        return r;
      }
    }
  }

  r.push_back (m.name ());
  return r;
}

string context::
upcase (string const& s)
{
  string r;
  string::size_type n (s.size ());

  r.reserve (n);

  for (string::size_type i (0); i < n; ++i)
    r.push_back (toupper (s[i]));

  return r;
}

void context::
diverge (streambuf* sb)
{
  data_->os_stack_.push (data_->os_.rdbuf ());
  data_->os_.rdbuf (sb);
}

void context::
restore ()
{
  data_->os_.rdbuf (data_->os_stack_.top ());
  data_->os_stack_.pop ();
}
