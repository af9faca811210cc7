// file      : tests/helpers.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sstream>
#include <iostream>
#include <stdexcept>

#include <ddlgen/parser.hxx>
#include <ddlgen/context.hxx>
#include <ddlgen/generator.hxx>

#include <ddlgen/relational/model.hxx>

#include "helpers.hxx"

using namespace std;
using semantics::strings;

namespace sema_rel = semantics::relational;

options
make_options (strings const& args)
{
  vector<char*> argv;
  argv.push_back (const_cast<char*> ("ddlgen"));

  for (strings::const_iterator i (args.begin ()); i != args.end (); ++i)
    argv.push_back (const_cast<char*> (i->c_str ()));

  argv.push_back (0);

  int argc (static_cast<int> (argv.size () - 1));
  cli::argv_scanner s (argc, &argv[0]);
  return options (s);
}

options
make_options (string const& db,
              char const* a1,
              char const* a2,
              char const* a3,
              char const* a4)
{
  strings args;
  args.push_back ("--database");
  args.push_back (db);

  char const* const as[] = {a1, a2, a3, a4};

  for (size_t i (0); i < sizeof (as) / sizeof (as[0]) && as[i] != 0; ++i)
    args.push_back (as[i]);

  return make_options (args);
}

auto_ptr<semantics::unit>
load (string const& xml, options const& ops)
{
  istringstream is (xml);
  parser p (ops);
  return p.parse (is, semantics::path ("test.xml"));
}

cutl::shared_ptr<sema_rel::model>
build (semantics::unit& u, options const& ops)
{
  auto_ptr<context> ctx (create_context (cerr, u, ops, 0));
  cutl::shared_ptr<sema_rel::model> m (new (cutl::shared) sema_rel::model);
  relational::model::build (*m);
  return m;
}

string
emit (string const& xml, options const& ops)
{
  auto_ptr<semantics::unit> u (load (xml, ops));

  ostringstream os;
  generator g;
  g.generate (ops, *u, os);
  return os.str ();
}

sema_rel::table&
table (sema_rel::model& m, string const& name)
{
  sema_rel::table* t (m.find<sema_rel::table> (name));

  if (t == 0)
    throw runtime_error ("no table '" + name + "' in model");

  return *t;
}

strings
table_names (sema_rel::model& m)
{
  strings r;

  for (sema_rel::model::names_iterator i (m.names_begin ());
       i != m.names_end (); ++i)
  {
    if (dynamic_cast<sema_rel::table*> (&i->nameable ()) != 0)
      r.push_back (i->name ());
  }

  return r;
}

strings
column_names (sema_rel::table& t)
{
  strings r;

  for (sema_rel::table::names_iterator i (t.names_begin ());
       i != t.names_end (); ++i)
  {
    if (dynamic_cast<sema_rel::column*> (&i->nameable ()) != 0)
      r.push_back (i->name ());
  }

  return r;
}

strings
key_columns (sema_rel::key& k)
{
  strings r;

  for (sema_rel::key::contains_iterator i (k.contains_begin ());
       i != k.contains_end (); ++i)
    r.push_back (i->column ().name ());

  return r;
}

size_t
count (string const& text, string const& s)
{
  size_t r (0);

  for (string::size_type p (text.find (s)); p != string::npos;
       p = text.find (s, p + s.size ()))
    ++r;

  return r;
}
