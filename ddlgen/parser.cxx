// file      : ddlgen/parser.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <set>
#include <fstream>
#include <sstream>
#include <iostream>

#include <cutl/xml/parser.hxx>

#include <ddlgen/parser.hxx>
#include <ddlgen/diagnostics.hxx>

using namespace std;
using namespace semantics;

using cutl::xml::parsing;

typedef cutl::xml::parser xml_parser;

parser::
parser (options const& ops)
    : ops_ (ops),
      trace (ops.trace ()),
      unit_ (0),
      error_ (0)
{
}

auto_ptr<unit> parser::
parse (path const& file)
{
  ifstream ifs (file.string ().c_str ());

  if (!ifs.is_open ())
  {
    cerr << file << ": error: unable to open in read mode" << endl;
    throw failed ();
  }

  return parse (ifs, file);
}

auto_ptr<unit> parser::
parse (istream& is, path const& file)
{
  auto_ptr<unit> u (new unit (file));
  unit_ = u.get ();
  xmlns_.clear ();
  error_ = 0;
  extends_.clear ();

  try
  {
    is.exceptions (istream::badbit | istream::failbit);

    xml_parser p (is, file.string ());
    parse_mapping (p);
  }
  catch (parsing const& e)
  {
    cerr << e.what () << endl;
    throw failed ();
  }
  catch (ios_base::failure const&)
  {
    cerr << file << ": error: read failure" << endl;
    throw failed ();
  }

  resolve_extends ();

  if (error_ != 0)
    throw failed ();

  return u;
}

void parser::
parse_mapping (xml_parser& p)
{
  p.next_expect (xml_parser::start_element);

  if (p.name () != "mapping")
    throw parsing (p, "expected root element 'mapping' instead of '" +
                   p.name () + "'");

  // Castor mapping documents are normally unqualified but we accept
  // a namespace as long as all the elements use it.
  //
  xmlns_ = p.namespace_ ();
  p.content (xml_parser::complex);

  for (xml_parser::event_type e (p.next ());
       e == xml_parser::start_element;
       e = p.next ())
  {
    expect_namespace (p);
    string n (p.name ());

    if (n == "description")
      skip (p);
    else if (n == "key-generator")
      parse_key_generator (p);
    else if (n == "class")
      parse_class (p);
    else
      throw parsing (p, "unexpected element '" + n + "' in 'mapping'");
  }

  p.next_expect (xml_parser::eof);
}

void parser::
parse_key_generator (xml_parser& p)
{
  size_t l (p.line ()), c (p.column ());

  string name (p.attribute ("name"));
  string alias (p.attribute ("alias", name));

  p.content (xml_parser::complex);

  key_generator& kg (
    unit_->new_node<key_generator> (unit_->file (), l, c, alias, name));
  unit_->new_edge<declares> (*unit_, kg);

  for (xml_parser::event_type e (p.next ());
       e == xml_parser::start_element;
       e = p.next ())
  {
    expect_namespace (p);

    if (p.name () != "param")
      throw parsing (p, "unexpected element '" + p.name () + "' in "
                     "'key-generator'");

    string pn (p.attribute ("name"));
    string pv (p.attribute ("value"));
    p.content (xml_parser::empty);

    kg.parameter_add (pn, pv);
    p.next_expect (xml_parser::end_element);
  }

  if (trace)
    cerr << "declared key generator '" << alias << "' (" << name << ")"
         << endl;
}

void parser::
parse_class (xml_parser& p)
{
  size_t l (p.line ()), cl (p.column ());

  string name (p.attribute ("name"));

  class_& c (unit_->new_node<class_> (unit_->file (), l, cl));
  bool dup (false);

  if (class_* o = unit_->find<class_> (name))
  {
    error (c) << "class '" << name << "' is already declared" << endl;
    info (*o) << "previous declaration is here" << endl;
    error_++;
    dup = true;
  }
  else
    unit_->new_edge<names> (*unit_, c, name);

  if (p.attribute_present ("identity"))
    c.set ("identity", split (p.attribute ("identity")));

  if (p.attribute_present ("key-generator"))
    c.set ("key-generator", p.attribute ("key-generator"));

  if (p.attribute_present ("extends"))
  {
    string b (p.attribute ("extends"));

    if (!dup)
      extends_.push_back (make_pair (&c, b));
  }

  p.content (xml_parser::complex);

  for (xml_parser::event_type e (p.next ());
       e == xml_parser::start_element;
       e = p.next ())
  {
    expect_namespace (p);
    string n (p.name ());

    if (n == "description")
      skip (p);
    else if (n == "map-to")
      parse_map_to (p, c);
    else if (n == "field")
      parse_field (p, c);
    else if (n == "index")
      parse_index (p, c);
    else
      throw parsing (p, "unexpected element '" + n + "' in 'class'");
  }

  if (trace)
    cerr << "declared class '" << name << "'" << endl;
}

void parser::
parse_map_to (xml_parser& p, class_& c)
{
  if (c.count ("table"))
    throw parsing (p, "multiple 'map-to' elements in class");

  c.set ("table", p.attribute ("table"));

  p.content (xml_parser::empty);
  p.next_expect (xml_parser::end_element);
}

void parser::
parse_field (xml_parser& p, class_& c)
{
  size_t l (p.line ()), cl (p.column ());

  string name (p.attribute ("name"));
  string type (p.attribute ("type", string ()));

  // Only affects the object side of the mapping.
  //
  p.attribute ("collection", string ());

  if (p.attribute ("transient", false))
  {
    skip (p);
    return;
  }

  data_member& m (unit_->new_node<data_member> (unit_->file (), l, cl, type));

  if (data_member* o = c.find<data_member> (name))
  {
    error (m) << "field '" << name << "' is already declared" << endl;
    info (*o) << "previous declaration is here" << endl;
    error_++;
  }
  else
    unit_->new_edge<names> (c, m, name);

  if (p.attribute ("identity", false))
    m.set ("id", true);

  if (p.attribute ("required", false))
    m.set ("required", true);

  p.content (xml_parser::complex);

  for (xml_parser::event_type e (p.next ());
       e == xml_parser::start_element;
       e = p.next ())
  {
    expect_namespace (p);
    string n (p.name ());

    if (n == "description")
      skip (p);
    else if (n == "sql")
    {
      if (m.count ("sql"))
        throw parsing (p, "multiple 'sql' elements in field");

      parse_sql (p, m);
    }
    else
      throw parsing (p, "unexpected element '" + n + "' in 'field'");
  }

  if (type.empty () && !m.count ("sql-type"))
  {
    error (m) << "field '" << name << "' has no type" << endl;
    error_++;
  }
}

void parser::
parse_sql (xml_parser& p, data_member& m)
{
  m.set ("sql", true);

  if (p.attribute_present ("name"))
  {
    strings n (split (p.attribute ("name")));

    if (n.empty ())
      throw parsing (p, "empty column name list");

    m.set ("column", n);
  }

  if (p.attribute_present ("type"))
    m.set ("sql-type", p.attribute ("type"));

  if (p.attribute_present ("many-table"))
    m.set ("many-table", p.attribute ("many-table"));

  if (p.attribute_present ("many-key"))
    m.set ("many-key", split (p.attribute ("many-key")));

  p.content (xml_parser::empty);
  p.next_expect (xml_parser::end_element);
}

void parser::
parse_index (xml_parser& p, class_& c)
{
  semantics::index in;
  in.file = unit_->file ();
  in.line = p.line ();
  in.column = p.column ();
  in.name = p.attribute ("name", string ());
  in.unique = p.attribute ("unique", false);
  in.members = split (p.attribute ("columns"));

  if (in.members.empty ())
    throw parsing (p, "index has no columns");

  p.content (xml_parser::empty);
  p.next_expect (xml_parser::end_element);

  if (!c.count ("index"))
    c.set ("index", indexes ());

  c.get<indexes> ("index").push_back (in);
}

void parser::
skip (xml_parser& p)
{
  p.attribute_map (); // Mark all the attributes as handled.
  p.content (xml_parser::mixed);

  for (size_t d (1); d != 0;)
  {
    switch (p.next ())
    {
    case xml_parser::start_element:
      {
        p.attribute_map ();
        p.content (xml_parser::mixed);
        d++;
        break;
      }
    case xml_parser::end_element:
      {
        d--;
        break;
      }
    default:
      break;
    }
  }
}

void parser::
expect_namespace (xml_parser& p)
{
  if (p.namespace_ () != xmlns_)
    throw parsing (p, "element '" + p.name () + "' is in unexpected "
                   "namespace '" + p.namespace_ () + "'");
}

void parser::
resolve_extends ()
{
  for (extends::iterator i (extends_.begin ()); i != extends_.end (); ++i)
  {
    class_& c (*i->first);
    class_* b (unit_->find<class_> (i->second));

    if (b == 0)
    {
      error (c) << "base class '" << i->second << "' is not declared"
                << endl;
      error_++;
      continue;
    }

    unit_->new_edge<inherits> (c, *b);
  }

  // Detect inheritance cycles. Report each class that is part of a cycle
  // once.
  //
  set<class_*> reported;

  for (extends::iterator i (extends_.begin ()); i != extends_.end (); ++i)
  {
    class_& c (*i->first);

    if (reported.count (&c) != 0)
      continue;

    set<class_*> seen;
    seen.insert (&c);

    for (class_* b (c.base ()); b != 0; b = b->base ())
    {
      if (b == &c)
      {
        error (c) << "class '" << c.name () << "' is a base of itself "
                  << "through inheritance cycle" << endl;
        error_++;

        for (class_* x (c.base ()); x != &c; x = x->base ())
          reported.insert (x);

        reported.insert (&c);
        break;
      }

      // A cycle further up the hierarchy is reported for its own
      // classes.
      //
      if (!seen.insert (b).second)
        break;
    }
  }
}

parser::strings parser::
split (string const& s)
{
  strings r;
  istringstream is (s);

  for (string n; is >> n;)
    r.push_back (n);

  return r;
}
