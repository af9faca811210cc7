// file      : ddlgen/validator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <set>
#include <iostream>

#include <ddlgen/context.hxx>
#include <ddlgen/validator.hxx>
#include <ddlgen/diagnostics.hxx>

#include <ddlgen/relational/key-generator.hxx>

using namespace std;

namespace
{
  typedef set<string> name_set;

  struct class_: traversal::class_, context
  {
    class_ (bool& valid, name_set const& kgs, name_set const& tables)
        : valid_ (valid), kgs_ (kgs), tables_ (tables)
    {
    }

    virtual void
    traverse (type& c)
    {
      try
      {
        check (c);
      }
      catch (identity_cycle const& e)
      {
        error (c) << "identity of class '" << e.c.name () << "' refers "
                  << "back to the class through the types of its identity "
                  << "members" << endl;

        if (&e.c != &c)
          info (e.c) << "class '" << e.c.name () << "' is defined here"
                     << endl;

        valid_ = false;
      }
    }

    void
    check (type& c)
    {
      if (c.count ("key-generator"))
      {
        string const& n (c.get<string> ("key-generator"));

        if (kgs_.find (upcase (n)) == kgs_.end ())
        {
          error (c) << "class '" << c.name () << "' uses undeclared key "
                    << "generator '" << n << "'" << endl;
          info (c) << "declare it with the key-generator element or use "
                   << "one of the built-in strategies" << endl;
          valid_ = false;
        }
      }

      for (type::names_iterator i (c.names_begin ()); i != c.names_end (); ++i)
      {
        semantics::data_member* m (
          dynamic_cast<semantics::data_member*> (&i->named ()));

        if (m != 0 && persistent (*m) && many_to_many (*m))
        {
          string const& jt (m->get<string> ("many-table"));

          if (tables_.find (jt) != tables_.end ())
          {
            error (*m) << "many-to-many table '" << jt << "' of member '"
                       << m->name () << "' is the table of a persistent "
                       << "class" << endl;
            valid_ = false;
          }
        }
      }

      if (c.count ("index"))
        indexes (c);

      if (persistent (c) &&
          c.base () == 0 &&
          c.names_size () != 0 &&
          identity_members (c).empty ())
        warn (c) << "persistent class '" << c.name () << "' has no identity"
                 << endl;

      // Resolve the identity of the class and of every class it refers
      // to through its members.
      //
      for (type::names_iterator i (c.names_begin ()); i != c.names_end (); ++i)
      {
        semantics::data_member* m (
          dynamic_cast<semantics::data_member*> (&i->named ()));

        if (m != 0 && persistent (*m))
          column_names (*m);
      }

      identity_types (c);
    }

    void
    indexes (type& c)
    {
      semantics::indexes const& is (c.get<semantics::indexes> ("index"));

      for (semantics::indexes::const_iterator i (is.begin ());
           i != is.end (); ++i)
      {
        for (strings::const_iterator j (i->members.begin ());
             j != i->members.end (); ++j)
        {
          if (!declared (c, *j))
          {
            error (i->file, i->line, i->column)
              << "index in class '" << c.name () << "' refers to undeclared "
              << "member '" << *j << "'" << endl;
            valid_ = false;
          }
        }
      }
    }

    // A member of the class or of one of its bases. A column name of
    // such a member is accepted as well.
    //
    bool
    declared (type& c, string const& n)
    {
      for (type* x (&c); x != 0; x = x->base ())
      {
        if (x->find<semantics::data_member> (n) != 0)
          return true;

        for (type::names_iterator i (x->names_begin ());
             i != x->names_end (); ++i)
        {
          semantics::data_member* m (
            dynamic_cast<semantics::data_member*> (&i->named ()));

          if (m == 0 || !persistent (*m) || many_to_many (*m))
            continue;

          strings cs (column_names (*m));

          for (strings::iterator k (cs.begin ()); k != cs.end (); ++k)
            if (*k == n)
              return true;
        }
      }

      return false;
    }

    bool& valid_;
    name_set const& kgs_;
    name_set const& tables_;
  };
}

void validator::
validate (options const& ops, semantics::unit& u, semantics::path const&)
{
  bool valid (true);

  {
    auto_ptr<context> ctx (create_context (cerr, u, ops, 0));

    // Key generators that classes can refer to.
    //
    name_set kgs;
    kgs.insert ("HIGH-LOW");
    kgs.insert ("IDENTITY");
    kgs.insert ("MAX");
    kgs.insert ("SEQUENCE");
    kgs.insert ("UUID");

    for (semantics::unit::declares_iterator i (u.declares_begin ());
         i != u.declares_end (); ++i)
    {
      semantics::key_generator& kg (i->key_generator ());

      if (!relational::key_generator_registry::known_strategy (
            kg.strategy ()))
      {
        error (kg) << "key generator '" << kg.name () << "' uses unknown "
                   << "strategy '" << kg.strategy () << "'" << endl;
        info (kg) << "known strategies are HIGH-LOW, IDENTITY, MAX, "
                  << "SEQUENCE and UUID" << endl;
        valid = false;
      }
      else
        kgs.insert (context::upcase (kg.name ()));
    }

    name_set tables;

    for (semantics::scope::names_iterator i (u.names_begin ());
         i != u.names_end (); ++i)
    {
      semantics::class_* c (dynamic_cast<semantics::class_*> (&i->named ()));

      if (c != 0 && context::persistent (*c))
        tables.insert (context::table_name (*c));
    }

    traversal::unit unit;
    traversal::names unit_names;
    class_ c (valid, kgs, tables);

    unit >> unit_names >> c;
    unit.dispatch (u);
  }

  if (!valid)
    throw failed ();
}
