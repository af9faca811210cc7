// file      : ddlgen/relational/model.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sstream>

#include <ddlgen/diagnostics.hxx>
#include <ddlgen/relational/model.hxx>

using namespace std;

namespace relational
{
  namespace model
  {
    static semantics::node&
    mapping_node (sema_rel::node& n)
    {
      return *n.get<semantics::node*> ("mapping-node");
    }

    // class_
    //
    void class_::
    traverse (type& c)
    {
      if (!persistent (c))
        return;

      if (options.trace ())
        cerr << "building table '" << table_name (c) << "' for "
             << (junction (c) ? "junction " : "") << "class '" << c.name ()
             << "'" << endl;

      create_table (c);
    }

    sema_rel::table& class_::
    create_table (type& c)
    {
      string const& tn (table_name (c));

      sema_rel::table& t (model_.new_node<sema_rel::table> ());
      t.set ("mapping-node", static_cast<semantics::node*> (&c));
      model_.new_edge<sema_rel::names> (model_, t, tn);

      sema_rel::primary_key& pk (model_.new_node<sema_rel::primary_key> ());
      pk.set ("mapping-node", static_cast<semantics::node*> (&c));
      model_.new_edge<sema_rel::names> (t, pk, "pk_" + tn);

      if (c.names_size () == 0)
        return t;

      sema_rel::key_generator* kg (find_key_generator (c));

      for (type::names_iterator i (c.names_begin ()); i != c.names_end (); ++i)
      {
        semantics::data_member* m (
          dynamic_cast<semantics::data_member*> (&i->named ()));

        if (m == 0 || !persistent (*m))
          continue;

        // A many-to-many member has no columns in this table even if it
        // names some; they belong to the junction table.
        //
        if (many_to_many (*m))
        {
          add_junction (c, *m);
          continue;
        }

        type* r (0);
        strings types (resolve_type (c, *m, r));
        columns cols (create_columns (t, c, *m, types, r, identity (c, *m)));

        if (r != 0)
          add_foreign_key (t, c, *m, *r, cols);
      }

      if (type* b = c.base ())
        extend (t, c, *b, kg);

      if (kg != 0)
        model_.new_edge<sema_rel::uses> (t, *kg);

      add_indexes (t, c);
      return t;
    }

    sema_rel::key_generator* class_::
    find_key_generator (type& c)
    {
      if (!c.count ("key-generator"))
        return 0;

      string const& n (c.get<string> ("key-generator"));
      sema_rel::key_generator* kg (registry_.find (n));

      if (kg == 0)
        throw structural_error (
          c, "class '" + c.name () + "' uses unknown key generator '" +
          n + "'");

      return kg;
    }

    context::strings class_::
    resolve_type (type& c, semantics::data_member& m, type*& r)
    {
      strings rs;

      // An explicit SQL type is never a class reference. Otherwise a
      // mapped class takes precedence over a SQL type of the same name.
      //
      if (m.count ("sql-type") == 0)
        r = find_class (m.type ());

      if (r == 0)
      {
        string t (database_type (sql_type (m)));

        if (t.empty ())
          throw type_not_found (
            c, m, "type '" + sql_type (m) + "' of member '" + m.name () +
            "' is neither a SQL type nor a mapped class");

        rs.push_back (t);
        return rs;
      }

      strings ts (identity_types (*r));

      for (strings::iterator i (ts.begin ()); i != ts.end (); ++i)
      {
        string dt (database_type (*i));

        if (dt.empty ())
          throw type_not_found (
            c, m, "identity type '" + *i + "' of class '" + r->name () +
            "' is not a SQL type", r);

        rs.push_back (dt);
      }

      return rs;
    }

    class_::columns class_::
    create_columns (sema_rel::table& t,
                    type& c,
                    semantics::data_member& m,
                    strings const& types,
                    type* r,
                    bool id)
    {
      strings names (column_names (m));

      if (r != 0 && names.size () != types.size ())
      {
        ostringstream os;
        os << "member '" << m.name () << "' has " << names.size ()
           << " column(s) while referenced class '" << r->name ()
           << "' has " << types.size () << " identity column(s)";

        throw type_not_found (c, m, os.str (), r);
      }

      columns cs;
      bool req (required (m));

      for (strings::size_type i (0); i < names.size (); ++i)
      {
        sema_rel::column& col (
          model_.new_node<sema_rel::column> (
            r != 0 ? types[i] : types[0], id, req));

        col.set ("mapping-node", static_cast<semantics::node*> (&m));
        model_.new_edge<sema_rel::names> (t, col, names[i]);

        if (id)
          model_.new_edge<sema_rel::contains> (t.primary_key_ (), col);

        cs.push_back (&col);
      }

      return cs;
    }

    void class_::
    add_foreign_key (sema_rel::table& t,
                     type& c,
                     semantics::data_member& m,
                     type& r,
                     columns const& cs)
    {
      if (!persistent (r))
        throw structural_error (
          m, "member '" + m.name () + "' refers to class '" + r.name () +
          "' which is not mapped to a table", &r);

      string const& rtn (table_name (r));
      sema_rel::table* rt (model_.find<sema_rel::table> (rtn));

      if (rt == 0)
        throw structural_error (
          m, "member '" + m.name () + "' refers to table '" + rtn +
          "' which is not yet built; class '" + r.name () + "' must be " +
          "declared before class '" + c.name () + "'", &r);

      strings refs;

      if (m.count ("many-key"))
      {
        refs = m.get<strings> ("many-key");

        for (strings::iterator i (refs.begin ()); i != refs.end (); ++i)
        {
          if (rt->find<sema_rel::column> (*i) == 0)
            throw structural_error (
              m, "column '" + *i + "' does not exist in table '" + rtn +
              "'", &r);
        }
      }
      else
      {
        sema_rel::primary_key& pk (rt->primary_key_ ());

        for (sema_rel::key::contains_iterator i (pk.contains_begin ());
             i != pk.contains_end (); ++i)
          refs.push_back (i->column ().name ());
      }

      if (refs.size () != cs.size ())
        throw structural_error (
          m, "number of columns of member '" + m.name () + "' does not " +
          "match the number of referenced columns in table '" + rtn + "'",
          &r);

      sema_rel::foreign_key& fk (
        model_.new_node<sema_rel::foreign_key> (rtn));

      fk.set ("mapping-node", static_cast<semantics::node*> (&m));
      model_.new_edge<sema_rel::names> (t, fk, t.name () + "_" + m.name ());

      for (columns::const_iterator i (cs.begin ()); i != cs.end (); ++i)
        model_.new_edge<sema_rel::contains> (fk, **i);

      fk.referenced_columns () = refs;
    }

    void class_::
    extend (sema_rel::table& t,
            type& c,
            type& b,
            sema_rel::key_generator*& kg)
    {
      // If the class declares its own identity, it must be compatible
      // with the base's.
      //
      if (!identity_members (c).empty ())
      {
        strings ct (identity_types (c)), bt (identity_types (b));

        if (bt.empty ())
          return;

        bool ok (ct.size () == bt.size ());

        for (strings::size_type i (0); ok && i < ct.size (); ++i)
        {
          string x (database_type (ct[i])), y (database_type (bt[i]));

          if (x.empty ())
            x = upcase (ct[i]);

          if (y.empty ())
            y = upcase (bt[i]);

          ok = (x == y);
        }

        if (!ok)
          throw structural_error (
            c, "identity of class '" + c.name () + "' does not match " +
            "identity of its base class '" + b.name () + "'", &b);

        return;
      }

      if (b.count ("key-generator"))
        kg = find_key_generator (b);

      for (type::names_iterator i (b.names_begin ()); i != b.names_end (); ++i)
      {
        semantics::data_member* m (
          dynamic_cast<semantics::data_member*> (&i->named ()));

        if (m == 0 ||
            !persistent (*m) ||
            many_to_many (*m) ||
            !identity (b, *m))
          continue;

        // The class may re-declare an inherited identity member as an
        // ordinary one. In this case its columns become identity
        // columns.
        //
        if (semantics::data_member* o =
            c.find<semantics::data_member> (m->name ()))
        {
          if (persistent (*o))
          {
            strings ns (column_names (*o));

            for (strings::iterator j (ns.begin ()); j != ns.end (); ++j)
            {
              sema_rel::column* col (t.find<sema_rel::column> (*j));

              if (col != 0 && !col->identity ())
              {
                col->identity (true);
                model_.new_edge<sema_rel::contains> (t.primary_key_ (), *col);
              }
            }

            continue;
          }
        }

        // Merged columns do not get foreign keys.
        //
        type* r (0);
        strings types (resolve_type (b, *m, r));
        create_columns (t, b, *m, types, r, true);
      }

      if (type* gb = b.base ())
        extend (t, b, *gb, kg);
    }

    void class_::
    add_indexes (sema_rel::table& t, type& c)
    {
      if (!c.count ("index"))
        return;

      semantics::indexes const& is (c.get<semantics::indexes> ("index"));

      for (semantics::indexes::const_iterator i (is.begin ());
           i != is.end (); ++i)
      {
        semantics::index const& in (*i);
        columns cs;

        for (strings::const_iterator j (in.members.begin ());
             j != in.members.end (); ++j)
        {
          // Either a member of this class or a column of its table, for
          // example an inherited identity column.
          //
          strings ns;

          if (semantics::data_member* m =
              c.find<semantics::data_member> (*j))
          {
            if (!persistent (*m) || many_to_many (*m))
              throw structural_error (
                *m, "member '" + *j + "' has no columns in table '" +
                t.name () + "' and cannot be indexed");

            ns = column_names (*m);
          }
          else
            ns.push_back (*j);

          for (strings::iterator k (ns.begin ()); k != ns.end (); ++k)
          {
            sema_rel::column* col (t.find<sema_rel::column> (*k));

            if (col == 0)
              throw structural_error (
                c, "index on table '" + t.name () + "' refers to unknown " +
                "member or column '" + *k + "'");

            cs.push_back (col);
          }
        }

        if (cs.empty ())
          throw structural_error (
            c, "index on table '" + t.name () + "' has no columns");

        string n (in.name.empty ()
                  ? t.name () + "_" + cs.front ()->name () + "_i"
                  : in.name);

        sema_rel::index& ix (
          model_.new_node<sema_rel::index> (
            in.unique ? string ("UNIQUE") : string ()));

        ix.set ("mapping-node", static_cast<semantics::node*> (&c));
        model_.new_edge<sema_rel::names> (t, ix, n);

        for (columns::iterator k (cs.begin ()); k != cs.end (); ++k)
          model_.new_edge<sema_rel::contains> (ix, **k);
      }
    }

    void class_::
    add_junction (type& c, semantics::data_member& m)
    {
      string const& jt (m.get<string> ("many-table"));
      type* r (find_class (m.type ()));

      if (r == 0)
        throw type_not_found (
          c, m, "type '" + m.type () + "' of many-to-many member '" +
          m.name () + "' is not a mapped class");

      if (!persistent (*r))
        throw structural_error (
          m, "many-to-many member '" + m.name () + "' refers to class '" +
          r->name () + "' which is not mapped to a table", r);

      type* j (junctions_.find (jt));

      if (j == 0)
      {
        semantics::unit& g (junctions_.graph ());

        j = &g.new_node<type> (m.file (), m.line (), m.column ());
        g.new_edge<semantics::names> (g, *j, jt);

        j->set ("table", jt);
        j->set ("junction", true);

        if (c.count ("key-generator"))
          j->set ("key-generator", c.get<string> ("key-generator"));

        junctions_.insert (jt, *j);

        if (options.trace ())
          cerr << "queued junction table '" << jt << "'" << endl;
      }

      strings ocs (m.count ("many-key") ? m.get<strings> ("many-key")
                                         : strings ());
      strings tcs (m.count ("column") ? m.get<strings> ("column")
                                       : strings ());

      string const& on (table_name (c));
      string tn (table_name (*r));

      // In a relation of a class with itself both sides refer to the
      // same table. If the target columns are named, the target side is
      // named after them so that the table can hold a pair.
      //
      if (tn == on && !tcs.empty ())
      {
        tn.clear ();

        for (strings::iterator i (tcs.begin ()); i != tcs.end (); ++i)
          tn += (tn.empty () ? "" : "_") + *i;
      }

      add_junction_side (*j, m, on, c.name (), ocs);
      add_junction_side (*j, m, tn, r->name (), tcs);
    }

    void class_::
    add_junction_side (type& j,
                       semantics::data_member& m,
                       string const& name,
                       string const& class_name,
                       strings const& cols)
    {
      // Declared on both classes of the relation or a relation of a class
      // with itself.
      //
      if (j.find<semantics::data_member> (name) != 0)
        return;

      semantics::unit& g (junctions_.graph ());
      semantics::data_member& s (
        g.new_node<semantics::data_member> (
          m.file (), m.line (), m.column (), class_name));

      s.set ("sql", true);
      s.set ("id", true);
      s.set ("required", true);

      if (!cols.empty ())
        s.set ("column", cols);

      g.new_edge<semantics::names> (j, s, name);
    }

    void
    build (sema_rel::model& m)
    {
      context ctx;
      key_generator_registry kgr (m);

      for (semantics::unit::declares_iterator i (ctx.unit.declares_begin ());
           i != ctx.unit.declares_end (); ++i)
      {
        semantics::key_generator& kg (i->key_generator ());

        if (!kgr.insert (kg))
          throw structural_error (
            kg, "key generator '" + kg.name () + "' uses unknown " +
            "strategy '" + kg.strategy () + "'");
      }

      // Junction classes are synthesized in a graph of their own that
      // lives as long as the model refers to it. The mapping document
      // is not modified.
      //
      cutl::shared_ptr<semantics::unit> jg (
        new (shared) semantics::unit (ctx.unit.file ()));
      m.set ("junction-graph", jg);

      junctions js (*jg);

      traversal::unit unit;
      traversal::names unit_names;
      instance<class_> c (m, kgr, js);

      unit >> unit_names >> c;

      try
      {
        unit.dispatch (ctx.unit);

        // Junction tables go after all the class tables.
        //
        for (junctions::iterator i (js.begin ()); i != js.end (); ++i)
          c->traverse (**i);
      }
      catch (identity_cycle const& e)
      {
        throw structural_error (
          e.c, "identity of class '" + e.c.name () + "' refers back to " +
          "the class through the types of its identity members");
      }
    }

    cutl::shared_ptr<sema_rel::model>
    generate ()
    {
      cutl::shared_ptr<sema_rel::model> m (new (shared) sema_rel::model);

      try
      {
        build (*m);
      }
      catch (type_not_found const& e)
      {
        error (e.m) << e.description << endl;
        info (e.c) << "in class '" << e.c.name () << "'" << endl;

        if (e.related != 0)
          info (*e.related) << "class '" << e.related->name ()
                            << "' is defined here" << endl;

        throw operation_failed ();
      }
      catch (structural_error const& e)
      {
        error (e.node) << e.description << endl;

        if (e.related != 0)
          info (*e.related) << "class '" << e.related->name ()
                            << "' is defined here" << endl;

        throw operation_failed ();
      }
      catch (sema_rel::duplicate_name const& e)
      {
        semantics::node& o (mapping_node (e.orig));
        semantics::node& d (mapping_node (e.dup));

        error (d) << e.dup.kind () << " name '" << e.name << "' conflicts "
                  << "with an already defined " << e.orig.kind () << " name"
                  << endl;

        info (o) << "conflicting " << e.orig.kind () << " is defined here"
                 << endl;

        error (d) << "use the table or column mapping to change one of "
                  << "the names" << endl;

        throw operation_failed ();
      }

      return m;
    }
  }
}
