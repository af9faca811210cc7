// file      : ddlgen/relational/schema.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <vector>

#include <ddlgen/version.hxx>
#include <ddlgen/relational/schema.hxx>
#include <ddlgen/relational/generate.hxx>

using namespace std;

namespace relational
{
  namespace schema
  {
    namespace
    {
      struct pass
      {
        pass (const char* k, trav_rel::table& t): kind (k), table (&t) {}

        const char* kind;
        trav_rel::table* table;
      };

      typedef vector<pass> passes;
      typedef vector<sema_rel::table*> tables;
    }

    void
    generate ()
    {
      context ctx;
      ostream& os (ctx.os);
      options const& ops (ctx.options);
      sema_rel::model& m (*ctx.model);

      instance<sql_file> file;
      instance<sql_emitter> em;
      emitter_ostream emos (*em);
      common c (*em, emos);

      if (!ops.omit_header ())
        os << "-- This file was generated by ddlgen " << DDLGEN_VERSION_STR
           << "." << endl
           << "-- database: " << ops.database () << endl
           << "-- mapping: " << ctx.unit.file () << endl
           << endl;

      file->prologue ();

      if (!ops.omit_schema ())
      {
        instance<create_schema> s (c);
        s->traverse (m);
      }

      // Statement kinds in the order they are generated.
      //
      instance<drop_table> dt (c);
      instance<create_table> ct (c);

      instance<create_primary_key> pk (c);
      trav_rel::table pk_table;
      trav_rel::names pk_names (*pk);
      pk_table >> pk_names;

      instance<create_foreign_key> fk (c);
      trav_rel::table fk_table;
      trav_rel::names fk_names (*fk);
      fk_table >> fk_names;

      instance<create_index> in (c);
      trav_rel::table in_table;
      trav_rel::names in_names (*in);
      in_table >> in_names;

      instance<create_key_generator> kg (c);

      passes ps;

      if (!ops.omit_drop ())
        ps.push_back (pass ("drop", *dt));

      if (!ops.omit_create ())
        ps.push_back (pass ("create", *ct));

      if (!ops.omit_primary_key ())
        ps.push_back (pass ("primary key", pk_table));

      if (!ops.omit_foreign_key ())
        ps.push_back (pass ("foreign key", fk_table));

      if (!ops.omit_index ())
        ps.push_back (pass ("index", in_table));

      if (!ops.omit_key_generator ())
        ps.push_back (pass ("key generator", *kg));

      tables ts;
      for (sema_rel::model::names_iterator i (m.names_begin ());
           i != m.names_end (); ++i)
      {
        if (sema_rel::table* t =
            dynamic_cast<sema_rel::table*> (&i->nameable ()))
          ts.push_back (t);
      }

      switch (ops.group_ddl_by ())
      {
      case ddl_group::table:
        {
          for (tables::iterator i (ts.begin ()); i != ts.end (); ++i)
          {
            if (ops.trace ())
              cerr << "generating statements for table '" << (*i)->name ()
                   << "'" << endl;

            for (passes::iterator j (ps.begin ()); j != ps.end (); ++j)
              j->table->traverse (**i);
          }
          break;
        }
      case ddl_group::type:
        {
          for (passes::iterator j (ps.begin ()); j != ps.end (); ++j)
          {
            if (ops.trace ())
              cerr << "generating " << j->kind << " statements" << endl;

            for (tables::iterator i (ts.begin ()); i != ts.end (); ++i)
              j->table->traverse (**i);
          }
          break;
        }
      }

      file->epilogue ();
    }
  }
}
