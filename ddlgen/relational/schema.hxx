// file      : ddlgen/relational/schema.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_SCHEMA_HXX
#define DDLGEN_RELATIONAL_SCHEMA_HXX

#include <set>
#include <string>

#include <ddlgen/emitter.hxx>
#include <ddlgen/relational/common.hxx>
#include <ddlgen/relational/context.hxx>

namespace relational
{
  namespace schema
  {
    typedef std::set<std::string> name_set;

    struct common: virtual context
    {
      typedef ::emitter emitter_type;

      common (emitter_type& e, ostream& os): e_ (e), os_ (os) {}

      void
      pre_statement ()
      {
        e_.pre ();
        diverge (os_);
      }

      void
      post_statement ()
      {
        restore ();
        e_.post ();
      }

      // Return true if the primary key consists of a single column with
      // database-generated values.
      //
      static bool
      auto_primary_key (sema_rel::primary_key& pk)
      {
        return pk.contains_size () == 1 &&
          auto_column (pk.contains_begin ()->column ());
      }

    protected:
      template <typename K>
      void
      key_columns (K& k)
      {
        for (typename K::contains_iterator i (k.contains_begin ());
             i != k.contains_end ();
             ++i)
        {
          if (i != k.contains_begin ())
            os << ", ";

          os << quote_id (i->column ().name ());
        }
      }

    protected:
      emitter_type& e_;
      ostream& os_;
    };

    //
    // Schema.
    //

    struct create_schema: trav_rel::model, common
    {
      typedef create_schema base;

      create_schema (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::model&)
      {
        string const& n (options.schema_name ());

        if (n.empty ())
          return;

        pre_statement ();
        create (n);
        post_statement ();
      }

      // By default there is no schema-level statement.
      //
      virtual void
      create (string const&)
      {
      }
    };

    //
    // Drop.
    //

    struct drop_table: trav_rel::table, common
    {
      typedef drop_table base;

      drop_table (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::table& t)
      {
        pre_statement ();
        drop (t);
        post_statement ();
      }

      virtual void
      drop (sema_rel::table& t)
      {
        os << "DROP TABLE IF EXISTS " << quote_id (t.name ()) << endl;
      }
    };

    //
    // Create.
    //

    struct create_column: trav_rel::column, common
    {
      typedef create_column base;

      create_column (common const& c, bool* first = 0)
          : common (c),
            first_ (first != 0 ? *first : first_data_),
            first_data_ (true)
      {
      }

      create_column (create_column const& c)
          : root_context (), // @@ -Wextra
            context (),
            common (c),
            first_ (&c.first_ != &c.first_data_ ? c.first_ : first_data_),
            first_data_ (c.first_data_)
      {
      }

      virtual void
      traverse (sema_rel::column& c)
      {
        if (first_)
          first_ = false;
        else
          os << ",";

        os << endl
           << "  ";
        create (c);
      }

      virtual void
      create (sema_rel::column& c)
      {
        bool a (auto_column (c));

        os << quote_id (c.name ()) << " ";
        type (c, a);
        null (c);

        if (a)
          auto_ (c);
      }

      virtual void
      type (sema_rel::column& c, bool /*auto*/)
      {
        os << c.type ();
      }

      virtual void
      null (sema_rel::column& c)
      {
        if (!c.null ())
          os << " NOT NULL";
      }

      virtual void
      auto_ (sema_rel::column&)
      {
      }

    protected:
      bool& first_;
      bool first_data_;
    };

    struct create_primary_key: trav_rel::primary_key, common
    {
      typedef create_primary_key base;

      create_primary_key (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::primary_key& pk)
      {
        if (pk.contains_empty ())
          return;

        sema_rel::table& t (dynamic_cast<sema_rel::table&> (pk.scope ()));

        pre_statement ();
        os << "ALTER TABLE " << quote_id (t.name ()) << endl
           << "  ADD CONSTRAINT ";
        create (pk);
        os << endl;
        post_statement ();
      }

      virtual void
      create (sema_rel::primary_key& pk)
      {
        os << quote_id (pk.name ()) << " PRIMARY KEY (";
        key_columns (pk);
        os << ")";
      }
    };

    struct create_foreign_key: trav_rel::foreign_key, common
    {
      typedef create_foreign_key base;

      create_foreign_key (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::foreign_key& fk)
      {
        sema_rel::table& t (dynamic_cast<sema_rel::table&> (fk.scope ()));

        pre_statement ();
        os << "ALTER TABLE " << quote_id (t.name ()) << endl
           << "  ADD CONSTRAINT ";
        create (fk);
        os << endl;
        post_statement ();
      }

      virtual void
      create (sema_rel::foreign_key& fk)
      {
        using sema_rel::foreign_key;

        os << quote_id (fk.name ()) << " FOREIGN KEY (";
        key_columns (fk);
        os << ")" << endl
           << "    REFERENCES " << quote_id (fk.referenced_table ()) << " (";

        foreign_key::columns const& refs (fk.referenced_columns ());

        for (foreign_key::columns::const_iterator i (refs.begin ());
             i != refs.end ();
             ++i)
        {
          if (i != refs.begin ())
            os << ", ";

          os << quote_id (*i);
        }

        os << ")";
      }
    };

    struct create_index: trav_rel::index, common
    {
      typedef create_index base;

      create_index (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::index& in)
      {
        pre_statement ();
        create (in);
        post_statement ();
      }

      virtual string
      table_name (sema_rel::index& in)
      {
        return quote_id (dynamic_cast<sema_rel::table&> (in.scope ()).name ());
      }

      virtual void
      create (sema_rel::index& in)
      {
        os << "CREATE ";

        if (!in.type ().empty ())
          os << in.type () << ' ';

        os << "INDEX " << quote_id (in.name ()) << endl
           << "  ON " << table_name (in) << " (";
        key_columns (in);
        os << ")" << endl;
      }
    };

    struct create_table: trav_rel::table, common
    {
      typedef create_table base;

      using trav_rel::table::names;

      create_table (common const& c): common (c) {}

      virtual void
      create_pre (sema_rel::table& t)
      {
        os << "CREATE TABLE " << quote_id (t.name ()) << " (";
      }

      // Table constraints that are declared inline, after the columns.
      //
      virtual void
      constraints (sema_rel::table&)
      {
      }

      virtual void
      create_post (sema_rel::table&)
      {
        os << endl
           << ")" << endl;
      }

      virtual void
      traverse (sema_rel::table& t)
      {
        pre_statement ();
        create_pre (t);

        instance<create_column> c (*this);
        trav_rel::names n (*c);
        names (t, n);

        constraints (t);

        create_post (t);
        post_statement ();
      }
    };

    // Database objects that produce the identity values of a table.
    //
    struct create_key_generator: trav_rel::table, common
    {
      typedef create_key_generator base;

      create_key_generator (common const& c): common (c) {}

      virtual void
      traverse (sema_rel::table& t)
      {
        if (sema_rel::key_generator* kg = t.key_generator_ ())
          create (t, *kg);
      }

      // By default the values are produced by the application or inline
      // in the column definition.
      //
      virtual void
      create (sema_rel::table&, sema_rel::key_generator&)
      {
      }

    protected:
      // Return true if this sequence has not been created yet. The same
      // sequence can be shared by several tables.
      //
      bool
      first_sequence (string const& name)
      {
        return sequences_.insert (name).second;
      }

    protected:
      name_set sequences_;
    };

    //
    // SQL output.
    //

    struct sql_emitter: emitter, virtual context
    {
      typedef sql_emitter base;

      virtual void
      pre ()
      {
        first_ = true;
      }

      virtual void
      line (const std::string& l)
      {
        if (first_ && !l.empty ())
          first_ = false;
        else
          os << endl;

        os << l;
      }

      virtual void
      post ()
      {
        if (!first_) // Ignore empty statements.
          os << ';' << endl
             << endl;
      }

    protected:
      bool first_;
    };

    struct sql_file: virtual context
    {
      typedef sql_file base;

      virtual void
      prologue ()
      {
      }

      virtual void
      epilogue ()
      {
      }
    };

    // Write the DDL script for the model in the current context.
    //
    void
    generate ();
  }
}

#endif // DDLGEN_RELATIONAL_SCHEMA_HXX
