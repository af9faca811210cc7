// file      : ddlgen/relational/pgsql/schema.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/relational/schema.hxx>

#include <ddlgen/relational/pgsql/context.hxx>

using namespace std;

namespace relational
{
  namespace pgsql
  {
    namespace schema
    {
      namespace relational = relational::schema;

      //
      // Schema.
      //

      struct create_schema: relational::create_schema, context
      {
        create_schema (base const& x): base (x) {}

        virtual void
        create (string const& n)
        {
          os << "CREATE SCHEMA " << quote_id (n) << endl;
        }
      };
      entry<create_schema> create_schema_;

      //
      // Drop.
      //

      struct drop_table: relational::drop_table, context
      {
        drop_table (base const& x): base (x) {}

        virtual void
        traverse (sema_rel::table& t)
        {
          // For PostgreSQL we use the CASCADE clause to drop foreign keys.
          //
          pre_statement ();
          os << "DROP TABLE IF EXISTS " << quote_id (t.name ()) << " CASCADE"
             << endl;
          post_statement ();

          sema_rel::key_generator* kg (t.key_generator_ ());

          if (kg != 0 && kg->strategy () == "SEQUENCE")
          {
            pre_statement ();
            os << "DROP SEQUENCE IF EXISTS " << quote_id (sequence_name (t))
               << endl;
            post_statement ();
          }
        }
      };
      entry<drop_table> drop_table_;

      //
      // Create.
      //

      struct create_column: relational::create_column, context
      {
        create_column (base const& x): base (x) {}

        virtual void
        type (sema_rel::column& c, bool auto_)
        {
          if (auto_ && c.type () == "INTEGER")
            os << "SERIAL";
          else if (auto_ && c.type () == "BIGINT")
            os << "BIGSERIAL";
          else
            base::type (c, auto_);
        }
      };
      entry<create_column> create_column_;

      struct create_key_generator: relational::create_key_generator, context
      {
        create_key_generator (base const& x): base (x) {}

        virtual void
        create (sema_rel::table& t, sema_rel::key_generator& kg)
        {
          // IDENTITY is handled with SERIAL columns.
          //
          if (kg.strategy () != "SEQUENCE")
            return;

          string n (sequence_name (t));

          if (!first_sequence (n))
            return;

          pre_statement ();
          os << "CREATE SEQUENCE " << quote_id (n) << endl;
          post_statement ();
        }
      };
      entry<create_key_generator> create_key_generator_;
    }
  }
}
