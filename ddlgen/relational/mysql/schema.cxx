// file      : ddlgen/relational/mysql/schema.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/relational/schema.hxx>

#include <ddlgen/relational/mysql/context.hxx>

using namespace std;

namespace relational
{
  namespace mysql
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
          os << "CREATE DATABASE IF NOT EXISTS " << quote_id (n) << endl;
        }
      };
      entry<create_schema> create_schema_;

      //
      // Create.
      //

      struct create_column: relational::create_column, context
      {
        create_column (base const& x): base (x) {}

        // MySQL requires an AUTO_INCREMENT column to be a key so the
        // primary key is declared inline.
        //
        virtual void
        auto_ (sema_rel::column&)
        {
          os << " AUTO_INCREMENT PRIMARY KEY";
        }
      };
      entry<create_column> create_column_;

      struct create_primary_key: relational::create_primary_key, context
      {
        create_primary_key (base const& x): base (x) {}

        virtual void
        traverse (sema_rel::primary_key& pk)
        {
          if (!auto_primary_key (pk))
            base::traverse (pk);
        }
      };
      entry<create_primary_key> create_primary_key_;

      struct create_table: relational::create_table, context
      {
        create_table (base const& x): base (x) {}

        virtual void
        create_post (sema_rel::table&)
        {
          os << endl
             << ")";

          string const& engine (options.mysql_engine ());

          if (!engine.empty ())
            os << endl
               << " ENGINE=" << engine;

          os << endl;
        }
      };
      entry<create_table> create_table_;
    }
  }
}
