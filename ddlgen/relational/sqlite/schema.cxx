// file      : ddlgen/relational/sqlite/schema.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/relational/schema.hxx>

#include <ddlgen/relational/sqlite/context.hxx>

namespace relational
{
  namespace sqlite
  {
    namespace schema
    {
      namespace relational = relational::schema;

      //
      // Create.
      //

      struct create_column: relational::create_column, context
      {
        create_column (base const& x): base (x) {}

        virtual void
        auto_ (sema_rel::column&)
        {
          os << " PRIMARY KEY AUTOINCREMENT";
        }
      };
      entry<create_column> create_column_;

      // SQLite cannot add constraints to an existing table so primary
      // and foreign keys are declared in CREATE TABLE.
      //
      struct create_primary_key: relational::create_primary_key, context
      {
        create_primary_key (base const& x): base (x) {}

        virtual void
        traverse (sema_rel::primary_key&)
        {
        }
      };
      entry<create_primary_key> create_primary_key_;

      struct create_foreign_key: relational::create_foreign_key, context
      {
        create_foreign_key (base const& x): base (x) {}

        virtual void
        traverse (sema_rel::foreign_key&)
        {
        }
      };
      entry<create_foreign_key> create_foreign_key_;

      struct create_table: relational::create_table, context
      {
        create_table (base const& x): base (x) {}

        virtual void
        constraints (sema_rel::table& t)
        {
          sema_rel::primary_key& pk (t.primary_key_ ());

          // An AUTOINCREMENT column is already the primary key.
          //
          if (!pk.contains_empty () && !auto_primary_key (pk))
          {
            instance<relational::create_primary_key> cpk (*this);

            os << "," << endl
               << "  CONSTRAINT ";
            cpk->create (pk);
          }

          instance<relational::create_foreign_key> cfk (*this);

          for (sema_rel::table::names_iterator i (t.names_begin ());
               i != t.names_end (); ++i)
          {
            if (sema_rel::foreign_key* fk =
                dynamic_cast<sema_rel::foreign_key*> (&i->nameable ()))
            {
              os << "," << endl
                 << "  CONSTRAINT ";
              cfk->create (*fk);
            }
          }
        }
      };
      entry<create_table> create_table_;
    }
  }
}
