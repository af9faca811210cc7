// file      : ddlgen/relational/oracle/schema.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/relational/schema.hxx>

#include <ddlgen/relational/oracle/context.hxx>

using namespace std;

namespace relational
{
  namespace oracle
  {
    namespace schema
    {
      namespace relational = relational::schema;

      // Return true if the table's key generator is backed by a sequence.
      //
      static bool
      has_sequence (sema_rel::table& t)
      {
        sema_rel::key_generator* kg (t.key_generator_ ());

        return kg != 0 &&
          (kg->strategy () == "SEQUENCE" || kg->strategy () == "IDENTITY");
      }

      struct sql_emitter: relational::sql_emitter, context
      {
        sql_emitter (const base& x): base (x) {}

        virtual void
        line (const std::string& l)
        {
          // SQLPlus doesn't like empty line in the middle of a statement.
          //
          if (!l.empty ())
          {
            base::line (l);
            last_ = l;
          }
        }

        virtual void
        post ()
        {
          if (!first_) // Ignore empty statements.
          {
            if (last_ == "END;")
              os << endl
                 << '/' << endl
                 << endl;

            else
              os << ';' << endl
                 << endl;
          }
        }

      private:
        string last_;
      };
      entry<sql_emitter> sql_emitter_;

      //
      // File.
      //

      struct sql_file: relational::sql_file, context
      {
        sql_file (const base& x): base (x) {}

        virtual void
        prologue ()
        {
          // Quiet down SQLPlus and make sure it exits with an error
          // code if there is an error.
          //
          os << "SET FEEDBACK OFF;" << endl
             << "WHENEVER SQLERROR EXIT FAILURE;" << endl
             << "WHENEVER OSERROR EXIT FAILURE;" << endl
             << endl;
        }

        virtual void
        epilogue ()
        {
          os << "EXIT;" << endl;
        }
      };
      entry<sql_file> sql_file_;

      //
      // Drop.
      //

      struct drop_table: relational::drop_table, context
      {
        drop_table (base const& x): base (x) {}

        virtual void
        drop (sema_rel::table& t)
        {
          // Oracle has no IF EXISTS conditional for dropping objects so
          // we ignore the "table or view does not exist" and "sequence
          // does not exist" errors instead.
          //
          string qt (quote_id (t.name ()));

          os << "BEGIN" << endl
             << "  BEGIN" << endl
             << "    EXECUTE IMMEDIATE " <<
            quote_string ("DROP TABLE " + qt + " CASCADE CONSTRAINTS") <<
            ";" << endl
             << "  EXCEPTION" << endl
             << "    WHEN OTHERS THEN" << endl
             << "      IF SQLCODE != -942 THEN RAISE; END IF;" << endl
             << "  END;" << endl;

          if (has_sequence (t))
          {
            string qs (quote_id (sequence_name (t)));

            os << "  BEGIN" << endl
               << "    EXECUTE IMMEDIATE " <<
              quote_string ("DROP SEQUENCE " + qs) << ";" << endl
               << "  EXCEPTION" << endl
               << "    WHEN OTHERS THEN" << endl
               << "      IF SQLCODE != -2289 THEN RAISE; END IF;" << endl
               << "  END;" << endl;
          }

          os << "END;" << endl;
        }
      };
      entry<drop_table> drop_table_;

      //
      // Create.
      //

      struct create_key_generator: relational::create_key_generator, context
      {
        create_key_generator (base const& x): base (x) {}

        virtual void
        create (sema_rel::table& t, sema_rel::key_generator& kg)
        {
          if (!has_sequence (t))
            return;

          string n (sequence_name (t));

          if (first_sequence (n))
          {
            pre_statement ();
            os << "CREATE SEQUENCE " << quote_id (n) << endl
               << "  START WITH 1 INCREMENT BY 1" << endl;
            post_statement ();
          }

          // Emulate IDENTITY with a trigger that fills the primary key
          // column from the sequence.
          //
          sema_rel::primary_key& pk (t.primary_key_ ());

          if (kg.strategy () != "IDENTITY" || pk.contains_size () != 1)
            return;

          sema_rel::column& c (pk.contains_begin ()->column ());

          pre_statement ();
          os << "CREATE OR REPLACE TRIGGER " << quote_id (t.name () + "_trg")
             << endl
             << "  BEFORE INSERT ON " << quote_id (t.name ()) << endl
             << "  FOR EACH ROW" << endl
             << "BEGIN" << endl
             << "  SELECT " << quote_id (n) << ".NEXTVAL INTO :new." <<
            quote_id (c.name ()) << " FROM DUAL;" << endl
             << "END;" << endl;
          post_statement ();
        }
      };
      entry<create_key_generator> create_key_generator_;
    }
  }
}
