// file      : ddlgen/semantics/relational/column.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX

#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/table.hxx>

namespace semantics
{
  namespace relational
  {
    class contains;
    class key_generator;

    class column: public nameable
    {
    public:
      // Database type as it appears in DDL, for example VARCHAR(32).
      //
      string const&
      type () const {return type_;}

      bool
      identity () const {return identity_;}

      void
      identity (bool i) {identity_ = i;}

      bool
      required () const {return required_;}

      // Identity columns are never NULL.
      //
      bool
      null () const {return !(identity_ || required_);}

    public:
      typedef relational::table table_type;

      table_type&
      table () const
      {
        return dynamic_cast<table_type&> (scope ());
      }

      // Key generator of the owning table, if any.
      //
      key_generator*
      key_generator_ () const
      {
        return table ().key_generator_ ();
      }

    public:
      column (string const& type, bool identity, bool required)
          : type_ (type),
            identity_ (identity),
            required_ (required)
      {
      }

      void
      add_edge_right (contains&)
      {
      }

      using nameable::add_edge_right;

      virtual string
      kind () const
      {
        return "column";
      }

    private:
      string type_;
      bool identity_;
      bool required_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_COLUMN_HXX
