// file      : ddlgen/semantics/relational/table.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_TABLE_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_TABLE_HXX

#include <ddlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class uses;
    class primary_key;
    class key_generator;

    class table: public nameable, public scope
    {
    public:
      // The primary key is always present though it may have no
      // columns.
      //
      primary_key&
      primary_key_ () const
      {
        assert (pk_ != 0);
        return *pk_;
      }

      // Return 0 if this table has no key generator.
      //
      key_generator*
      key_generator_ () const;

      uses*
      used () const
      {
        return uses_;
      }

    public:
      table (): pk_ (0), uses_ (0) {}

      void
      add_edge_left (names&);

      void
      add_edge_left (uses& e)
      {
        assert (uses_ == 0);
        uses_ = &e;
      }

      using nameable::add_edge_right;

      virtual string
      kind () const {return "table";}

      // Resolve ambiguity.
      //
      using nameable::scope;

    private:
      primary_key* pk_;
      uses* uses_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_TABLE_HXX
