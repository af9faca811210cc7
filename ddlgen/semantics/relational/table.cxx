// file      : ddlgen/semantics/relational/table.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <ddlgen/semantics/relational/table.hxx>
#include <ddlgen/semantics/relational/primary-key.hxx>
#include <ddlgen/semantics/relational/key-generator.hxx>

namespace semantics
{
  namespace relational
  {
    // table
    //
    void table::
    add_edge_left (names& e)
    {
      scope::add_edge_left (e);

      if (primary_key* pk = dynamic_cast<primary_key*> (&e.nameable ()))
        pk_ = pk;
    }

    key_generator* table::
    key_generator_ () const
    {
      return uses_ != 0 ? &uses_->key_generator () : 0;
    }

    // type info
    //
    namespace
    {
      struct init
      {
        init ()
        {
          using compiler::type_info;

          type_info ti (typeid (table));
          ti.add_base (typeid (nameable));
          ti.add_base (typeid (scope));
          insert (ti);
        }
      } init_;
    }
  }
}
