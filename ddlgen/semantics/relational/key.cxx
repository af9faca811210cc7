// file      : ddlgen/semantics/relational/key.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <ddlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    bool key::
    contains_column (column_type const& c) const
    {
      for (contains_iterator i (contains_begin ()); i != contains_end (); ++i)
      {
        if (&i->column () == &c)
          return true;
      }

      return false;
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

          // contains
          //
          {
            type_info ti (typeid (contains));
            ti.add_base (typeid (edge));
            insert (ti);
          }

          // key
          //
          {
            type_info ti (typeid (key));
            ti.add_base (typeid (nameable));
            insert (ti);
          }
        }
      } init_;
    }
  }
}
