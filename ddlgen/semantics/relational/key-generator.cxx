// file      : ddlgen/semantics/relational/key-generator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <ddlgen/semantics/relational/key-generator.hxx>

namespace semantics
{
  namespace relational
  {
    string key_generator::
    parameter_value (string const& n, string const& dv) const
    {
      for (parameters_type::const_iterator i (parameters_.begin ());
           i != parameters_.end (); ++i)
      {
        if (i->first == n)
          return i->second;
      }

      return dv;
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

          // uses
          //
          {
            type_info ti (typeid (uses));
            ti.add_base (typeid (edge));
            insert (ti);
          }

          // key_generator
          //
          {
            type_info ti (typeid (key_generator));
            ti.add_base (typeid (node));
            insert (ti);
          }
        }
      } init_;
    }
  }
}
