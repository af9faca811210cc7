// file      : ddlgen/semantics/key-generator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <ddlgen/semantics/key-generator.hxx>

namespace semantics
{
  // type info
  //
  namespace
  {
    struct init
    {
      init ()
      {
        using compiler::type_info;

        // declares
        //
        {
          type_info ti (typeid (declares));
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
