// file      : ddlgen/semantics/relational/elements.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/column.hxx>
#include <ddlgen/semantics/relational/primary-key.hxx>

namespace semantics
{
  namespace relational
  {
    // scope
    //
    void scope::
    add_edge_left (names& e)
    {
      nameable& n (e.nameable ());
      names_map::iterator i (names_map_.find (e.name ()));

      if (i != names_map_.end ())
        throw duplicate_name (*this, (*i->second)->nameable (), n);

      names_list::iterator p;

      if (n.is_a<column> ())
        p = names_.insert (keys_, &e);
      else if (n.is_a<primary_key> ())
        keys_ = p = names_.insert (keys_, &e);
      else
      {
        p = names_.insert (names_.end (), &e);

        if (keys_ == names_.end ())
          keys_ = p;
      }

      names_map_[e.name ()] = p;
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

          // node
          //
          insert (type_info (typeid (node)));

          // edge
          //
          insert (type_info (typeid (edge)));

          // names
          //
          {
            type_info ti (typeid (names));
            ti.add_base (typeid (edge));
            insert (ti);
          }

          // nameable
          //
          {
            type_info ti (typeid (nameable));
            ti.add_base (typeid (node));
            insert (ti);
          }

          // scope
          //
          {
            type_info ti (typeid (scope));
            ti.add_base (typeid (node));
            insert (ti);
          }
        }
      } init_;
    }
  }
}
