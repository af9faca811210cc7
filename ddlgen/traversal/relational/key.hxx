// file      : ddlgen/traversal/relational/key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_KEY_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_KEY_HXX

#include <ddlgen/semantics/relational/key.hxx>
#include <ddlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    template <typename T>
    struct key_template: node<T>
    {
    public:
      virtual void
      traverse (T& k)
      {
        contains (k);
      }

      virtual void
      contains (T& k)
      {
        contains (k, *this);
      }

      virtual void
      contains (T& k, edge_dispatcher& d)
      {
        this->iterate_and_dispatch (k.contains_begin (), k.contains_end (), d);
      }
    };
  }
}

#endif // DDLGEN_TRAVERSAL_RELATIONAL_KEY_HXX
