// file      : ddlgen/semantics/relational/model.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_MODEL_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_MODEL_HXX

#include <ddlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    // Names tables in discovery order: tables for persistent classes
    // first, then junction tables.
    //
    class model: public graph<node, edge>, public scope
    {
    public:
      model ()
      {
      }

      virtual string
      kind () const
      {
        return "model";
      }

    private:
      model (model const&);
      model& operator= (model const&);
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_MODEL_HXX
