// file      : ddlgen/semantics/relational/primary-key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX

#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    class primary_key: public key
    {
    public:
      primary_key () {}

      virtual string
      kind () const
      {
        return "primary key";
      }
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_PRIMARY_KEY_HXX
