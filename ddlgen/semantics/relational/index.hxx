// file      : ddlgen/semantics/relational/index.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_INDEX_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_INDEX_HXX

#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    // Note that in our model indexes are defined in the table scope.
    //
    class index: public key
    {
    public:
      index (string const& t = string ()): type_ (t) {}

      string const&
      type () const
      {
        return type_;
      }

      virtual string
      kind () const
      {
        return "index";
      }

    private:
      string type_; // E.g., "UNIQUE", etc.
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_INDEX_HXX
