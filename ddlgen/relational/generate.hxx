// file      : ddlgen/relational/generate.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_GENERATE_HXX
#define DDLGEN_RELATIONAL_GENERATE_HXX

#include <cutl/shared-ptr.hxx>

#include <ddlgen/context.hxx>
#include <ddlgen/semantics/relational/model.hxx>

namespace relational
{
  namespace model
  {
    cutl::shared_ptr<semantics::relational::model>
    generate ();
  }

  namespace schema
  {
    void
    generate ();
  }
}

#endif // DDLGEN_RELATIONAL_GENERATE_HXX
