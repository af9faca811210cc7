// file      : ddlgen/validator.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_VALIDATOR_HXX
#define DDLGEN_VALIDATOR_HXX

#include <ddlgen/options.hxx>
#include <ddlgen/semantics/unit.hxx>

// Check the mapping for problems that can be diagnosed before the
// schema is built. All the problems are reported before failing.
//
class validator
{
public:
  class failed {};

  void
  validate (options const&, semantics::unit&, semantics::path const&);

  validator () {}

private:
  validator (validator const&);
  validator& operator= (validator const&);
};

#endif // DDLGEN_VALIDATOR_HXX
