// file      : ddlgen/generator.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_GENERATOR_HXX
#define DDLGEN_GENERATOR_HXX

#include <ostream>

#include <ddlgen/options.hxx>
#include <ddlgen/semantics/unit.hxx>

class generator
{
public:
  class failed {};

  // Build the schema for the mapping and write the DDL script to the
  // file derived from the input file name (or to stdout, if requested).
  //
  void
  generate (options const&, semantics::unit&, semantics::path const&);

  // Write the DDL script to the specified stream.
  //
  void
  generate (options const&, semantics::unit&, std::ostream&);

  generator () {}

private:
  generator (generator const&);
  generator& operator= (generator const&);
};

#endif // DDLGEN_GENERATOR_HXX
