// file      : ddlgen/diagnostics.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_DIAGNOSTICS_HXX
#define DDLGEN_DIAGNOSTICS_HXX

#include <cstddef>
#include <iostream>

#include <cutl/fs/path.hxx>

namespace semantics
{
  class node;
}

using std::endl;

std::ostream&
error (cutl::fs::path const&, std::size_t line, std::size_t clmn);

std::ostream&
warn (cutl::fs::path const&, std::size_t line, std::size_t clmn);

std::ostream&
info (cutl::fs::path const&, std::size_t line, std::size_t clmn);

// Use the location of the mapping document element that produced
// the node.
//
std::ostream&
error (semantics::node const&);

std::ostream&
warn (semantics::node const&);

std::ostream&
info (semantics::node const&);

#endif // DDLGEN_DIAGNOSTICS_HXX
