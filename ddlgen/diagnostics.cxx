// file      : ddlgen/diagnostics.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/semantics/elements.hxx>
#include <ddlgen/diagnostics.hxx>

using namespace std;

std::ostream&
error (cutl::fs::path const& p, size_t line, size_t clmn)
{
  cerr << p << ':' << line << ':' << clmn << ": error: ";
  return cerr;
}

std::ostream&
warn (cutl::fs::path const& p, size_t line, size_t clmn)
{
  cerr << p << ':' << line << ':' << clmn << ": warning: ";
  return cerr;
}

std::ostream&
info (cutl::fs::path const& p, size_t line, size_t clmn)
{
  cerr << p << ':' << line << ':' << clmn << ": info: ";
  return cerr;
}

std::ostream&
error (semantics::node const& n)
{
  return error (n.file (), n.line (), n.column ());
}

std::ostream&
warn (semantics::node const& n)
{
  return warn (n.file (), n.line (), n.column ());
}

std::ostream&
info (semantics::node const& n)
{
  return info (n.file (), n.line (), n.column ());
}
