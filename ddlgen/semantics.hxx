// file      : ddlgen/semantics.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_HXX
#define DDLGEN_SEMANTICS_HXX

#include <ddlgen/semantics/elements.hxx>
#include <ddlgen/semantics/class.hxx>
#include <ddlgen/semantics/key-generator.hxx>
#include <ddlgen/semantics/unit.hxx>

#endif // DDLGEN_SEMANTICS_HXX
