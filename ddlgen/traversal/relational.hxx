// file      : ddlgen/traversal/relational.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_TRAVERSAL_RELATIONAL_HXX
#define DDLGEN_TRAVERSAL_RELATIONAL_HXX

#include <ddlgen/traversal/relational/column.hxx>
#include <ddlgen/traversal/relational/elements.hxx>
#include <ddlgen/traversal/relational/foreign-key.hxx>
#include <ddlgen/traversal/relational/index.hxx>
#include <ddlgen/traversal/relational/key.hxx>
#include <ddlgen/traversal/relational/model.hxx>
#include <ddlgen/traversal/relational/primary-key.hxx>
#include <ddlgen/traversal/relational/table.hxx>

#endif // DDLGEN_TRAVERSAL_RELATIONAL_HXX
