// file      : ddlgen/semantics/relational.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_HXX

#include <ddlgen/semantics/relational/column.hxx>
#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/foreign-key.hxx>
#include <ddlgen/semantics/relational/index.hxx>
#include <ddlgen/semantics/relational/key.hxx>
#include <ddlgen/semantics/relational/key-generator.hxx>
#include <ddlgen/semantics/relational/model.hxx>
#include <ddlgen/semantics/relational/primary-key.hxx>
#include <ddlgen/semantics/relational/table.hxx>

#endif // DDLGEN_SEMANTICS_RELATIONAL_HXX
