// file      : tests/helpers.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef TESTS_HELPERS_HXX
#define TESTS_HELPERS_HXX

#include <memory>  // std::auto_ptr
#include <string>
#include <vector>

#include <cutl/shared-ptr.hxx>

#include <ddlgen/options.hxx>
#include <ddlgen/semantics.hxx>
#include <ddlgen/semantics/relational.hxx>

// Parse the command line arguments (without the program name).
//
options
make_options (semantics::strings const& args);

// Same as above for the common case of a database and a few flags.
//
options
make_options (std::string const& db,
              char const* a1 = 0,
              char const* a2 = 0,
              char const* a3 = 0,
              char const* a4 = 0);

// Load the mapping document from a string. The file name only appears
// in diagnostics.
//
std::auto_ptr<semantics::unit>
load (std::string const& xml, options const&);

// Build the relational model in the database-specific context, the
// same way the generator does. Exceptions thrown by the builder are
// propagated.
//
cutl::shared_ptr<semantics::relational::model>
build (semantics::unit&, options const&);

// Load the mapping and return the generated DDL script.
//
std::string
emit (std::string const& xml, options const&);

// Model lookup helpers.
//
semantics::relational::table&
table (semantics::relational::model&, std::string const& name);

// Table names in model order.
//
semantics::strings
table_names (semantics::relational::model&);

// Column names in table order.
//
semantics::strings
column_names (semantics::relational::table&);

// Column names of a key in key order.
//
semantics::strings
key_columns (semantics::relational::key&);

// Number of occurrences of s in text.
//
std::size_t
count (std::string const& text, std::string const& s);

#endif // TESTS_HELPERS_HXX
