// file      : ddlgen/parser.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_PARSER_HXX
#define DDLGEN_PARSER_HXX

#include <string>
#include <vector>
#include <memory>  // std::auto_ptr
#include <utility> // std::pair
#include <cstddef> // std::size_t
#include <istream>

#include <ddlgen/options.hxx>
#include <ddlgen/semantics.hxx>

namespace cutl
{
  namespace xml
  {
    class parser;
  }
}

// Load a mapping document into the semantic graph.
//
class parser
{
public:
  class failed {};

  parser (options const&);

  std::auto_ptr<semantics::unit>
  parse (semantics::path const& file);

  // The file is only used in diagnostics and as the unit's file.
  //
  std::auto_ptr<semantics::unit>
  parse (std::istream&, semantics::path const& file);

private:
  typedef semantics::path path;
  typedef semantics::strings strings;
  typedef cutl::xml::parser xml_parser;

  void
  parse_mapping (xml_parser&);

  void
  parse_key_generator (xml_parser&);

  void
  parse_class (xml_parser&);

  void
  parse_map_to (xml_parser&, semantics::class_&);

  void
  parse_field (xml_parser&, semantics::class_&);

  void
  parse_sql (xml_parser&, semantics::data_member&);

  void
  parse_index (xml_parser&, semantics::class_&);

  // Skip the content of the current element including nested elements.
  //
  void
  skip (xml_parser&);

  // Verify that the current element is in the document namespace.
  //
  void
  expect_namespace (xml_parser&);

  // Establish inheritance once all the classes are known.
  //
  void
  resolve_extends ();

  static strings
  split (std::string const&);

private:
  options const& ops_;
  bool trace;

  semantics::unit* unit_;
  std::string xmlns_;

  std::size_t error_;

  typedef std::vector<std::pair<semantics::class_*, std::string> > extends;
  extends extends_;

private:
  parser (parser const&);
  parser& operator= (parser const&);
};

#endif // DDLGEN_PARSER_HXX
