// file      : ddlgen/semantics/key-generator.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_KEY_GENERATOR_HXX
#define DDLGEN_SEMANTICS_KEY_GENERATOR_HXX

#include <utility> // std::pair

#include <ddlgen/semantics/elements.hxx>

namespace semantics
{
  class unit;
  class key_generator;

  class declares: public edge
  {
  public:
    typedef semantics::unit unit_type;
    typedef semantics::key_generator key_generator_type;

    unit_type&
    unit () const
    {
      return *unit_;
    }

    key_generator_type&
    key_generator () const
    {
      return *key_generator_;
    }

  public:
    declares (): unit_ (0), key_generator_ (0) {}

    void
    set_left_node (unit_type& n)
    {
      unit_ = &n;
    }

    void
    set_right_node (key_generator_type& n)
    {
      key_generator_ = &n;
    }

  protected:
    unit_type* unit_;
    key_generator_type* key_generator_;
  };

  // Key generator declaration. The name is what classes refer to
  // (the alias in the mapping document) while the strategy selects
  // the algorithm (MAX, HIGH-LOW, UUID, IDENTITY, SEQUENCE).
  //
  class key_generator: public node
  {
  public:
    typedef std::pair<string, string> parameter;
    typedef std::vector<parameter> parameters_type;

    string const&
    name () const
    {
      return name_;
    }

    string const&
    strategy () const
    {
      return strategy_;
    }

    parameters_type const&
    parameters () const
    {
      return parameters_;
    }

    void
    parameter_add (string const& n, string const& v)
    {
      parameters_.push_back (parameter (n, v));
    }

  public:
    key_generator (path const& file,
                   size_t line,
                   size_t column,
                   string const& name,
                   string const& strategy)
        : node (file, line, column), name_ (name), strategy_ (strategy)
    {
    }

    void
    add_edge_right (declares&)
    {
    }

    using node::add_edge_right;

  private:
    string name_;
    string strategy_;
    parameters_type parameters_;
  };
}

#endif // DDLGEN_SEMANTICS_KEY_GENERATOR_HXX
