// file      : ddlgen/semantics/relational/key-generator.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_KEY_GENERATOR_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_KEY_GENERATOR_HXX

#include <utility> // std::pair

#include <ddlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class table;
    class key_generator;

    // Table uses a key generator to produce its identity values.
    //
    class uses: public edge
    {
    public:
      typedef relational::table table_type;
      typedef relational::key_generator key_generator_type;

      table_type&
      table () const
      {
        return *table_;
      }

      key_generator_type&
      key_generator () const
      {
        return *key_generator_;
      }

    public:
      uses (): table_ (0), key_generator_ (0) {}

      void
      set_left_node (table_type& n)
      {
        table_ = &n;
      }

      void
      set_right_node (key_generator_type& n)
      {
        key_generator_ = &n;
      }

    protected:
      table_type* table_;
      key_generator_type* key_generator_;
    };

    // A key generator is not named in any scope since the same
    // generator can be used by several tables. Emission is done per
    // using table.
    //
    class key_generator: public node
    {
      typedef std::vector<uses*> used_list;

    public:
      typedef std::pair<string, string> parameter;
      typedef std::vector<parameter> parameters_type;

      string const&
      name () const
      {
        return name_;
      }

      // Upper-case strategy name, for example SEQUENCE.
      //
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

      parameters_type&
      parameters ()
      {
        return parameters_;
      }

      // Return the parameter value or the default if not specified.
      //
      string
      parameter_value (string const& name,
                       string const& default_value = string ()) const;

    public:
      typedef
      pointer_iterator<used_list::const_iterator>
      used_iterator;

      used_iterator
      used_begin () const
      {
        return used_.begin ();
      }

      used_iterator
      used_end () const
      {
        return used_.end ();
      }

    public:
      key_generator (string const& name, string const& strategy)
          : name_ (name), strategy_ (strategy)
      {
      }

      void
      add_edge_right (uses& e)
      {
        used_.push_back (&e);
      }

      using node::add_edge_right;

      virtual string
      kind () const
      {
        return "key generator";
      }

    private:
      string name_;
      string strategy_;
      parameters_type parameters_;
      used_list used_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_KEY_GENERATOR_HXX
