// file      : ddlgen/relational/key-generator.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_KEY_GENERATOR_HXX
#define DDLGEN_RELATIONAL_KEY_GENERATOR_HXX

#include <map>

#include <ddlgen/relational/context.hxx>

namespace relational
{
  // Key generators that persistent classes can refer to by name. Names
  // are case-insensitive. The registry starts with one generator for
  // each built-in strategy, named after the strategy. Declarations from
  // the mapping document are added on top of these and a later
  // declaration replaces an earlier one with the same name.
  //
  class key_generator_registry: public virtual context
  {
  public:
    key_generator_registry (sema_rel::model&);

    // Return false if the declaration uses an unknown strategy.
    //
    bool
    insert (semantics::key_generator&);

    // Return 0 if there is no key generator with this name.
    //
    sema_rel::key_generator*
    find (string const& name) const;

    static bool
    known_strategy (string const&);

  private:
    sema_rel::key_generator&
    create (string const& name, string const& strategy);

  private:
    typedef std::map<string, sema_rel::key_generator*> map;
    typedef std::map<string, semantics::key_generator*> declaration_map;

    sema_rel::model& model_;
    map map_;
    declaration_map declarations_;
  };
}

#endif // DDLGEN_RELATIONAL_KEY_GENERATOR_HXX
