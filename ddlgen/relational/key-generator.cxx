// file      : ddlgen/relational/key-generator.cxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ddlgen/diagnostics.hxx>
#include <ddlgen/relational/key-generator.hxx>

using namespace std;

namespace relational
{
  namespace
  {
    const char* const strategies[] =
    {
      "HIGH-LOW",
      "IDENTITY",
      "MAX",
      "SEQUENCE",
      "UUID"
    };

    size_t const strategy_count (sizeof (strategies) / sizeof (char*));
  }

  key_generator_registry::
  key_generator_registry (sema_rel::model& m)
      : model_ (m)
  {
    for (size_t i (0); i < strategy_count; ++i)
      map_[strategies[i]] = &create (strategies[i], strategies[i]);
  }

  bool key_generator_registry::
  known_strategy (string const& s)
  {
    string u (upcase (s));

    for (size_t i (0); i < strategy_count; ++i)
    {
      if (u == strategies[i])
        return true;
    }

    return false;
  }

  bool key_generator_registry::
  insert (semantics::key_generator& kg)
  {
    if (!known_strategy (kg.strategy ()))
      return false;

    string n (upcase (kg.name ()));

    declaration_map::iterator i (declarations_.find (n));
    if (i != declarations_.end () && options.warn_duplicate_key_generator ())
    {
      warn (kg) << "key generator '" << kg.name () << "' is already "
                << "declared" << endl;
      info (*i->second) << "previous declaration is here" << endl;
      warn (kg) << "this declaration replaces the previous one" << endl;
    }

    sema_rel::key_generator& g (create (kg.name (), upcase (kg.strategy ())));

    for (semantics::key_generator::parameters_type::const_iterator j (
           kg.parameters ().begin ()); j != kg.parameters ().end (); ++j)
      g.parameters ().push_back (*j);

    g.set ("mapping-node", static_cast<semantics::node*> (&kg));

    map_[n] = &g;
    declarations_[n] = &kg;

    if (options.trace ())
      cerr << "registered key generator '" << kg.name () << "' ("
           << g.strategy () << ")" << endl;

    return true;
  }

  sema_rel::key_generator* key_generator_registry::
  find (string const& name) const
  {
    map::const_iterator i (map_.find (upcase (name)));
    return i != map_.end () ? i->second : 0;
  }

  sema_rel::key_generator& key_generator_registry::
  create (string const& name, string const& strategy)
  {
    return model_.new_node<sema_rel::key_generator> (name, strategy);
  }
}
