// file      : ddlgen/relational/model.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_MODEL_HXX
#define DDLGEN_RELATIONAL_MODEL_HXX

#include <map>
#include <vector>

#include <ddlgen/semantics/relational.hxx>

#include <ddlgen/relational/common.hxx>
#include <ddlgen/relational/context.hxx>
#include <ddlgen/relational/key-generator.hxx>

namespace relational
{
  namespace model
  {
    // A member type is neither a SQL type nor a mapped class, or the
    // number of columns of a reference member does not match the number
    // of identity columns in the referenced class.
    //
    struct type_not_found
    {
      type_not_found (semantics::class_& c,
                      semantics::data_member& m,
                      std::string const& d,
                      semantics::class_* r = 0)
          : c (c), m (m), description (d), related (r)
      {
      }

      semantics::class_& c;
      semantics::data_member& m;
      std::string description;
      semantics::class_* related;
    };

    // Any other inconsistency in the mapping.
    //
    struct structural_error
    {
      structural_error (semantics::node& n,
                        std::string const& d,
                        semantics::class_* r = 0)
          : node (n), description (d), related (r)
      {
      }

      semantics::node& node;
      std::string description;
      semantics::class_* related;
    };

    // Junction classes pending materialization, in the order their
    // tables were first referred to. The classes and their members are
    // created in the graph passed to the constructor.
    //
    class junctions
    {
      typedef std::vector<semantics::class_*> list;
      typedef std::map<std::string, semantics::class_*> map;

    public:
      explicit
      junctions (semantics::unit& g): graph_ (g) {}

      semantics::unit&
      graph () const
      {
        return graph_;
      }

      typedef list::const_iterator iterator;

      iterator
      begin () const
      {
        return list_.begin ();
      }

      iterator
      end () const
      {
        return list_.end ();
      }

      semantics::class_*
      find (std::string const& table) const
      {
        map::const_iterator i (map_.find (table));
        return i != map_.end () ? i->second : 0;
      }

      void
      insert (std::string const& table, semantics::class_& c)
      {
        list_.push_back (&c);
        map_[table] = &c;
      }

    private:
      semantics::unit& graph_;
      list list_;
      map map_;
    };

    struct class_: traversal::class_, virtual context
    {
      typedef class_ base;

      class_ (sema_rel::model& model,
              key_generator_registry& registry,
              junctions& junctions)
          : model_ (model), registry_ (registry), junctions_ (junctions)
      {
      }

      virtual void
      traverse (type& c);

    protected:
      typedef std::vector<sema_rel::column*> columns;

      virtual sema_rel::table&
      create_table (type& c);

      // Return the database types of the member columns. If the member
      // is a reference, set r to the referenced class.
      //
      strings
      resolve_type (type& c, semantics::data_member& m, type*& r);

      // Create the member columns with the types returned by
      // resolve_type().
      //
      columns
      create_columns (sema_rel::table&,
                      type& c,
                      semantics::data_member& m,
                      strings const& types,
                      type* r,
                      bool id);

      void
      add_foreign_key (sema_rel::table&,
                       type& c,
                       semantics::data_member& m,
                       type& r,
                       columns const&);

      // Merge the identity of base b into the table of class c.
      //
      void
      extend (sema_rel::table&,
              type& c,
              type& b,
              sema_rel::key_generator*& kg);

      void
      add_indexes (sema_rel::table&, type& c);

      // Queue the junction table of a many-to-many member.
      //
      void
      add_junction (type& c, semantics::data_member& m);

      void
      add_junction_side (type& j,
                         semantics::data_member& m,
                         string const& name,
                         string const& class_name,
                         strings const& cols);

      sema_rel::key_generator*
      find_key_generator (type& c);

    protected:
      sema_rel::model& model_;
      key_generator_registry& registry_;
      junctions& junctions_;
    };

    // Populate the model from the mapping document in the current
    // context. Throw type_not_found, structural_error, or duplicate_name
    // if the mapping is inconsistent.
    //
    void
    build (sema_rel::model&);

    // Build the relational model for the mapping document. Issue
    // diagnostics and throw operation_failed if the mapping is
    // inconsistent.
    //
    cutl::shared_ptr<sema_rel::model>
    generate ();
  }
}

#endif // DDLGEN_RELATIONAL_MODEL_HXX
