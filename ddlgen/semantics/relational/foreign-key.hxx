// file      : ddlgen/semantics/relational/foreign-key.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX
#define DDLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX

#include <ddlgen/semantics/relational/elements.hxx>
#include <ddlgen/semantics/relational/key.hxx>

namespace semantics
{
  namespace relational
  {
    // The referenced table and columns are stored by name. The local
    // and referenced column lists are parallel.
    //
    class foreign_key: public key
    {
    public:
      string const&
      referenced_table () const
      {
        return referenced_table_;
      }

      typedef std::vector<string> columns;

      columns const&
      referenced_columns () const
      {
        return referenced_columns_;
      }

      columns&
      referenced_columns ()
      {
        return referenced_columns_;
      }

    public:
      // Junction table sides are built the same way as any other
      // reference and are one_one as well.
      //
      enum relation_type
      {
        one_one,
        many_many
      };

      relation_type
      relation () const
      {
        return relation_;
      }

    public:
      foreign_key (string const& referenced_table,
                   relation_type relation = one_one)
          : referenced_table_ (referenced_table),
            relation_ (relation)
      {
      }

      virtual string
      kind () const
      {
        return "foreign key";
      }

    private:
      string referenced_table_;
      columns referenced_columns_;
      relation_type relation_;
    };
  }
}

#endif // DDLGEN_SEMANTICS_RELATIONAL_FOREIGN_KEY_HXX
