// file      : ddlgen/relational/oracle/context.hxx
// copyright : Copyright (c) 2009-2013 Code Synthesis Tools CC
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef DDLGEN_RELATIONAL_ORACLE_CONTEXT_HXX
#define DDLGEN_RELATIONAL_ORACLE_CONTEXT_HXX

#include <ddlgen/relational/context.hxx>

namespace relational
{
  namespace oracle
  {
    class context: public virtual relational::context
    {
    public:
      static database::value const database_id = database::oracle;

    public:
      virtual
      ~context ();
      context ();
      context (std::ostream&,
               semantics::unit&,
               options_type const&,
               sema_rel::model*);

      static context&
      current ()
      {
        return *current_;
      }

    private:
      static context* current_;

    private:
      struct data: base_context::data
      {
        data (std::ostream& os): base_context::data (os) {}
      };

      data* data_;
    };
  }
}

#endif // DDLGEN_RELATIONAL_ORACLE_CONTEXT_HXX
