/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <curio/chain/database.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

database::database( const distribution_config& config, std::shared_ptr<token_issuer> issuer )
   : _config( config ), _issuer( std::move( issuer ) )
{ try {
   _config.validate();
   FC_ASSERT( _issuer, "A token issuer is required" );
   initialize_indexes();
   initialize_evaluators();
} FC_CAPTURE_AND_RETHROW( (config) ) }

database::~database()
{
   clear_pending_events();
}

void database::clear_pending_events()
{
   _pending_events.clear();
}

void database::push_applied_event( const mint_event& e )
{
   _pending_events.emplace_back( e );
}

operation_result database::apply_operation( const operation& op )
{ try {
   operation_validate( op );

   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op", op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op", op) );
   std::unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op", op) );

   clear_pending_events();
   operation_result result;
   {
      auto op_session = start_undo_session();
      result = eval->evaluate( *this, op, true );
      op_session.merge();
   }

   vector<mint_event> events;
   std::swap( events, _pending_events );
   for( const mint_event& e : events )
      applied_events( e );

   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // curio::chain
