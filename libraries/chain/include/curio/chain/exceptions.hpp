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
#pragma once

#include <fc/exception/exception.hpp>
#include <curio/protocol/exceptions.hpp>

#define CURIO_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                        \
   if( !(expr) )                                                   \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );         \
   FC_MULTILINE_MACRO_END

namespace curio { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   /// A configuration differs from the one the ledger was created with
   FC_DECLARE_DERIVED_EXCEPTION( distribution_config_mismatch, chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_transfer_exception,    chain_exception, 3080000 )

   /// The caller-supplied platform account is not the configured one
   FC_DECLARE_DERIVED_EXCEPTION( platform_wallet_mismatch, operation_evaluate_exception, 3050001 )
   /// No creator account was supplied for a position of the schedule
   FC_DECLARE_DERIVED_EXCEPTION( missing_creator_account,  operation_evaluate_exception, 3050002 )
   /// The creator account supplied for a position differs from the recorded recipient
   FC_DECLARE_DERIVED_EXCEPTION( creator_account_mismatch, operation_evaluate_exception, 3050003 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_collectible,         operation_evaluate_exception, 3050004 )
   FC_DECLARE_DERIVED_EXCEPTION( royalty_schedule_not_found,  operation_evaluate_exception, 3050005 )
   FC_DECLARE_DERIVED_EXCEPTION( token_issuance_failed,       operation_evaluate_exception, 3050006 )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance, ledger_transfer_exception, 3080001 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_account,      ledger_transfer_exception, 3080002 )

} } // curio::chain
