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
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( distribution_config_mismatch, chain_exception, 3010000,
                                   "DistributionConfigMismatch" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000,
                                   "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_transfer_exception,    chain_exception, 3080000,
                                   "ledger transfer exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( platform_wallet_mismatch, operation_evaluate_exception, 3050001,
                                   "PlatformWalletMismatch" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( missing_creator_account,  operation_evaluate_exception, 3050002,
                                   "MissingCreatorAccount" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( creator_account_mismatch, operation_evaluate_exception, 3050003,
                                   "CreatorAccountMismatch" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_collectible,         operation_evaluate_exception, 3050004,
                                   "UnknownCollectible" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( royalty_schedule_not_found,  operation_evaluate_exception, 3050005,
                                   "RoyaltyScheduleNotFound" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( token_issuance_failed,       operation_evaluate_exception, 3050006,
                                   "TokenIssuanceFailed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance, ledger_transfer_exception, 3080001,
                                   "InsufficientBalance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_account,      ledger_transfer_exception, 3080002,
                                   "UnknownAccount" )

} } // curio::chain
