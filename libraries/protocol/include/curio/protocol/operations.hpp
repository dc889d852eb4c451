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
#include <curio/protocol/mint.hpp>

namespace curio { namespace protocol {

   /**
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            mint_operation,
            mint_collaborative_operation,
            royalty_distribute_operation
         > operation;

   typedef fc::static_variant<
            void_result,
            mint_result,
            collaborative_mint_result,
            distribution_result
         > operation_result;

   /// Completion events, emitted after an operation has been applied
   typedef fc::static_variant<
            minted_event,
            collaborative_minted_event,
            royalty_distributed_event
         > mint_event;

   /**
    * Performs the stateless validation of any operation
    */
   void operation_validate( const operation& op );

} } // curio::protocol

FC_REFLECT_TYPENAME( curio::protocol::operation )
FC_REFLECT_TYPENAME( curio::protocol::operation_result )
FC_REFLECT_TYPENAME( curio::protocol::mint_event )
