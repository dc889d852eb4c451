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

#include <curio/chain/evaluator.hpp>
#include <curio/chain/collectible_object.hpp>
#include <curio/protocol/mint.hpp>

namespace curio {
   namespace chain {

      /**
       * Progress of a mint through its settlement steps
       *
       * A mint moves forward through the stages in declaration order. Any failure moves it
       * to mint_aborted, and the stage reached last is recorded in the exception log.
       */
      enum mint_stage {
         mint_requested,
         schedule_validated,
         fee_settled,
         creators_settled,
         token_issued,
         mint_completed,
         mint_aborted
      };

      class mint_evaluator : public evaluator<mint_evaluator> {
      public:
         typedef mint_operation operation_type;

         void_result do_evaluate(const mint_operation &o);

         mint_result do_apply(const mint_operation &o);

         mint_stage stage() const { return _stage; }

      private:
         mint_stage _stage = mint_requested;
         fee_split _split;
         uint16_t _fee_rate_bps = 0;
      };

      class mint_collaborative_evaluator : public evaluator<mint_collaborative_evaluator> {
      public:
         typedef mint_collaborative_operation operation_type;

         void_result do_evaluate(const mint_collaborative_operation &o);

         collaborative_mint_result do_apply(const mint_collaborative_operation &o);

         mint_stage stage() const { return _stage; }

      private:
         mint_stage _stage = mint_requested;

         /// Set for a subsequent sale of an existing collectible
         const collectible_object* _collectible = nullptr;
         const royalty_schedule_object* _schedule = nullptr;

         vector<royalty_share> _shares;
         uint16_t _fee_rate_bps = 0;
         distribution_result _distribution;
      };

      class royalty_distribute_evaluator : public evaluator<royalty_distribute_evaluator> {
      public:
         typedef royalty_distribute_operation operation_type;

         void_result do_evaluate(const royalty_distribute_operation &o);

         distribution_result do_apply(const royalty_distribute_operation &o);

         mint_stage stage() const { return _stage; }

      private:
         mint_stage _stage = mint_requested;
         const royalty_schedule_object* _schedule = nullptr;
         distribution_result _distribution;
      };

      /**
       * Issue the unit of a mint through the database's token issuer
       * @throws token_issuance_failed wrapping any failure of the issuer
       */
      void issue_minted_unit(database &db, const collectible_object &collectible, account_id_type holder);

   } // namespace chain
} // namespace curio

FC_REFLECT_ENUM( curio::chain::mint_stage,
                 (mint_requested)
                 (schedule_validated)
                 (fee_settled)
                 (creators_settled)
                 (token_issued)
                 (mint_completed)
                 (mint_aborted)
               )
