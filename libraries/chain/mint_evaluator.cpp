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
#include <curio/chain/mint_evaluator.hpp>
#include <curio/chain/revenue_distributor.hpp>

namespace curio {
   namespace chain {

      void issue_minted_unit(database &d, const collectible_object &collectible, account_id_type holder) {
         try {
            d.get_token_issuer().issue(d, collectible, holder, CURIO_MINT_UNITS);
         } catch (const fc::exception &e) {
            FC_THROW_EXCEPTION(token_issuance_failed,
                               "Issuing collectible ${c} to ${h} failed: ${e}",
                               ("c", collectible.id)("h", holder)("e", e.to_detail_string()));
         } catch (const std::exception &e) {
            FC_THROW_EXCEPTION(token_issuance_failed,
                               "Issuing collectible ${c} to ${h} failed: ${e}",
                               ("c", collectible.id)("h", holder)("e", e.what()));
         }
      }

      void_result mint_evaluator::do_evaluate(const mint_operation &op) {
         try {
            const curio::chain::database& d = db();

            // A single creator receives the whole net amount, so there is no schedule to validate
            _stage = schedule_validated;

            revenue_distributor::verify_platform_account(d, op.platform);

            _fee_rate_bps = d.get_config().platform_fee_bps;
            _split = split_fee(op.sale_amount, _fee_rate_bps);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      mint_result mint_evaluator::do_apply(const mint_operation &op) {
         try {
            curio::chain::database &d = db();
            try {
               const collectible_object &c = d.create<collectible_object>([&op](collectible_object &obj) {
                  obj.metadata_reference = op.metadata_reference;
                  obj.title = op.title;
                  obj.minted_by = op.payer;
                  obj.creator_count = 1;
               });
               const collectible_id_type collectible_id = c.get_id();

               if (_split.fee > 0)
                  d.transfer(op.payer, op.platform, _split.fee);
               _stage = fee_settled;

               if (_split.net > 0)
                  d.transfer(op.payer, op.creator, _split.net);
               _stage = creators_settled;

               issue_minted_unit(d, c, op.recipient_account);
               _stage = token_issued;

               minted_event event;
               event.payer = op.payer;
               event.collectible = collectible_id;
               event.recipient_account = op.recipient_account;
               event.platform = op.platform;
               event.sale_amount = op.sale_amount;
               event.fee_rate_bps = _fee_rate_bps;
               event.creator = op.creator;
               event.fee = _split.fee;
               event.net = _split.net;
               d.push_applied_event(event);
               _stage = mint_completed;

               ilog("Minted ${c} for ${p}: fee ${f}, net ${n}",
                    ("c", collectible_id)("p", op.payer)("f", _split.fee)("n", _split.net));

               mint_result result;
               result.collectible = collectible_id;
               result.fee = _split.fee;
               result.net = _split.net;
               return result;
            } catch (fc::exception &e) {
               const mint_stage reached = _stage;
               _stage = mint_aborted;
               FC_RETHROW_EXCEPTION(e, warn, "Mint aborted after reaching ${stage}", ("stage", reached));
            }
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result mint_collaborative_evaluator::do_evaluate(const mint_collaborative_operation &op) {
         try {
            const curio::chain::database& d = db();

            if (op.collectible.valid()) {
               // A subsequent sale is distributed with the schedule recorded by the first mint
               _collectible = &d.get_collectible(*op.collectible);
               _schedule = &d.get_royalty_schedule(*op.collectible);
               _shares = _schedule->shares;
               _fee_rate_bps = _schedule->platform_fee_bps;
               if (!op.shares.empty() && op.shares != _shares) {
                  wlog("Ignoring the shares supplied for collectible ${c} in favour of its recorded schedule",
                       ("c", *op.collectible)("supplied", op.shares)("recorded", _shares));
               }
            } else {
               validate_royalty_shares(op.shares);
               _shares = op.shares;
               _fee_rate_bps = d.get_config().platform_fee_bps;
            }
            _stage = schedule_validated;

            revenue_distributor::verify_platform_account(d, op.platform);
            revenue_distributor::verify_creator_accounts(_shares, op.creator_accounts);

            _distribution = calculate_distribution(op.sale_amount, _shares, _fee_rate_bps);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      collaborative_mint_result mint_collaborative_evaluator::do_apply(const mint_collaborative_operation &op) {
         try {
            curio::chain::database &d = db();
            try {
               const collectible_object* c = _collectible;
               if (c == nullptr) {
                  const uint8_t creator_count = static_cast<uint8_t>(_shares.size());
                  c = &d.create<collectible_object>([&op, creator_count](collectible_object &obj) {
                     obj.metadata_reference = op.metadata_reference;
                     obj.title = op.title;
                     obj.minted_by = op.buyer;
                     obj.creator_count = creator_count;
                  });
               }
               const collectible_id_type collectible_id = c->get_id();

               revenue_distributor distributor(d);
               distributor.settle_platform_fee(op.buyer, op.platform, _distribution);
               _stage = fee_settled;

               vector<creator_payout> payouts = distributor.settle_creator_shares(op.buyer, _shares, _distribution);
               _stage = creators_settled;

               issue_minted_unit(d, *c, op.buyer_account);
               _stage = token_issued;

               if (_schedule == nullptr) {
                  const vector<royalty_share>& shares = _shares;
                  const uint16_t fee_rate_bps = _fee_rate_bps;
                  d.create<royalty_schedule_object>([collectible_id, &shares, fee_rate_bps](royalty_schedule_object &obj) {
                     obj.collectible = collectible_id;
                     obj.shares = shares;
                     obj.platform_fee_bps = fee_rate_bps;
                  });
               }

               collaborative_minted_event event;
               event.buyer = op.buyer;
               event.collectible = collectible_id;
               event.buyer_account = op.buyer_account;
               event.platform = op.platform;
               event.sale_amount = op.sale_amount;
               event.platform_fee = _distribution.platform_fee;
               event.remaining_amount = _distribution.remaining_amount;
               event.creator_count = static_cast<uint8_t>(_shares.size());
               event.metadata_reference = c->metadata_reference;
               event.title = c->title;
               event.payouts = std::move(payouts);
               d.push_applied_event(event);
               _stage = mint_completed;

               ilog("Minted ${c} for ${b} with ${n} creators: platform fee ${f}, remaining ${r}",
                    ("c", collectible_id)("b", op.buyer)("n", _shares.size())
                    ("f", _distribution.platform_fee)("r", _distribution.remaining_amount));

               collaborative_mint_result result;
               result.collectible = collectible_id;
               result.platform_fee = _distribution.platform_fee;
               result.remaining_amount = _distribution.remaining_amount;
               result.creator_amounts = _distribution.creator_amounts;
               result.creator_count = static_cast<uint8_t>(_shares.size());
               return result;
            } catch (fc::exception &e) {
               const mint_stage reached = _stage;
               _stage = mint_aborted;
               FC_RETHROW_EXCEPTION(e, warn, "Collaborative mint aborted after reaching ${stage}", ("stage", reached));
            }
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result royalty_distribute_evaluator::do_evaluate(const royalty_distribute_operation &op) {
         try {
            const curio::chain::database& d = db();

            d.get_collectible(op.collectible);
            _schedule = &d.get_royalty_schedule(op.collectible);
            _stage = schedule_validated;

            revenue_distributor::verify_platform_account(d, op.platform);
            revenue_distributor::verify_creator_accounts(_schedule->shares, op.creator_accounts);

            _distribution = calculate_distribution(op.sale_amount, _schedule->shares, _schedule->platform_fee_bps);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      distribution_result royalty_distribute_evaluator::do_apply(const royalty_distribute_operation &op) {
         try {
            curio::chain::database &d = db();
            try {
               revenue_distributor distributor(d);
               distributor.settle_platform_fee(op.payer, op.platform, _distribution);
               _stage = fee_settled;

               vector<creator_payout> payouts = distributor.settle_creator_shares(op.payer, _schedule->shares, _distribution);
               _stage = creators_settled;

               royalty_distributed_event event;
               event.collectible = op.collectible;
               event.payer = op.payer;
               event.platform = op.platform;
               event.sale_amount = op.sale_amount;
               event.platform_fee = _distribution.platform_fee;
               event.remaining_amount = _distribution.remaining_amount;
               event.payouts = std::move(payouts);
               d.push_applied_event(event);
               _stage = mint_completed;

               return _distribution;
            } catch (fc::exception &e) {
               const mint_stage reached = _stage;
               _stage = mint_aborted;
               FC_RETHROW_EXCEPTION(e, warn, "Royalty distribution aborted after reaching ${stage}", ("stage", reached));
            }
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace curio
