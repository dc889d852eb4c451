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

#include <curio/protocol/types.hpp>
#include <curio/protocol/royalty.hpp>

namespace curio {
   namespace protocol {
      /**
       * @brief Mint a collectible whose proceeds belong to a single creator
       *
       * The platform fee is paid to the platform account and the net amount to the creator.
       */
      struct mint_operation {
         /// Funds the sale
         account_id_type payer;

         /// Receives the net amount of the sale
         account_id_type creator;

         /// Holding account that receives the minted unit
         account_id_type recipient_account;

         /// Must be the platform account of the distribution configuration
         account_id_type platform;

         /// Sale amount in the smallest unit
         share_type sale_amount;

         /// Reference to the off-ledger metadata of the collectible
         string metadata_reference;

         string title;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type fee_payer() const { return payer; }
      };

      /**
       * @brief Mint a collectible whose proceeds are shared by up to CURIO_MAX_ROYALTY_SHARES creators
       *
       * On the first sale the supplied shares become the stored royalty schedule of the new collectible.
       * When @ref collectible is set the sale belongs to an existing collectible and its stored
       * schedule is used instead of @ref shares.
       */
      struct mint_collaborative_operation {
         /// Funds the sale
         account_id_type buyer;

         /// Holding account that receives the minted unit
         account_id_type buyer_account;

         /// Must be the platform account of the distribution configuration
         account_id_type platform;

         /// Sale amount in the smallest unit
         share_type sale_amount;

         /// Royalty schedule for a first mint
         vector<royalty_share> shares;

         /// Creator accounts, matched by position against the recipients of the schedule
         vector<account_id_type> creator_accounts;

         /// Reference to the off-ledger metadata of the collectible
         string metadata_reference;

         string title;

         /// Existing collectible of a subsequent sale
         optional<collectible_id_type> collectible;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type fee_payer() const { return buyer; }
      };

      /**
       * @brief Distribute the proceeds of a secondary sale according to a stored royalty schedule
       */
      struct royalty_distribute_operation {
         collectible_id_type collectible;

         /// Funds the sale
         account_id_type payer;

         /// Must be the platform account of the distribution configuration
         account_id_type platform;

         share_type sale_amount;

         /// Creator accounts, matched by position against the recipients of the schedule
         vector<account_id_type> creator_accounts;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_id_type fee_payer() const { return payer; }
      };

      struct mint_result {
         collectible_id_type collectible;
         share_type fee;
         share_type net;
      };

      struct collaborative_mint_result {
         collectible_id_type collectible;
         share_type platform_fee;
         share_type remaining_amount;
         vector<share_type> creator_amounts;
         uint8_t creator_count = 0;
      };

      /// Amount paid to one creator of a schedule
      struct creator_payout {
         creator_payout() {}
         creator_payout( account_id_type r, uint8_t p, share_type a )
            : recipient(r), percentage(p), amount(a) {}

         account_id_type recipient;
         uint8_t percentage = 0;
         share_type amount;
      };

      /**
       * @brief Emitted once a single-creator mint has completed
       */
      struct minted_event {
         account_id_type payer;
         collectible_id_type collectible;
         account_id_type recipient_account;
         account_id_type platform;
         share_type sale_amount;
         uint16_t fee_rate_bps = 0;

         account_id_type creator;
         share_type fee;
         share_type net;
      };

      /**
       * @brief Emitted once a collaborative mint has completed
       */
      struct collaborative_minted_event {
         account_id_type buyer;
         collectible_id_type collectible;
         account_id_type buyer_account;
         account_id_type platform;
         share_type sale_amount;
         share_type platform_fee;
         share_type remaining_amount;
         uint8_t creator_count = 0;
         string metadata_reference;
         string title;

         /// Per-creator breakdown in schedule order
         vector<creator_payout> payouts;
      };

      /**
       * @brief Emitted once a secondary sale has been distributed
       */
      struct royalty_distributed_event {
         collectible_id_type collectible;
         account_id_type payer;
         account_id_type platform;
         share_type sale_amount;
         share_type platform_fee;
         share_type remaining_amount;
         vector<creator_payout> payouts;
      };
   }
} // curio::protocol

FC_REFLECT( curio::protocol::mint_operation,
            (payer)(creator)(recipient_account)(platform)(sale_amount)(metadata_reference)(title) )
FC_REFLECT( curio::protocol::mint_collaborative_operation,
            (buyer)(buyer_account)(platform)(sale_amount)(shares)(creator_accounts)
            (metadata_reference)(title)(collectible) )
FC_REFLECT( curio::protocol::royalty_distribute_operation,
            (collectible)(payer)(platform)(sale_amount)(creator_accounts) )

FC_REFLECT( curio::protocol::mint_result, (collectible)(fee)(net) )
FC_REFLECT( curio::protocol::collaborative_mint_result,
            (collectible)(platform_fee)(remaining_amount)(creator_amounts)(creator_count) )

FC_REFLECT( curio::protocol::creator_payout, (recipient)(percentage)(amount) )
FC_REFLECT( curio::protocol::minted_event,
            (payer)(collectible)(recipient_account)(platform)(sale_amount)(fee_rate_bps)
            (creator)(fee)(net) )
FC_REFLECT( curio::protocol::collaborative_minted_event,
            (buyer)(collectible)(buyer_account)(platform)(sale_amount)(platform_fee)(remaining_amount)
            (creator_count)(metadata_reference)(title)(payouts) )
FC_REFLECT( curio::protocol::royalty_distributed_event,
            (collectible)(payer)(platform)(sale_amount)(platform_fee)(remaining_amount)(payouts) )
