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
#include <curio/chain/types.hpp>
#include <curio/db/generic_index.hpp>
#include <curio/protocol/royalty.hpp>

#include <boost/multi_index/composite_key.hpp>

/**
 * @defgroup collectible Collectible objects
 */

namespace curio {
   namespace chain {
      class database;

      using namespace curio::db;

      /**
       *  @brief Tracks a minted collectible
       *  @ingroup object
       *  @ingroup collectible
       */
      class collectible_object : public abstract_object<collectible_object> {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id = collectible_object_type;

         /// Reference to the off-ledger metadata
         string metadata_reference;

         string title;

         /// Account that funded the first sale
         account_id_type minted_by;

         /// Number of creators sharing the proceeds
         uint8_t creator_count = 0;

         /// Units issued to holding accounts so far
         share_type current_supply;

         collectible_id_type get_id() const { return id; }
      };

      typedef multi_index_container<
         collectible_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
         >
      > collectible_multi_index_type;
      typedef generic_index<collectible_object, collectible_multi_index_type> collectible_index;


      /**
       *  @brief The royalty schedule recorded by the first mint of a collaborative collectible
       *  @ingroup object
       *  @ingroup implementation
       *
       *  The schedule is written once and only read afterwards. Every later sale of the collectible
       *  is distributed with these shares and this platform fee rate.
       */
      class royalty_schedule_object : public abstract_object<royalty_schedule_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_royalty_schedule_object_type;

         /// Collectible that owns the schedule
         collectible_id_type collectible;

         /// Validated shares in payment order
         vector<royalty_share> shares;

         /// Platform fee rate in effect when the schedule was recorded
         uint16_t platform_fee_bps = 0;

         uint8_t creator_count() const;
         vector<account_id_type> recipients() const;
      };

      struct by_collectible;
      typedef multi_index_container<
         royalty_schedule_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_collectible>,
               member<royalty_schedule_object, collectible_id_type, &royalty_schedule_object::collectible> >
         >
      > royalty_schedule_multi_index_type;
      typedef generic_index<royalty_schedule_object, royalty_schedule_multi_index_type> royalty_schedule_index;


      /**
       *  @brief Units of a collectible held by an account
       *  @ingroup object
       *  @ingroup implementation
       */
      class collectible_holding_object : public abstract_object<collectible_holding_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_collectible_holding_object_type;

         account_id_type owner;
         collectible_id_type collectible;
         share_type amount;
      };

      struct by_owner_collectible;
      typedef multi_index_container<
         collectible_holding_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_owner_collectible>,
               composite_key<collectible_holding_object,
                  member<collectible_holding_object, account_id_type, &collectible_holding_object::owner>,
                  member<collectible_holding_object, collectible_id_type, &collectible_holding_object::collectible>
               >
            >
         >
      > collectible_holding_multi_index_type;
      typedef generic_index<collectible_holding_object, collectible_holding_multi_index_type> collectible_holding_index;
   }
} // curio::chain

FC_REFLECT_DERIVED( curio::chain::collectible_object, (curio::db::object),
                    (metadata_reference)
                    (title)
                    (minted_by)
                    (creator_count)
                    (current_supply)
                  )

FC_REFLECT_DERIVED( curio::chain::royalty_schedule_object, (curio::db::object),
                    (collectible)
                    (shares)
                    (platform_fee_bps)
                  )

FC_REFLECT_DERIVED( curio::chain::collectible_holding_object, (curio::db::object),
                    (owner)
                    (collectible)
                    (amount)
                  )
