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

#include <curio/chain/database.hpp>

#include <curio/protocol/operations.hpp>

#include <boost/multi_index/composite_key.hpp>
#include <boost/program_options.hpp>

namespace curio { namespace mint_history {
using namespace chain;

//
// Plugins should #define their SPACE_ID's so plugins with
// conflicting SPACE_ID assignments can be compiled into the
// same binary.
//
#ifndef MINT_HISTORY_SPACE_ID
#define MINT_HISTORY_SPACE_ID 8
#endif

enum mint_history_object_type
{
   ROYALTY_PAYMENT_TYPE_ID = 0
};

/// Party of a sale that a payment was made to
enum royalty_payment_kind
{
   platform_fee_payment = 0,
   creator_share_payment = 1,
   single_creator_payment = 2
};

/**
 * @brief One transfer made while settling a sale
 */
struct royalty_payment_object : public abstract_object<royalty_payment_object>
{
   static constexpr uint8_t space_id = MINT_HISTORY_SPACE_ID;
   static constexpr uint8_t type_id  = ROYALTY_PAYMENT_TYPE_ID;

   collectible_id_type collectible;
   account_id_type payer;
   account_id_type recipient;
   share_type amount;
   royalty_payment_kind kind = platform_fee_payment;
};

namespace detail
{
    class mint_history_impl;
}

/**
 * @brief Records the payments of every settled sale and answers queries about them
 *
 * Payments are recorded from the events of applied operations, so a failed
 * operation leaves no trace in the history.
 */
class mint_history
{
   public:
      mint_history();
      ~mint_history();

      std::string plugin_name()const;
      std::string plugin_description()const;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg);
      /**
       * @brief Attach the plugin to a database
       *
       * Must be called before the database is opened so that recorded payments are loaded with it.
       */
      void plugin_initialize(curio::chain::database& db, const boost::program_options::variables_map& options);
      void plugin_startup();
      void plugin_shutdown();

      curio::chain::database& database() const;

      /**
       * @brief Get the total amount paid to an account over all recorded sales
       * @param recipient Account ID
       * @return Sum of the recorded payments
       */
      share_type get_total_received(const account_id_type recipient) const;

      /**
       * @brief Get the total amount paid to an account
       * @param recipient_name Account name
       * @return Sum of the recorded payments
       */
      share_type get_total_received(const string recipient_name) const;

      /**
       * @brief Get the payments made to an account, oldest first
       * @param recipient Account ID
       * @param limit Maximum number of payments to return
       */
      vector<royalty_payment_object> get_payments_to(const account_id_type recipient, uint32_t limit = 100) const;

      /**
       * @brief Get the payments made for the sales of a collectible, oldest first
       */
      vector<royalty_payment_object> get_payments_by_collectible(const collectible_id_type collectible) const;

   private:
      void cleanup();
      curio::chain::database* _db = nullptr;
      boost::signals2::scoped_connection _applied_events_connection;
      std::unique_ptr<detail::mint_history_impl> my;
};

struct by_payment_recipient;
struct by_payment_collectible;
typedef multi_index_container <
   royalty_payment_object,
   indexed_by<
      ordered_unique < tag < by_id>, member<object, object_id_type, &object::id>>,
      ordered_unique <tag<by_payment_recipient>,
         composite_key< royalty_payment_object,
            member<royalty_payment_object, account_id_type, &royalty_payment_object::recipient>,
            member<object, object_id_type, &object::id>
         >
      >,
      ordered_unique <tag<by_payment_collectible>,
         composite_key< royalty_payment_object,
            member<royalty_payment_object, collectible_id_type, &royalty_payment_object::collectible>,
            member<object, object_id_type, &object::id>
         >
      >
   >
> royalty_payment_multi_index_type;

typedef generic_index <royalty_payment_object, royalty_payment_multi_index_type> royalty_payment_index;

} } //curio::mint_history

FC_REFLECT_ENUM( curio::mint_history::royalty_payment_kind,
                 (platform_fee_payment)(creator_share_payment)(single_creator_payment) )
FC_REFLECT_DERIVED( curio::mint_history::royalty_payment_object, (curio::db::object),
                    (collectible)(payer)(recipient)(amount)(kind) )
