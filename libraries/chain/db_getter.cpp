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

#include <curio/chain/collectible_object.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

const collectible_object& database::get_collectible( collectible_id_type id )const
{
   const collectible_object* collectible = find<collectible_object>( id );
   CURIO_ASSERT( collectible != nullptr, unknown_collectible, "Collectible ${c} does not exist", ("c", id) );
   return *collectible;
}

const royalty_schedule_object* database::find_royalty_schedule( collectible_id_type collectible )const
{
   const auto& schedules = get_index_type<royalty_schedule_index>().indices().get<by_collectible>();
   auto itr = schedules.find( collectible );
   if( itr == schedules.end() )
      return nullptr;
   return &*itr;
}

const royalty_schedule_object& database::get_royalty_schedule( collectible_id_type collectible )const
{
   const royalty_schedule_object* schedule = find_royalty_schedule( collectible );
   CURIO_ASSERT( schedule != nullptr, royalty_schedule_not_found,
                 "No royalty schedule is recorded for collectible ${c}", ("c", collectible) );
   return *schedule;
}

const collectible_holding_object* database::find_holding( account_id_type owner, collectible_id_type collectible )const
{
   const auto& holdings = get_index_type<collectible_holding_index>().indices().get<by_owner_collectible>();
   auto itr = holdings.find( boost::make_tuple( owner, collectible ) );
   if( itr == holdings.end() )
      return nullptr;
   return &*itr;
}

share_type database::get_holding( account_id_type owner, collectible_id_type collectible )const
{
   const collectible_holding_object* holding = find_holding( owner, collectible );
   if( holding == nullptr )
      return 0;
   return holding->amount;
}

} } // curio::chain
