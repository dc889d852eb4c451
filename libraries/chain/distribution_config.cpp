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
#include <curio/chain/distribution_config.hpp>
#include <curio/chain/exceptions.hpp>

namespace curio { namespace chain {

void distribution_config::validate()const
{
   FC_ASSERT( platform_fee_bps <= CURIO_100_PERCENT,
              "Platform fee rate should not exceed CURIO_100_PERCENT, got ${r}", ("r", platform_fee_bps) );
}

void distribution_config::verify_unchanged( const distribution_config& saved )const
{
   CURIO_ASSERT( platform_fee_bps == saved.platform_fee_bps && platform_account == saved.platform_account,
                 distribution_config_mismatch,
                 "The configuration ${c} differs from the saved configuration ${s}",
                 ("c", *this)("s", saved) );
}

} } // curio::chain
