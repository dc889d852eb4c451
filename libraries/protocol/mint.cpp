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
#include <curio/protocol/mint.hpp>

namespace curio {
   namespace protocol {
      void mint_operation::validate() const {
         FC_ASSERT(sale_amount >= 0, "Sale amount should not be negative");
         FC_ASSERT(!metadata_reference.empty(), "A mint requires a metadata reference");
      }

      void mint_collaborative_operation::validate() const {
         FC_ASSERT(sale_amount >= 0, "Sale amount should not be negative");
         if (!collectible.valid()) {
            FC_ASSERT(!metadata_reference.empty(), "A first mint requires a metadata reference");
         }
      }

      void royalty_distribute_operation::validate() const {
         FC_ASSERT(sale_amount >= 0, "Sale amount should not be negative");
      }
   }
}
