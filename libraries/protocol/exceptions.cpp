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
#include <curio/protocol/exceptions.hpp>

namespace curio { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( royalty_schedule_exception, protocol_exception, 4010000,
                                   "invalid royalty schedule" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( no_creators,                royalty_schedule_exception, 4010001,
                                   "NoCreators" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( too_many_creators,          royalty_schedule_exception, 4010002,
                                   "TooManyCreators" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_creator_percentage, royalty_schedule_exception, 4010003,
                                   "InvalidCreatorPercentage" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_split_percentage,   royalty_schedule_exception, 4010004,
                                   "InvalidSplitPercentage" )

} } // curio::protocol
