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

#define CURIO_100_PERCENT                       10000
#define CURIO_1_PERCENT                         (CURIO_100_PERCENT/100)
#define CURIO_DEFAULT_PLATFORM_FEE_BPS          (10*CURIO_1_PERCENT)

/// Royalty shares are whole percentages of the amount left after the platform fee
#define CURIO_ROYALTY_PERCENT_DENOMINATOR       100
#define CURIO_MAX_ROYALTY_SHARES                10

/// Number of units issued to the holding account by a mint
#define CURIO_MINT_UNITS                        1

#define CURIO_MAX_NESTED_OBJECTS                CURIO_DB_MAX_NESTED_OBJECTS
