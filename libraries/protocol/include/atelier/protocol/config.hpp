/*
 * Copyright (c) 2020-2023 Revolution Populi Limited, and contributors.
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

#define ATELIER_SYMBOL "ART"
#define ATELIER_BLOCKCHAIN_PRECISION                          uint64_t( 100000 )
#define ATELIER_BLOCKCHAIN_PRECISION_DIGITS                   5
#define ATELIER_MAX_SHARE_SUPPLY                              int64_t(1000000000000000ll)

#define ATELIER_MAX_NESTED_OBJECTS                            (200)

/** royalties are expressed in whole percent */
#define ATELIER_100_PERCENT                                   100
/** the platform fee is expressed in tenths of a percent */
#define ATELIER_PLATFORM_FEE_DENOMINATOR                      1000
#define ATELIER_DEFAULT_PLATFORM_FEE                          25
#define ATELIER_MAX_PLATFORM_FEE                              100

#define ATELIER_MIN_REVIEW_RATING                             1
#define ATELIER_MAX_REVIEW_RATING                             5

#define ATELIER_DEFAULT_API_LIMIT_GET_EVENTS                  100
#define ATELIER_DEFAULT_ADMINISTRATOR                         "registry-admin"
