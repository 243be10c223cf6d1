/*
 * Copyright (c) 2023 Jordi Pereira, Marcus Ritt
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "options.hpp"

namespace {

bool parse(std::vector<std::string> args, Options& o) {
  std::vector<char*> argv;
  for(auto& a : args)
    argv.push_back(&a[0]);
  po::variables_map vm;
  return process_options(argv.size(),argv.data(),o,vm);
}

TEST(Options, Defaults) {
  Options o;
  ASSERT_TRUE(parse({"crta-bench"},o));
  EXPECT_EQ(o.first,0);
  EXPECT_EQ(o.last,9);
  EXPECT_EQ(o.count(),10);
  EXPECT_EQ(o.base,".");
  EXPECT_TRUE(o.output.empty());
  EXPECT_FALSE(o.check);
  EXPECT_FALSE(o.show);
}

TEST(Options, NegativeEndGivesAnEmptyRange) {
  Options o;
  ASSERT_TRUE(parse({"crta-bench","--start_instance=5","--end_instance=-1"},o));
  EXPECT_EQ(o.first,5);
  EXPECT_EQ(o.last,-1);
  EXPECT_EQ(o.count(),0);
}

TEST(Options, ReversedRangeIsEmpty) {
  Options o;
  ASSERT_TRUE(parse({"crta-bench","--start_instance","4","--end_instance","3"},o));
  EXPECT_EQ(o.count(),0);
  ASSERT_TRUE(parse({"crta-bench","--start_instance","3","--end_instance","3","--check"},o));
  EXPECT_EQ(o.count(),1);
  EXPECT_TRUE(o.check);
}

TEST(Options, BadValuesAreRejected) {
  Options o;
  EXPECT_THROW(parse({"crta-bench","--end_instance","many"},o),po::error);
  EXPECT_THROW(parse({"crta-bench","--unknown"},o),po::error);
}

}
