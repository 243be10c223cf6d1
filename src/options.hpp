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
#pragma once

#include <string>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

// global options
struct Options {
  int first, last;	  // range of instance ids (inclusive)
  std::string base;	  // dataset root, with problem_instances/ and solutions/
  std::string output;	  // directory for heuristic schedules (empty: don't write)
  bool check;		  // verify the heuristic schedules
  bool show;		  // print the heuristic schedules

  // number of instance ids in [first,last]
  long count() const { return last>=first ? long(last)-first+1 : 0; }
};

extern Options opt;

// process commandline options, return false, if the program should stop
bool process_options(int, char *[], Options&, po::variables_map&);

// width for help output
unsigned terminal_width();
