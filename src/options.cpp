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
#include "options.hpp"

#include <iostream>
using namespace std;

#include <sys/ioctl.h>
#include <unistd.h>

#include "util.hpp"
#include "version.hpp"

Options opt;

unsigned terminal_width() {
  struct winsize wsize{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &wsize)==0 && wsize.ws_col>40)
    return wsize.ws_col;
  return po::options_description::m_default_line_length;
}

bool process_options(int argc, char *argv[], Options& opt, po::variables_map& vm) {
  po::options_description desc("General options",terminal_width());
  desc.add_options()
    ("help",                                                                        "Show help.")
    ("version",                                                                     "Show version.")
    ("verbose,v",        po::value(&verbosec)->zero_tokens(),                       "Verbosity. If present, output is sent to screen. If -v is repeated, more output is given.")
    ("start_instance",   po::value<int>(&opt.first)->default_value(0),         "The starting ID of the problem instance to benchmark.")
    ("end_instance",     po::value<int>(&opt.last)->default_value(9),          "The ending ID of the problem instance to benchmark (inclusive).")
    ("base",             po::value<string>(&opt.base)->default_value("."),          "Dataset root, containing problem_instances/ and solutions/.")
    ("output",           po::value<string>(&opt.output)->default_value(""),         "Directory for the heuristic schedules (empty: none).")
    ("check",            po::bool_switch(&opt.check)->default_value(false),         "Verify the heuristic schedules.")
    ("show",             po::bool_switch(&opt.show)->default_value(false),          "Show the heuristic schedules.")
    ;

  po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
  po::notify(vm);

  if (vm.count("version")) {
    cout << version << endl;
    return false;
  }

  if (vm.count("help")) {
    cout << desc << endl;
    return false;
  }

  return true;
}
