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
/*
 * Generate random instances for the coalition scheduling benchmark.
 * The instance is written to standard output in the problem file format.
 */

#include <iostream>
using namespace std;

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "util.hpp"
#include "options.hpp"
#include "random.hpp"
#include "generator.hpp"
using namespace crta;

bool process_options(int argc, char *argv[], GeneratorParams& P, po::variables_map& vm) {
  po::options_description desc("Options",terminal_width());
  desc.add_options()
    ("help",                                                                 "Show help.")
    ("verbose,v",  po::value(&verbosec)->zero_tokens(),                      "Verbosity. If present, output is sent to screen. If -v is repeated, more output is given.")
    ("seed",       po::value<unsigned>()->default_value(1),                  "Random seed (0: acquire from random source).")
    ("tasks",      po::value<unsigned>(&P.tasks)->default_value(P.tasks),    "Number of real tasks.")
    ("robots",     po::value<unsigned>(&P.robots)->default_value(P.robots),  "Number of robots.")
    ("skills",     po::value<unsigned>(&P.skills)->default_value(P.skills),  "Number of skills.")
    ("density",    po::value<double>(&P.density)->default_value(P.density),  "Probability of a precedence between two tasks.")
    ("grid",       po::value<unsigned>(&P.grid)->default_value(P.grid),      "Side of the square of task locations.")
    ("speed",      po::value<double>(&P.speed)->default_value(P.speed),      "Robot speed (distance per time unit).")
    ("preq",       po::value<double>(&P.preq)->default_value(P.preq),        "Probability that a task requires a skill.")
    ("pskill",     po::value<double>(&P.pskill)->default_value(P.pskill),    "Probability that a robot has a skill.")
    ("tmax",       po::value<unsigned>(&P.tmax)->default_value(P.tmax),      "Largest execution time.")
    ;

  po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    cout << desc << endl;
    return false;
  }
  return true;
}

int main(int argc, char *argv[]) {
  // (0) process commandline
  GeneratorParams P;
  po::variables_map vm;
  try {
    if (!process_options(argc,argv,P,vm))
      return vm.count("help") ? 0 : 1;
  } catch (const po::error& e) {
    cerr << e.what() << endl;
    return 1;
  }

  // (1) random seed
  unsigned seed = setupRandom(vm["seed"].as<unsigned>());
  vprint(1,cerr,"Seed {}.\n",seed);

  // (2) generate and write the instance
  try {
    ProblemData D = generateInstance(P);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    cout << Json::writeString(builder, D.toJSON()) << endl;
  } catch (const exception& e) {
    cerr << "Failed to generate instance: " << e.what() << endl;
    return 1;
  }
}
