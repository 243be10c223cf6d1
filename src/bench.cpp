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
#include <iostream>
#include <cstdlib>
#include <filesystem>
namespace fs = std::filesystem;
using namespace std;

#include "util.hpp"
#include "options.hpp"
#include "instance.hpp"
#include "schedule.hpp"
#include "benchmark.hpp"

int main(int argc, char *argv[]) {
  // (0) process commandline
  S.start = Clock::now();
  S.iter = 0;

  po::variables_map vm;
  try {
    if (!process_options(argc,argv,opt,vm))
      return vm.count("help") || vm.count("version") ? 0 : 1;
  } catch (const po::error& e) {
    cerr << e.what() << endl;
    return 1;
  }

  if (opt.output.size()>0) {
    std::error_code ec;
    fs::create_directories(opt.output,ec);
    if (ec) {
      cerr << "Cannot create output directory " << opt.output << ": " << ec.message() << endl;
      return 1;
    }
  }

  fmt::print("--- Running Benchmark for Instances {} to {} ---\n",opt.first,opt.last);
  vprint(1,"Started at {}, {} instances.\n",get_date_string(S.start),opt.count());

  // (1) run all instances
  Benchmark B;
  bool invalid = false;
  for(long i=opt.first; i<=opt.last; i++) {
    fmt::print("\nProcessing instance {}...\n",i);

    Instance I;
    Time optimal;
    if (!loadInstance(i,opt.base,I,optimal)) {
      fmt::print("Skipping instance {} due to missing data.\n",i);
      continue;
    }
    vtprint(1,fg(fmt::color::green),"Instance read.\n");
    vprint(3,"{}",fmt::streamed(I));

    Schedule H(I);
    Record r = B.run(i,I,optimal,&H);

    fmt::print("  Optimal Makespan: {:.2f}\n",r.optimal);
    fmt::print("  Heuristic Makespan: {:.2f} (Ratio: {:.3f})\n",r.heuristic,r.ratio);
    fmt::print("  Time taken: {:.4f}s\n",r.duration);
    if (!r.complete)
      fmt::print(fg(fmt::color::red),"  Incomplete: {} tasks unscheduled.\n",H.pending.size());

    if (opt.show)
      cout << H;

    if (opt.check) {
      auto violations = H.check();
      for(const auto& v : violations)
	fmt::print(cerr,"  Invalid schedule: {}\n",v);
      invalid = invalid || violations.size()>0;
      vtprint(1,"Schedule is {}.\n",violations.size()>0?"invalid":"valid");
    }

    if (opt.output.size()>0) {
      try {
	writeSchedule(H,scheduleFile(opt.output,i));
      } catch (const exception& e) {
	cerr << e.what() << endl;
	return 1;
      }
    }
  }

  // (2) summary
  fmt::print("{}",B.summary());
  vprint(1,"Total {} scheduling rounds in {:.2f}s.\n",S.iter,S.elapsed());
  return invalid ? 2 : 0;
}
