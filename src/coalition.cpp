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
#include "coalition.hpp"

#include <cassert>
using namespace std;

#include "util.hpp"

string to_string(CoalitionStatus s) {
  switch (s) {
  case CoalitionStatus::Empty:      return "empty";
  case CoalitionStatus::Found:      return "found";
  case CoalitionStatus::Infeasible: return "infeasible";
  }
  return "unknown";
}

BitVector Coalition::skills(const vector<Robot>& R) const {
  BitVector result;
  for(unsigned r : robots)
    result.merge(R[r].skills);
  return result;
}

Coalition findCoalition(const Task& task, const vector<Robot>& robots) {
  Coalition C;

  // (1) nothing required
  const BitVector& required = task.requirements;
  if (!required.any())
    return C;

  C.status = CoalitionStatus::Found;

  // (2) a single robot suffices
  for(const auto& r : robots)
    if (r.hasSkills(required)) {
      C.robots.push_back(r.id);
      return C;
    }

  // (3) greedy set cover
  BitVector uncovered = required;
  BitVector pool(robots.size(),true);
  while (uncovered.any()) {
    size_t best = 0, bestr = robots.size();
    for(size_t r=0, re=robots.size(); r!=re; r++) {
      if (!pool[r])
	continue;
      size_t covered = robots[r].skills.overlap(uncovered);
      if (covered>best) {
	best = covered;
	bestr = r;
      }
    }
    if (best==0) {
      vprint(3,"Task {}: requirements {} not covered by any remaining robot.\n",task.id,uncovered.to_string());
      C.status = CoalitionStatus::Infeasible;
      C.robots.clear();
      return C;
    }
    assert(bestr<robots.size());
    C.robots.push_back(robots[bestr].id);
    uncovered.remove(robots[bestr].skills);
    pool[bestr]=false;
  }
  return C;
}
