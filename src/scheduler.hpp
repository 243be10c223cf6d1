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

#include <vector>

#include "instance.hpp"
#include "coalition.hpp"
#include "schedule.hpp"

// a possible assignment of a ready task
struct Candidate {
  unsigned task;
  Coalition coalition;
  Time start, finish;
};

/*
  Coalition-aware greedy list scheduling.

  In each round every ready task (all predecessors scheduled) gets a
  coalition and an earliest start time: when the last member has arrived
  and all predecessors have finished. The candidate with the smallest
  finish time (ties: lowest task id) is committed. The loop stops when all
  real tasks are scheduled, or when no ready task has a feasible coalition;
  then the remaining tasks stay in `Schedule::pending`.
*/
struct ListScheduler {
  const Instance& I;

  // scheduling state
  std::vector<Time> available;	  // available[r]: time robot r becomes free
  std::vector<unsigned> location; // location[r]: last task of robot r
  BitVector done;		  // done[t]: task t is scheduled
  std::vector<Time> finish;	  // finish times of scheduled tasks

  ListScheduler(const Instance& I) : I(I) {}

  void reset();
  bool ready(unsigned t) const;
  bool evaluate(unsigned t, Candidate& c) const; // false, if there's no feasible coalition
  void commit(const Candidate& c, Schedule& S);
  Schedule run();
};

Schedule greedyHeuristic(const Instance&);
