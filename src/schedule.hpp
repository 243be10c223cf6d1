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

#include <iostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "instance.hpp"

// one task in the timeline of a robot
struct Assignment {
  unsigned task;
  Time start, end;
  bool operator==(const Assignment& o) const { return task==o.task && start==o.start && end==o.end; }
};

struct Schedule {
  const Instance* I;
  Time makespan = 0.0;
  unsigned n_tasks = 0, n_robots = 0;

  std::vector<std::vector<Assignment>> robot;   // robot[r]: assignments of robot r, in order
  std::vector<Time> start, finish;              // per task; inf_time if not scheduled
  std::vector<std::vector<unsigned>> coalition; // per task
  std::vector<unsigned> order;		        // tasks in order of commitment
  std::vector<unsigned> pending;	        // real tasks left unscheduled after a stall

  Schedule(const Instance& I) : I(&I), n_tasks(I.numRealTasks()), n_robots(I.m), robot(I.m), start(I.n,inf_time), finish(I.n,inf_time), coalition(I.n) {}

  bool complete() const { return pending.empty(); }
  bool scheduled(unsigned t) const { return finish[t]!=inf_time; }

  std::string to_string() const;
  Json::Value toJSON() const;
  // list of violated constraints, empty for a valid schedule
  std::vector<std::string> check() const;
};

std::ostream& operator<<(std::ostream&, const Schedule&);
