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
#include <vector>
#include <utility>

#include <boost/multi_array.hpp>
#include <json/json.h>

#include "dimensions.hpp"
#include "skills.hpp"

// raw problem data, as stored in a problem file
struct ProblemData {
  std::vector<std::vector<Time>> T_t;	              // travel times between task locations
  std::vector<std::pair<unsigned,unsigned>> precedence; // (predecessor, successor) pairs
  std::vector<Time> T_e;			      // execution times
  std::vector<Location> locations;		      // task locations
  std::vector<std::vector<int>> R;		      // task requirements, binary
  std::vector<std::vector<int>> Q;		      // robot skills, binary

  void readJSON(std::istream&);	// read from stream in JSON format
  void readJSON(const Json::Value&);
  Json::Value toJSON() const;
};

struct Task {
  unsigned id;
  Time execution_time;
  Location location;
  BitVector requirements;
  bool is_dummy;
};

struct Robot {
  unsigned id;
  BitVector skills;

  bool hasSkills(const BitVector& required) const { return skills.covers(required); }
};

struct Instance {
  unsigned n = 0;		// number of tasks, including dummies
  unsigned m = 0;		// number of robots
  unsigned K = 0;		// number of skills

  std::vector<Task> tasks;
  std::vector<Robot> robots;
  boost::multi_array<Time,2> tt;	        // travel times; tt[i][j] from task i to task j
  std::vector<std::vector<unsigned>> pred;  // pred[j]: predecessors of task j, ascending

  Instance() {}
  Instance(const ProblemData& D) { build(D); }

  void build(const ProblemData&); // validate raw data and set up the model
  void readJSON(std::istream&);

  unsigned numRobots() const { return m; }
  std::vector<unsigned> realTasks() const; // ids of non-dummy tasks, ascending
  unsigned numRealTasks() const;
  Time travel(unsigned i, unsigned j) const { return tt[i][j]; }
  const std::vector<unsigned>& predecessors(unsigned j) const { return pred[j]; }
};

std::ostream& operator<<(std::ostream&, const Instance&);
