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
#include "schedule.hpp"

#include <algorithm>
#include <sstream>
using namespace std;

#include "ff.hpp"
#include "util.hpp"

string Schedule::to_string() const {
  string s = "\n";

  const int wd = 7;
  for(unsigned r=0; r!=n_robots; r++) {
    Time last = robot[r].size()>0 ? robot[r].back().end : 0.0;
    auto line = fmt::format("robot {:3} ", r);
    if (robot[r].size()>0 && ff(last)==ff(makespan))
      s += fmt::format("{}", fmt::styled(line, fmt::fg(fmt::color::red)));
    else
      s += line;
    for(const auto& a : robot[r])
      s += fmt::format(" {:3}[{:{}.2f},{:{}.2f}]", a.task, a.start, wd, a.end, wd);
    s += "\n";
  }
  if (!complete())
    s += fmt::format("unscheduled {}\n", fmt::join(pending, " "));
  s += fmt::format("{} tasks, {} robots, makespan {:.2f}\n", n_tasks, n_robots, makespan);
  return s;
}

Json::Value Schedule::toJSON() const {
  Json::Value root(Json::objectValue);
  root["makespan"] = makespan;
  root["n_tasks"] = n_tasks;
  root["n_robots"] = n_robots;

  Json::Value schedules(Json::objectValue);
  for(unsigned r=0; r!=n_robots; r++) {
    Json::Value entries(Json::arrayValue);
    for(const auto& a : robot[r]) {
      Json::Value e(Json::objectValue);
      e["task"] = a.task;
      e["start_time"] = a.start;
      e["end_time"] = a.end;
      entries.append(e);
    }
    schedules[std::to_string(r)] = entries;
  }
  root["robot_schedules"] = schedules;

  if (!complete()) {
    Json::Value unscheduled(Json::arrayValue);
    for(unsigned t : pending)
      unscheduled.append(t);
    root["unscheduled"] = unscheduled;
  }
  return root;
}

vector<string> Schedule::check() const {
  vector<string> v;

  // (1) tasks: either scheduled or pending, covered, after their predecessors
  for(unsigned t : I->realTasks()) {
    bool is_pending = find(pending.begin(),pending.end(),t)!=pending.end();
    if (scheduled(t)==is_pending) {
      v.push_back(fmt::format("task {} is {} scheduled and pending", t, is_pending?"both":"neither"));
      continue;
    }
    if (is_pending)
      continue;

    const Task& task = I->tasks[t];
    BitVector skills;
    for(unsigned r : coalition[t])
      skills.merge(I->robots[r].skills);
    if (!skills.covers(task.requirements))
      v.push_back(fmt::format("coalition {{{}}} of task {} misses required skills", fmt::join(coalition[t],","), t));

    if (ff(finish[t])!=ff(start[t]+task.execution_time))
      v.push_back(fmt::format("task {} finishes at {}, expected {}", t, finish[t], start[t]+task.execution_time));

    for(unsigned p : I->predecessors(t)) {
      Time fp = p==depot ? 0.0 : finish[p];
      if (p!=depot && !scheduled(p))
	v.push_back(fmt::format("task {} scheduled before its predecessor {}", t, p));
      else if (ff(start[t])<ff(fp))
	v.push_back(fmt::format("task {} starts at {} before predecessor {} finishes at {}", t, start[t], p, fp));
    }
  }

  // (2) robots: consecutive tasks leave enough time to travel
  Time last = 0.0;
  for(unsigned r=0; r!=n_robots; r++) {
    unsigned at = depot;
    Time free = 0.0;
    for(const auto& a : robot[r]) {
      if (!scheduled(a.task) || a.start!=start[a.task] || a.end!=finish[a.task])
	v.push_back(fmt::format("robot {}: entry for task {} disagrees with the task record", r, a.task));
      if (ff(a.start)<ff(free+I->travel(at,a.task)))
	v.push_back(fmt::format("robot {}: task {} starts at {} before arrival at {}", r, a.task, a.start, free+I->travel(at,a.task)));
      at = a.task;
      free = a.end;
    }
    last = max(last,free);
  }

  // (3) makespan
  if (ff(last)!=ff(makespan))
    v.push_back(fmt::format("makespan {} differs from last robot finish time {}", makespan, last));
  return v;
}

ostream& operator<<(ostream &o, const Schedule& s) {
  return o << s.to_string();
}
