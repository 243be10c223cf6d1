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
#include "scheduler.hpp"

#include <algorithm>
using namespace std;

#include "util.hpp"

void ListScheduler::reset() {
  available.assign(I.m,0.0);
  location.assign(I.m,depot);
  done.assign(I.n,false);
  finish.assign(I.n,inf_time);
  if (I.n>0) {
    done[depot]=true;
    finish[depot]=0.0;
  }
}

bool ListScheduler::ready(unsigned t) const {
  for(unsigned p : I.predecessors(t))
    if (!done[p])
      return false;
  return true;
}

bool ListScheduler::evaluate(unsigned t, Candidate& c) const {
  const Task& task = I.tasks[t];

  Time pred_finish = 0.0;
  for(unsigned p : I.predecessors(t))
    pred_finish = max(pred_finish,finish[p]);

  c.task = t;
  c.coalition = findCoalition(task,I.robots);
  if (!c.coalition.feasible())
    return false;

  // the coalition is ready when its last member arrives
  Time arrival = 0.0;
  for(unsigned r : c.coalition.robots)
    arrival = max(arrival,available[r]+I.travel(location[r],t));

  c.start = max(arrival,pred_finish);
  c.finish = c.start+task.execution_time;
  return true;
}

void ListScheduler::commit(const Candidate& c, Schedule& S) {
  for(unsigned r : c.coalition.robots) {
    available[r] = c.finish;
    location[r] = c.task;
    S.robot[r].push_back({c.task,c.start,c.finish});
  }
  done[c.task] = true;
  finish[c.task] = c.finish;

  S.start[c.task] = c.start;
  S.finish[c.task] = c.finish;
  S.coalition[c.task] = c.coalition.robots;
  S.order.push_back(c.task);
  vprint(2,"Task {:3} by {{{}}} in [{:.2f},{:.2f}].\n",c.task,fmt::join(c.coalition.robots,","),c.start,c.finish);
}

Schedule ListScheduler::run() {
  reset();
  Schedule S(I);

  vector<unsigned> pending = I.realTasks();
  while (pending.size()>0) {
    ::S.iter++;

    // (1) evaluate all ready tasks, keep the earliest finish
    Candidate best, c;
    bool found = false;
    unsigned nready = 0;
    for(unsigned t : pending) {
      if (!ready(t))
	continue;
      nready++;
      if (!evaluate(t,c))
	continue;
      if (!found || c.finish<best.finish) {
	best = c;
	found = true;
      }
    }
    vprint(3,"{} pending, {} ready tasks.\n",pending.size(),nready);

    // (2) no progress: the remaining tasks cannot be done
    if (!found) {
      warn("Heuristic failed. Could not find a valid assignment for remaining tasks {}.\n",fmt::join(pending,","));
      S.pending = pending;
      break;
    }

    vprint(3,"Best task {} finishes at {:.2f}.\n",best.task,best.finish);

    // (3) commit the best assignment
    commit(best,S);
    pending.erase(find(pending.begin(),pending.end(),best.task));
  }

  S.makespan = available.size()>0 ? *max_element(available.begin(),available.end()) : 0.0;
  return S;
}

Schedule greedyHeuristic(const Instance& I) {
  ListScheduler L(I);
  return L.run();
}
