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
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "instance.hpp"
#include "problems.hpp"

namespace {

const char* problem_json = R"({
  "T_t": [[0, 2, 3, 0], [2, 0, 1, 2], [3, 1, 0, 3], [0, 2, 3, 0]],
  "precedence_constraints": [[0, 1], [0, 2], [1, 2], [0, 2], [1, 3], [2, 3]],
  "T_e": [0, 5, 2.5, 0],
  "task_locations": [[0, 0], [2, 0], [3, 0], [0, 0]],
  "R": [[0, 0], [1, 0], [1, 1], [0, 0]],
  "Q": [[1, 0], [0, 1], [1, 1]]
})";

TEST(Instance, ModelFromProblemData) {
  Instance I(scenarioB());
  EXPECT_EQ(I.n,4u);
  EXPECT_EQ(I.numRobots(),2u);
  EXPECT_EQ(I.K,2u);
  EXPECT_TRUE(I.tasks[0].is_dummy);
  EXPECT_FALSE(I.tasks[1].is_dummy);
  EXPECT_FALSE(I.tasks[2].is_dummy);
  EXPECT_TRUE(I.tasks[3].is_dummy);
  EXPECT_EQ(I.realTasks(),(std::vector<unsigned>{1,2}));
  EXPECT_EQ(I.numRealTasks(),2u);
  EXPECT_DOUBLE_EQ(I.travel(1,2),3.0);
  EXPECT_DOUBLE_EQ(I.travel(2,1),3.0);
  EXPECT_EQ(I.predecessors(3),(std::vector<unsigned>{1,2}));
  EXPECT_TRUE(I.predecessors(0).empty());
  EXPECT_TRUE(I.robots[0].hasSkills(I.tasks[0].requirements));
  EXPECT_FALSE(I.robots[0].hasSkills(I.tasks[2].requirements));
}

TEST(Instance, DepotAloneIsTheOnlyDummy) {
  Instance I(makeProblem({0}, {{0}}, {{1}}));
  EXPECT_TRUE(I.tasks[0].is_dummy);
  EXPECT_TRUE(I.realTasks().empty());
}

TEST(Instance, ReadJSON) {
  std::istringstream in(problem_json);
  Instance I;
  I.readJSON(in);
  EXPECT_EQ(I.n,4u);
  EXPECT_EQ(I.m,3u);
  EXPECT_EQ(I.K,2u);
  EXPECT_DOUBLE_EQ(I.tasks[2].execution_time,2.5);
  EXPECT_DOUBLE_EQ(I.tasks[2].location.first,3.0);
  EXPECT_EQ(I.tasks[2].requirements.to_string(),"11");
  EXPECT_EQ(I.robots[1].skills.to_string(),"01");
  // duplicates are dropped, predecessors sorted
  EXPECT_EQ(I.predecessors(2),(std::vector<unsigned>{0,1}));
  EXPECT_DOUBLE_EQ(I.travel(0,2),3.0);
}

TEST(Instance, MissingPrecedencesMeanNoConstraints) {
  std::istringstream in(R"({"T_t": [[0,1],[1,0]], "T_e": [0,0], "task_locations": [[0,0],[1,1]], "R": [[0],[0]], "Q": [[1]]})");
  Instance I;
  I.readJSON(in);
  EXPECT_TRUE(I.predecessors(1).empty());
}

TEST(Instance, InvalidJSONIsRejected) {
  std::istringstream broken("{\"T_t\": [[0]");
  Instance I;
  EXPECT_THROW(I.readJSON(broken),std::runtime_error);

  std::istringstream wrongtype(R"({"T_t": 5})");
  EXPECT_THROW(I.readJSON(wrongtype),std::runtime_error);

  std::istringstream badpair(R"({"T_e": [0], "precedence_constraints": [[0, 1, 2]]})");
  EXPECT_THROW(I.readJSON(badpair),std::runtime_error);
}

TEST(Instance, InconsistentDataIsRejected) {
  ProblemData D = scenarioB();

  ProblemData D1 = D;
  D1.T_t.pop_back();
  EXPECT_THROW(Instance{D1},std::runtime_error);

  ProblemData D2 = D;
  D2.T_t[2].push_back(0.0);
  EXPECT_THROW(Instance{D2},std::runtime_error);

  ProblemData D3 = D;
  D3.R[1].push_back(1);
  EXPECT_THROW(Instance{D3},std::runtime_error);

  ProblemData D4 = D;
  D4.Q[1] = {1};
  EXPECT_THROW(Instance{D4},std::runtime_error);

  ProblemData D5 = D;
  D5.Q[0][0] = 2;
  EXPECT_THROW(Instance{D5},std::runtime_error);

  ProblemData D6 = D;
  D6.precedence.emplace_back(1,7);
  EXPECT_THROW(Instance{D6},std::runtime_error);

  ProblemData D7 = D;
  D7.precedence.emplace_back(2,2);
  EXPECT_THROW(Instance{D7},std::runtime_error);

  ProblemData D8 = D;
  D8.T_e[1] = -1.0;
  EXPECT_THROW(Instance{D8},std::runtime_error);

  ProblemData D9 = D;
  D9.locations.pop_back();
  EXPECT_THROW(Instance{D9},std::runtime_error);

  ProblemData D10 = D;
  D10.T_t[0][1] = -2.0;
  EXPECT_THROW(Instance{D10},std::runtime_error);
}

TEST(Instance, ErrorMessagesNameTheProblem) {
  ProblemData D = scenarioB();
  D.R[2] = {1};
  try {
    Instance I(D);
    FAIL() << "expected an exception";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("task 2"),std::string::npos) << e.what();
  }
}

TEST(Instance, JSONWriteAndReadAgree) {
  std::istringstream in(problem_json);
  ProblemData D;
  D.readJSON(in);

  ProblemData E;
  E.readJSON(D.toJSON());
  EXPECT_EQ(E.T_t,D.T_t);
  EXPECT_EQ(E.precedence,D.precedence);
  EXPECT_EQ(E.T_e,D.T_e);
  EXPECT_EQ(E.locations,D.locations);
  EXPECT_EQ(E.R,D.R);
  EXPECT_EQ(E.Q,D.Q);
}

TEST(Instance, Printing) {
  Instance I(scenarioA());
  std::ostringstream out;
  out << I;
  EXPECT_NE(out.str().find("3 tasks, 2 robots, 1 skills"),std::string::npos) << out.str();
  EXPECT_NE(out.str().find("robot   0 [1]"),std::string::npos) << out.str();
}

}
