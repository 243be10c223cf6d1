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
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "benchmark.hpp"
#include "scheduler.hpp"
#include "problems.hpp"

namespace {

namespace fs = std::filesystem;

// dataset directory with the layout of the benchmark files
struct Dataset : public ::testing::Test {
  fs::path base;

  void SetUp() override {
    base = fs::path(::testing::TempDir()) / ("crta_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(base);
    fs::create_directories(base / "problem_instances");
    fs::create_directories(base / "solutions");
  }
  void TearDown() override {
    fs::remove_all(base);
  }
  void write(const std::string& filename, const std::string& content) {
    std::ofstream out(filename);
    out << content;
  }
  void writeProblem(int id, const ProblemData& D) {
    Json::StreamWriterBuilder builder;
    write(problemFile(base.string(),id), Json::writeString(builder, D.toJSON()));
  }
  void writeOptimal(int id, Time makespan) {
    write(solutionFile(base.string(),id), "{\"makespan\": " + std::to_string(makespan) + ", \"robot_schedules\": {}}");
  }
};

TEST(Benchmark, FileNames) {
  EXPECT_EQ(problemFile(".",7),"./problem_instances/problem_instance_1p_000007.json");
  EXPECT_EQ(solutionFile("data",123456),"data/solutions/optimal_schedule_1p_123456.json");
  EXPECT_EQ(scheduleFile("out",42),"out/heuristic_schedule_1p_000042.json");
}

TEST(Benchmark, NegativeIdsKeepTheirSign) {
  EXPECT_EQ(problemFile(".",-3),"./problem_instances/problem_instance_1p_-00003.json");
}

TEST(Benchmark, Ratio) {
  EXPECT_DOUBLE_EQ(makespanRatio(7,7),1.0);
  EXPECT_DOUBLE_EQ(makespanRatio(6,4),1.5);
  EXPECT_DOUBLE_EQ(makespanRatio(0,0),1.0);
  EXPECT_TRUE(std::isinf(makespanRatio(3,0)));
}

TEST(Benchmark, ReadOptimal) {
  std::istringstream good("{\"makespan\": 12.5}");
  EXPECT_DOUBLE_EQ(readOptimal(good),12.5);

  std::istringstream missing("{\"robot_schedules\": {}}");
  EXPECT_THROW(readOptimal(missing),std::runtime_error);

  std::istringstream broken("{\"makespan\": ");
  EXPECT_THROW(readOptimal(broken),std::runtime_error);
}

TEST(Benchmark, RunRecordsResults) {
  Instance IA(scenarioA()), IC(scenarioC());
  Benchmark B;
  EXPECT_NE(B.summary().find("No instances were processed."),std::string::npos);

  Schedule S(IA);
  Record a = B.run(1,IA,7.0,&S);
  EXPECT_EQ(a.id,1);
  EXPECT_DOUBLE_EQ(a.heuristic,7.0);
  EXPECT_DOUBLE_EQ(a.ratio,1.0);
  EXPECT_TRUE(a.complete);
  EXPECT_DOUBLE_EQ(S.makespan,7.0);
  EXPECT_TRUE(S.scheduled(1));

  Record c = B.run(3,IC,1.0);
  EXPECT_FALSE(c.complete);
  EXPECT_DOUBLE_EQ(c.ratio,2.0);

  EXPECT_EQ(B.size(),2u);
  EXPECT_DOUBLE_EQ(B.averageRatio(),1.5);
  EXPECT_GE(B.averageDuration(),0.0);

  std::string s = B.summary();
  EXPECT_NE(s.find("Processed 2 instances."),std::string::npos) << s;
  EXPECT_NE(s.find("Average Heuristic/Optimal Ratio: 1.5000"),std::string::npos) << s;
}

TEST_F(Dataset, LoadInstance) {
  writeProblem(5,scenarioB());
  writeOptimal(5,11.0);

  Instance I;
  Time optimal = 0;
  ASSERT_TRUE(loadInstance(5,base.string(),I,optimal));
  EXPECT_EQ(I.n,4u);
  EXPECT_DOUBLE_EQ(optimal,11.0);
  EXPECT_DOUBLE_EQ(greedyHeuristic(I).makespan,12.0);
}

TEST_F(Dataset, MissingFilesAreReported) {
  Instance I;
  Time optimal = 0;
  ::testing::internal::CaptureStderr();
  EXPECT_FALSE(loadInstance(1,base.string(),I,optimal));
  std::string err = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Problem file not found"),std::string::npos) << err;

  writeProblem(1,scenarioA());
  ::testing::internal::CaptureStderr();
  EXPECT_FALSE(loadInstance(1,base.string(),I,optimal));
  err = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Solution file not found"),std::string::npos) << err;
}

TEST_F(Dataset, InvalidFilesAreReported) {
  write(problemFile(base.string(),2),"{\"T_e\": [0, 1]}");
  writeOptimal(2,1.0);
  Instance I;
  Time optimal = 0;
  ::testing::internal::CaptureStderr();
  EXPECT_FALSE(loadInstance(2,base.string(),I,optimal));
  std::string err = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Failed to read"),std::string::npos) << err;
}

TEST_F(Dataset, WriteSchedule) {
  Instance I(scenarioB());
  Schedule S = greedyHeuristic(I);
  std::string filename = scheduleFile(base.string(),5);
  writeSchedule(S,filename);

  std::ifstream in(filename);
  ASSERT_TRUE(in.is_open());
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  ASSERT_TRUE(Json::parseFromStream(builder,in,&root,&errs)) << errs;
  EXPECT_DOUBLE_EQ(root["makespan"].asDouble(),12.0);
  EXPECT_EQ(root["robot_schedules"]["1"].size(),2u);

  EXPECT_THROW(writeSchedule(S,(base / "missing" / "x.json").string()),std::runtime_error);
}

}
