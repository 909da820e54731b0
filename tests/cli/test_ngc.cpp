// test_ngc.cpp - CLI integration tests for the ngc driver

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <string_view>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

const char * k_system =
  "system:\n"
  "  surfaces: { wall: 1 }\n"
  "  cells: { A: 1, C: 3, fuel: 10, clad: 11 }\n"
  "  universes: { B: 2 }\n";

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Run ngc with `args` (already quoted), capturing stdout and stderr in `dir`.
CliResult run_ngc(const fs::path & dir, const std::string & args)
{
  CliResult result;
#ifndef NGC_CLI_PATH
  (void)dir;
  (void)args;
  return result;
#else
  const fs::path out_file = dir / "stdout.txt";
  const fs::path err_file = dir / "stderr.txt";
  const std::string cmd = shell_quote(NGC_CLI_PATH) + " " + args + " > " +
                          shell_quote(out_file.string()) + " 2> " +
                          shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
#else
  // Best-effort fallback.
  result.exit_code = rc;
#endif

  result.out = read_all(out_file);
  result.err = read_all(err_file);
  return result;
#endif
}

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(NgcCli, RendersCardForNestedChain)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_card");
  const fs::path input = dir / "tallies.yaml";
  write_all(
    input, std::string(k_system) +
             "tallies:\n"
             "  - name: t\n"
             "    unit: [{cell: A}, {univ: B}, {ucell: C}]\n");

  const CliResult r = run_ngc(dir, "render " + shell_quote(input.string()) + " --format card");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "c t: (cell 'A' in univ 'B' in cell 'C')\nt: ( 1 < U=2 < 3)\n");
  EXPECT_TRUE(r.err.empty()) << r.err;

  fs::remove_all(dir);
}

TEST(NgcCli, RendersJsonWithBinCounts)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_json");
  const fs::path input = dir / "tallies.yaml";
  write_all(
    input, std::string(k_system) +
             "tallies:\n"
             "  - name: pins\n"
             "    unit: { vector: [{cell: fuel}, {cell: clad}] }\n"
             "  - name: walls\n"
             "    unit: { surf: wall }\n");

  const CliResult r = run_ngc(dir, "render " + shell_quote(input.string()) + " --format json");
  ASSERT_EQ(r.exit_code, 0) << r.err;

  const nlohmann::json j = nlohmann::json::parse(r.out);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["name"], "pins");
  EXPECT_EQ(j[0]["bins"], 2);
  EXPECT_EQ(j[0]["wire"], " 10 11");
  EXPECT_EQ(j[1]["name"], "walls");
  EXPECT_EQ(j[1]["bins"], 1);
  EXPECT_TRUE(j[1].contains("unit"));

  fs::remove_all(dir);
}

TEST(NgcCli, WritesOutputFile)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_output");
  const fs::path input = dir / "tallies.yaml";
  const fs::path output = dir / "cards.txt";
  write_all(
    input, std::string(k_system) +
             "tallies:\n"
             "  - name: t\n"
             "    unit: [{cell: A}, {univ: B}]\n");

  const CliResult r = run_ngc(
    dir, "render " + shell_quote(input.string()) + " --format wire -o " +
           shell_quote(output.string()));
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_TRUE(r.out.empty());
  EXPECT_EQ(read_all(output), "t: ( 1 < U=2)\n");
  EXPECT_TRUE(contains(r.err, "Rendered 1 tallies to")) << r.err;

  fs::remove_all(dir);
}

TEST(NgcCli, CheckPassesWhenEveryNameResolves)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_check_ok");
  const fs::path input = dir / "tallies.yaml";
  write_all(input, std::string(k_system) + "tallies:\n  - name: t\n    unit: { cell: fuel }\n");

  const CliResult r = run_ngc(dir, "check " + shell_quote(input.string()));
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, input.string() + ": OK\n");

  fs::remove_all(dir);
}

TEST(NgcCli, CheckReportsUnknownName)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_check_unknown");
  const fs::path input = dir / "tallies.yaml";
  write_all(input, std::string(k_system) + "tallies:\n  - name: bad\n    unit: { cell: ghost }\n");

  const CliResult r = run_ngc(dir, "check " + shell_quote(input.string()));
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.out.empty()) << r.out;
  EXPECT_TRUE(contains(r.err, "error[E002]: cell 'ghost' is not defined in the system")) << r.err;
  EXPECT_TRUE(contains(r.err, "--> tally 'bad'")) << r.err;
  EXPECT_TRUE(contains(r.err, "add the cell to the 'system.cells' table")) << r.err;

  fs::remove_all(dir);
}

TEST(NgcCli, UnknownFormatFails)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_format");
  const fs::path input = dir / "tallies.yaml";
  write_all(input, std::string(k_system) + "tallies:\n  - name: t\n    unit: { cell: fuel }\n");

  const CliResult r = run_ngc(dir, "render " + shell_quote(input.string()) + " --format xml");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(r.out.empty()) << r.out;
  EXPECT_TRUE(contains(r.err, "unknown format 'xml'")) << r.err;

  fs::remove_all(dir);
}

TEST(NgcCli, MissingInputFileFails)
{
#ifndef NGC_CLI_PATH
  GTEST_SKIP() << "NGC_CLI_PATH is not configured (ngc target missing?)";
#endif
  const fs::path dir = make_temp_dir("ngc_cli_missing");

  const CliResult r = run_ngc(dir, "render " + shell_quote((dir / "nope.yaml").string()));
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_TRUE(contains(r.err, "tally file not found")) << r.err;

  fs::remove_all(dir);
}
