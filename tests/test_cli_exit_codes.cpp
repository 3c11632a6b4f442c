#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <cstdlib>
#include <sys/wait.h>

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static std::string g_binary;
static fs::path g_workDir;

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << content;
}

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Runs logdate inside the work directory; returns its exit code or -1.
static int run_cli(const std::string& args, const std::string& stdoutFile = "/dev/null") {
    std::string cmd = "cd '" + g_workDir.string() + "' && '" + g_binary + "' " + args +
                      " --log-level error > '" + stdoutFile + "' 2>/dev/null";
    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: test_cli_exit_codes <path-to-logdate>" << std::endl;
        return 1;
    }
    g_binary = fs::absolute(argv[1]).string();
    g_workDir = fs::temp_directory_path() / "logdate_cli_test";
    try {
        fs::remove_all(g_workDir);
        fs::create_directories(g_workDir);

        write_file(g_workDir / "logs.txt",
                   "2024-01-01 00:00:01 INFO a1\n"
                   "2024-01-02 00:00:00 INFO b1\n"
                   "2024-01-02 12:30:00 ERROR b2\n"
                   "2024-01-03 06:00:00 INFO c1\n");
        write_file(g_workDir / "corrupt.log",
                   "2024-02-02 first\n"
                   "2024-02-02 bad \xff\xfe\n"
                   "2024-02-02 second\n");

        // found: default output path under ./output
        ASSERT_TRUE(run_cli("2024-01-02 --file logs.txt") == 0);
        ASSERT_TRUE(read_file(g_workDir / "output" / "output_2024-01-02.txt") ==
                    "2024-01-02 00:00:00 INFO b1\n2024-01-02 12:30:00 ERROR b2\n");

        // not found: success exit, no artifact
        ASSERT_TRUE(run_cli("2023-06-01 --file logs.txt") == 0);
        ASSERT_TRUE(!fs::exists(g_workDir / "output" / "output_2023-06-01.txt"));

        // stdout sink
        ASSERT_TRUE(run_cli("2024-01-03 --file logs.txt --output -", (g_workDir / "stdout.txt").string()) == 0);
        ASSERT_TRUE(read_file(g_workDir / "stdout.txt") == "2024-01-03 06:00:00 INFO c1\n");

        // invalid dates, lexically and on the calendar
        ASSERT_TRUE(run_cli("2024/01/02 --file logs.txt") == 1);
        ASSERT_TRUE(run_cli("2023-02-29 --file logs.txt") == 1);

        // usage and setup failures
        ASSERT_TRUE(run_cli("2024-01-02") == 1);
        ASSERT_TRUE(run_cli("2024-01-02 --file missing.log") == 1);
        ASSERT_TRUE(run_cli("2024-01-02 --file logs.txt --unknown-flag") == 1);

        // decode failure: exit 3, earlier lines kept
        ASSERT_TRUE(run_cli("2024-02-02 --file corrupt.log --output partial.txt") == 3);
        ASSERT_TRUE(read_file(g_workDir / "partial.txt") == "2024-02-02 first\n");

        // JSON summary reports the status
        ASSERT_TRUE(run_cli("2023-06-01 --file logs.txt --json", (g_workDir / "summary.json").string()) == 0);
        ASSERT_TRUE(read_file(g_workDir / "summary.json").find("\"status\":\"not_found\"") != std::string::npos);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    fs::remove_all(g_workDir);
    std::cout << "All CLI exit code tests passed" << std::endl;
    return 0;
}
