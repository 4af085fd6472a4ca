#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string find_sigwave_bin() {
    if (const char* env = std::getenv("SIGWAVE_BIN")) {
        if (env[0] != '\0' && fs::exists(env)) {
            return fs::absolute(env).string();
        }
    }

    std::vector<std::string> candidates = {
        "./sigwave",
        "../sigwave",
        "./build/sigwave",
        "../build/sigwave"
    };

    for (const auto& c : candidates) {
        if (fs::exists(c)) {
            return fs::absolute(fs::path(c)).string();
        }
    }

    return {};
}

static std::string find_project_root() {
    if (const char* env = std::getenv("SIGWAVE_ROOT")) {
        if (env[0] != '\0' && fs::exists(fs::path(env) / "conf/signals.yaml")) {
            return env;
        }
    }

    fs::path p = fs::current_path();
    for (int i = 0; i < 6; ++i) {
        if (fs::exists(p / "conf/signals.yaml")) {
            return p.string();
        }
        if (p.has_parent_path()) {
            p = p.parent_path();
        } else {
            break;
        }
    }
    return {};
}

// Scratch directory so log/ and output files stay out of the build tree
static fs::path work_dir() {
    fs::path dir = fs::temp_directory_path() / "sigwave_cli_test";
    fs::create_directories(dir);
    return dir;
}

static int run_in_work_dir(const std::string& args) {
    const auto bin = find_sigwave_bin();
    assert(!bin.empty() && "sigwave binary not found; set SIGWAVE_BIN");

    std::string cmd = "cd \"" + work_dir().string() + "\" && \"" + bin + "\" " + args;
    std::cout << "[RUN] " << cmd << std::endl;
    return std::system(cmd.c_str());
}

static std::string read_output(const std::string& name) {
    std::ifstream fin(work_dir() / name);
    std::stringstream ss;
    ss << fin.rdbuf();
    return ss.str();
}

void test_help_command() {
    int rc = run_in_work_dir("--help > help.txt");
    (void)rc;
    assert(rc == 0 && "sigwave --help should exit 0");
    assert(read_output("help.txt").find("--signal") != std::string::npos);
    std::cout << "test_help_command passed.\n";
}

void test_square_to_csv_file() {
    int rc = run_in_work_dir("-s square -p 2 -t 0,0.5,1,1.5 -b double -o square.csv");
    (void)rc;
    assert(rc == 0 && "sigwave square run should exit 0");
    assert(read_output("square.csv") == "t,square\n0,1\n0.5,1\n1,-1\n1.5,-1\n");
    std::cout << "test_square_to_csv_file passed.\n";
}

void test_square_period_boundary_mpfr() {
    int rc = run_in_work_dir("-s square -p 0.1 -t 0.3 -d 25 -o boundary.csv");
    (void)rc;
    assert(rc == 0 && "sigwave mpfr square run should exit 0");
    assert(read_output("boundary.csv") == "t,square\n0.3,1\n");
    std::cout << "test_square_period_boundary_mpfr passed.\n";
}

void test_sigmoid_json_stdout() {
    int rc = run_in_work_dir("-s sigmoid -d 25 -t 1 -f json > sigmoid.json");
    (void)rc;
    assert(rc == 0 && "sigwave sigmoid run should exit 0");

    std::string out = read_output("sigmoid.json");
    assert(out.find("\"backend\": \"mpfr\"") != std::string::npos);
    assert(out.find("\"dps\": 25") != std::string::npos);
    assert(out.find("0.7310585786300048792511592") != std::string::npos);
    std::cout << "test_sigmoid_json_stdout passed.\n";
}

void test_config_file() {
    const auto root = find_project_root();
    assert(!root.empty() && "project root not found; set SIGWAVE_ROOT");

    int rc = run_in_work_dir("-c \"" + root + "/conf/signals.yaml\" -o all.csv");
    (void)rc;
    assert(rc == 0 && "sigwave -c conf/signals.yaml should exit 0");

    std::string out = read_output("all.csv");
    assert(out.find("t,clock\n") != std::string::npos);
    assert(out.find("t,ramp\n") != std::string::npos);
    assert(out.find("t,activation\n") != std::string::npos);
    assert(out.find("\n0,0.5\n") != std::string::npos);
    std::cout << "test_config_file passed.\n";
}

void test_error_exit_codes() {
    int rc = run_in_work_dir("--unknown-arg 2> /dev/null");
    (void)rc;
    assert(rc != 0 && "sigwave with unknown args should exit non-zero");

    rc = run_in_work_dir("-s sawtooth -p 0 -t 1 2> /dev/null");
    assert(rc != 0 && "sigwave with a zero period should exit non-zero");

    rc = run_in_work_dir("-s square -t 1 -d 0 2> /dev/null");
    assert(rc != 0 && "sigwave with zero dps should exit non-zero");
    std::cout << "test_error_exit_codes passed.\n";
}

int main() {
    test_help_command();
    test_square_to_csv_file();
    test_square_period_boundary_mpfr();
    test_sigmoid_json_stdout();
    test_config_file();
    test_error_exit_codes();
    fs::remove_all(work_dir());
    std::cout << "All sigwave CLI tests passed!\n";
    return 0;
}
