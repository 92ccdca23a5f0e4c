#include <gtest/gtest.h>
#include "labshot/process_runtime.h"
#include "file_utils.h"

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace labshot {
namespace {

// Host processes whose command line contains marker
int processes_mentioning(const std::string& marker) {
    int count = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it("/proc", ec), end; !ec && it != end;
         it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        std::ifstream in(it->path() / "cmdline", std::ios::binary);
        std::string cmdline((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
        if (cmdline.find(marker) != std::string::npos) {
            count++;
        }
    }
    return count;
}

template <typename Predicate>
bool wait_until(Predicate done, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return done();
}

// Forks a grandchild that leaves the process group and sleeps under marker
std::string detached_sleeper(const std::string& marker, const std::string& then) {
    return "import os, sys, time\n"
           "if os.fork() == 0:\n"
           "    os.setsid()\n"
           "    os.execv(sys.executable, [sys.executable, '-c', 'import time; time.sleep(120)', '" +
           marker + "'])\n"
           "print('spawned', flush=True)\n" + then;
}

class ProcessRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (find_executable("python3").empty()) {
            GTEST_SKIP() << "python3 not installed";
        }
        work_root = std::filesystem::temp_directory_path() /
                    ("labshot_runtime_" + FileUtils::random_hex(4));
        std::filesystem::create_directories(work_root);
        limits.timeout = std::chrono::seconds(10);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(work_root, ec);
    }

    ProcessRuntimeOptions make_options(bool require_seccomp = false) {
        ProcessRuntimeOptions options;
        options.work_root = work_root.string();
        options.cgroup_root = "";
        options.require_seccomp = require_seccomp;
        options.require_isolation = false;
        return options;
    }

    ProcessRuntime make_runtime(bool require_seccomp = false) {
        return ProcessRuntime(make_options(require_seccomp));
    }

    ExecutionResult run_once(ProcessRuntime& runtime, const std::string& source) {
        auto env = runtime.provision(limits);
        ExecutionResult result = env->run(source, Language::PYTHON, limits);
        env->teardown();
        return result;
    }

    // Runs source on its own thread while the marker is watched from here
    ExecutionResult run_watching(ProcessRuntime& runtime, const std::string& source,
                                 const std::string& marker, bool& marker_seen) {
        auto env = runtime.provision(limits);
        ExecutionResult result;
        std::string error;
        std::thread runner([&]() {
            try {
                result = env->run(source, Language::PYTHON, limits);
            } catch (const std::exception& e) {
                error = e.what();
            }
        });
        marker_seen = wait_until([&] { return processes_mentioning(marker) > 0; },
                                 std::chrono::seconds(5));
        runner.join();
        env->teardown();
        EXPECT_TRUE(error.empty()) << error;
        return result;
    }

    std::filesystem::path work_root;
    ExecutionLimits limits;
};

TEST_F(ProcessRuntimeTest, RunsPython) {
    auto runtime = make_runtime();
    auto result = run_once(runtime, "print(2 + 2)");

    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED) << result.stderr_output;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "4\n");
    EXPECT_TRUE(result.stderr_output.empty());
}

TEST_F(ProcessRuntimeTest, StreamsAreSeparate) {
    auto runtime = make_runtime();
    auto result = run_once(runtime, "import sys\nprint('out')\nprint('err', file=sys.stderr)\n");

    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST_F(ProcessRuntimeTest, NonZeroExitIsACrash) {
    auto runtime = make_runtime();
    auto result = run_once(runtime, "raise SystemExit(3)");

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out());
}

TEST_F(ProcessRuntimeTest, SignalDeathIsReported) {
    auto runtime = make_runtime();
    auto result = run_once(runtime, "import os, signal\nos.kill(os.getpid(), signal.SIGKILL)\n");

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(result.exit_code, 128 + 9);
    EXPECT_NE(result.error_message.find("signal 9"), std::string::npos) << result.error_message;
}

TEST_F(ProcessRuntimeTest, TimeoutKillsTheProcess) {
    // Given: A one second limit and a program that never ends
    auto runtime = make_runtime();
    limits.timeout = std::chrono::seconds(1);

    // When: Running it
    auto start = std::chrono::steady_clock::now();
    auto result = run_once(runtime, "print('started', flush=True)\nwhile True:\n    pass\n");
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: It is stopped near the limit and reported as a timeout
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.stdout_output, "started\n") << "Output before the kill is kept";
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_GE(result.wall_time, std::chrono::milliseconds(1000));
}

TEST_F(ProcessRuntimeTest, TimeoutLeavesNoDetachedProcess) {
    auto runtime = make_runtime();
    if (!runtime.namespaces_available()) {
        GTEST_SKIP() << "PID namespaces unavailable";
    }

    // Given: A program whose grandchild calls setsid(), then a hang
    limits.timeout = std::chrono::seconds(2);
    std::string marker = "labshot-linger-" + FileUtils::random_hex(6);
    bool seen = false;

    // When: It times out and the environment is torn down
    auto result = run_watching(runtime,
        detached_sleeper(marker, "while True:\n    time.sleep(1)\n"), marker, seen);

    // Then: The detached grandchild existed during the run and is gone now
    EXPECT_TRUE(seen) << "Grandchild never started: " << result.stderr_output;
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(result.stdout_output, "spawned\n");
    EXPECT_EQ(processes_mentioning(marker), 0);
}

TEST_F(ProcessRuntimeTest, DetachedDescendantsDieWithTheProgram) {
    auto runtime = make_runtime();
    if (!runtime.namespaces_available()) {
        GTEST_SKIP() << "PID namespaces unavailable";
    }

    // Given: A program that starts a setsid() daemon and exits normally
    std::string marker = "labshot-daemon-" + FileUtils::random_hex(6);
    bool seen = false;

    // When: Running it to completion
    auto result = run_watching(runtime, detached_sleeper(marker, "time.sleep(1)\n"), marker, seen);

    // Then: The daemon did not survive the run
    EXPECT_TRUE(seen) << "Daemon never started: " << result.stderr_output;
    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED) << result.stderr_output;
    EXPECT_EQ(processes_mentioning(marker), 0);
}

TEST_F(ProcessRuntimeTest, OutputIsCapped) {
    auto runtime = make_runtime();
    limits.max_capture_bytes = 1024;

    auto result = run_once(runtime, "print('x' * 5000)");

    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_NE(result.stdout_output.find("[output truncated at 1024 bytes]"), std::string::npos);
    EXPECT_LT(result.stdout_output.size(), 1200u);
}

TEST_F(ProcessRuntimeTest, WrittenFilesAreCollected) {
    auto runtime = make_runtime();
    auto result = run_once(runtime,
        "with open('report.txt', 'w') as f:\n    f.write('hello')\nprint('done')\n");

    ASSERT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(result.output_files[0].name, "report.txt");
    EXPECT_EQ(result.output_files[0].content, "hello");
}

TEST_F(ProcessRuntimeTest, ConcurrentTasksDoNotSeeEachOther) {
    auto runtime = make_runtime();
    if (!runtime.namespaces_available()) {
        GTEST_SKIP() << "Mount namespaces unavailable";
    }

    // Given: Two programs that each leave a sentinel in their work dir and
    // in /tmp, then look for every sentinel they can reach
    std::string tag_a = "a" + FileUtils::random_hex(4);
    std::string tag_b = "b" + FileUtils::random_hex(4);
    auto program = [&](const std::string& tag) {
        return "import glob, os, sys, time\n"
               "open('secret.txt', 'w').write('SENTINEL_" + tag + "')\n"
               "open('/tmp/labshot_marker_" + tag + "', 'w').write('" + tag + "')\n"
               "time.sleep(1.5)\n"
               "seen = []\n"
               "for pattern in ['" + work_root.string() + "/*/secret.txt', '" +
               work_root.string() + "/*/*/secret.txt', '/tmp/labshot_marker_*', "
               "'secret.txt']:\n"
               "    for path in glob.glob(pattern):\n"
               "        try:\n"
               "            seen.append(open(path).read())\n"
               "        except OSError as e:\n"
               "            print(e, file=sys.stderr)\n"
               "print(os.getcwd())\n"
               "print(' '.join(sorted(seen)))\n";
    };

    // When: Both run at the same time
    ExecutionResult result_a, result_b;
    std::string error_a, error_b;
    auto env_a = runtime.provision(limits);
    auto env_b = runtime.provision(limits);
    auto start = [&](Environment& env, const std::string& tag, ExecutionResult& result,
                     std::string& error) {
        return std::thread([&env, &result, &error, &run_limits = limits,
                            source = program(tag)]() {
            try {
                result = env.run(source, Language::PYTHON, run_limits);
            } catch (const std::exception& e) {
                error = e.what();
            }
        });
    };
    std::thread first = start(*env_a, tag_a, result_a, error_a);
    std::thread second = start(*env_b, tag_b, result_b, error_b);
    first.join();
    second.join();
    env_a->teardown();
    env_b->teardown();
    ASSERT_TRUE(error_a.empty()) << error_a;
    ASSERT_TRUE(error_b.empty()) << error_b;

    // Then: Each saw only its own files, and nothing reached the host /tmp
    ASSERT_EQ(result_a.status, ExecutionStatus::COMPLETED) << result_a.stderr_output;
    ASSERT_EQ(result_b.status, ExecutionStatus::COMPLETED) << result_b.stderr_output;
    EXPECT_EQ(result_a.stdout_output, "/work\nSENTINEL_" + tag_a + " " + tag_a + "\n");
    EXPECT_EQ(result_b.stdout_output, "/work\nSENTINEL_" + tag_b + " " + tag_b + "\n");
    EXPECT_EQ(result_a.stdout_output.find(tag_b), std::string::npos);
    EXPECT_EQ(result_a.stderr_output.find(tag_b), std::string::npos);
    EXPECT_EQ(result_b.stdout_output.find(tag_a), std::string::npos);
    EXPECT_EQ(result_b.stderr_output.find(tag_a), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists("/tmp/labshot_marker_" + tag_a));
    EXPECT_FALSE(std::filesystem::exists("/tmp/labshot_marker_" + tag_b));
}

TEST_F(ProcessRuntimeTest, HostFilesAreOutOfReach) {
    auto runtime = make_runtime();
    if (!runtime.namespaces_available()) {
        GTEST_SKIP() << "Mount namespaces unavailable";
    }

    // Given: A service file next to the sandboxes
    auto service_file = work_root / "service.db";
    FileUtils::write_file(service_file.string(), "state");

    // When: A program tries to append to it and to plant files elsewhere
    std::string planted = "labshot_planted_" + FileUtils::random_hex(4);
    auto result = run_once(runtime,
        "for path in ['" + service_file.string() + "', '" + work_root.string() + "/" + planted +
        "', '/usr/" + planted + "', '/etc/" + planted + "']:\n"
        "    try:\n"
        "        with open(path, 'a') as f:\n"
        "            f.write('x')\n"
        "        print('wrote')\n"
        "    except OSError:\n"
        "        print('blocked')\n");

    // Then: Every write was refused and the host is unchanged
    EXPECT_EQ(result.stdout_output, "blocked\nblocked\nblocked\nblocked\n") << result.stderr_output;
    EXPECT_EQ(FileUtils::read_file(service_file.string()), "state");
    EXPECT_FALSE(std::filesystem::exists(work_root / planted));
    EXPECT_FALSE(std::filesystem::exists("/usr/" + planted));
    EXPECT_FALSE(std::filesystem::exists("/etc/" + planted));
}

TEST_F(ProcessRuntimeTest, ProgramDoesNotRunAsRoot) {
    auto runtime = make_runtime();
    auto result = run_once(runtime, "import os\nprint(os.getuid())\n");

    ASSERT_EQ(result.status, ExecutionStatus::COMPLETED) << result.stderr_output;
    EXPECT_NE(result.stdout_output, "0\n");
}

TEST_F(ProcessRuntimeTest, ConcurrentTasksGetDistinctUids) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "Task uids are only assigned when running as root";
    }
    auto runtime = make_runtime();

    // Given: Two live environments
    auto env_a = runtime.provision(limits);
    auto env_b = runtime.provision(limits);

    // When: Each reports its uid
    auto result_a = env_a->run("import os\nprint(os.getuid())\n", Language::PYTHON, limits);
    auto result_b = env_b->run("import os\nprint(os.getuid())\n", Language::PYTHON, limits);
    env_a->teardown();
    env_b->teardown();

    // Then: Per-uid limits such as RLIMIT_NPROC are not shared between them
    ASSERT_EQ(result_a.status, ExecutionStatus::COMPLETED) << result_a.stderr_output;
    ASSERT_EQ(result_b.status, ExecutionStatus::COMPLETED) << result_b.stderr_output;
    EXPECT_NE(result_a.stdout_output, result_b.stdout_output);
    EXPECT_GE(std::stoul(result_a.stdout_output), DEFAULT_SANDBOX_UID_BASE);
}

TEST_F(ProcessRuntimeTest, ManyThreadsAreNotLimitedByOtherTasks) {
    auto runtime = make_runtime();
    if (!runtime.namespaces_available() && geteuid() != 0) {
        GTEST_SKIP() << "Process limits would be shared with the service uid";
    }

    // Given: A task that holds most of its process budget
    limits.max_processes = 40;
    limits.timeout = std::chrono::seconds(15);
    auto hog = runtime.provision(limits);
    ExecutionResult hog_result;
    std::thread hog_runner([&]() {
        hog_result = hog->run(
            "import threading, time\n"
            "threading.stack_size(256 * 1024)\n"
            "ts = [threading.Thread(target=time.sleep, args=(3,)) for _ in range(30)]\n"
            "[t.start() for t in ts]\n"
            "[t.join() for t in ts]\n"
            "print('hog done')\n", Language::PYTHON, limits);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    // When: A second task starts as many threads at the same time
    auto result = run_once(runtime,
        "import threading, time\n"
        "threading.stack_size(256 * 1024)\n"
        "ts = [threading.Thread(target=time.sleep, args=(0.5,)) for _ in range(30)]\n"
        "[t.start() for t in ts]\n"
        "[t.join() for t in ts]\n"
        "print('started 30')\n");
    hog_runner.join();
    hog->teardown();

    // Then: Neither ran out of processes because of the other
    EXPECT_EQ(result.stdout_output, "started 30\n") << result.stderr_output;
    EXPECT_EQ(hog_result.stdout_output, "hog done\n") << hog_result.stderr_output;
}

TEST_F(ProcessRuntimeTest, EnvironmentServesOneRun) {
    auto runtime = make_runtime();
    auto env = runtime.provision(limits);
    env->run("print(1)", Language::PYTHON, limits);
    EXPECT_THROW(env->run("print(2)", Language::PYTHON, limits), std::logic_error);
    env->teardown();
}

TEST_F(ProcessRuntimeTest, SocketsAreDenied) {
    auto runtime = make_runtime(true);
    auto result = run_once(runtime,
        "import socket\n"
        "try:\n"
        "    s = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "    s.settimeout(2)\n"
        "    s.connect(('1.1.1.1', 53))\n"
        "    print('connected')\n"
        "except OSError:\n"
        "    print('blocked')\n");

    if (result.stderr_output.find("labshot sandbox: seccomp") != std::string::npos) {
        GTEST_SKIP() << "seccomp filters not permitted here";
    }
    EXPECT_EQ(result.stdout_output, "blocked\n");
}

TEST_F(ProcessRuntimeTest, TeardownRemovesWorkDir) {
    auto runtime = make_runtime();
    auto env = runtime.provision(limits);
    env->run("print(1)", Language::PYTHON, limits);
    env->teardown();

    EXPECT_TRUE(std::filesystem::is_empty(work_root));
}

TEST_F(ProcessRuntimeTest, RequiredIsolationMatchesTheHost) {
    auto support = ProcessRuntime::detect_namespaces(work_root.string(), geteuid() != 0);
    ProcessRuntimeOptions options = make_options();
    options.require_isolation = true;

    if (support.namespaces) {
        ProcessRuntime runtime(options);
        EXPECT_TRUE(runtime.namespaces_available());
        EXPECT_TRUE(runtime.network_namespace_available());
    } else {
        EXPECT_THROW(ProcessRuntime runtime(options), std::runtime_error);
    }
}

TEST(FindExecutableTest, ResolvesShell) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_TRUE(find_executable("labshot-no-such-binary").empty());
    EXPECT_EQ(find_executable("/bin/sh"), "/bin/sh");
}

} // namespace
} // namespace labshot
