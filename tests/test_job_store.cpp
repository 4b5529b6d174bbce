#include <gtest/gtest.h>
#include <jobrunner/store/job_store.hpp>
#include "test_util.hpp"
#include <csignal>
#include <set>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <thread>
#include <vector>

using namespace jobrunner;
using testutil::TempRoot;
using testutil::read_file;
using testutil::write_file;
namespace fs = std::filesystem;

static std::vector<JobState> store_list_states(const fs::path& root) {
    JobStore store(root);
    std::vector<JobState> states;
    for (const Job& j : store.list()) states.push_back(j.state);
    return states;
}

TEST(JobStoreAllocate, CreatesDirectoryAndName) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("greet", "echo hello");
    ASSERT_TRUE(job.has_value());
    EXPECT_TRUE(fs::is_directory(job->dir));
    EXPECT_EQ(job->dir.parent_path(), tmp.path / "jobs");
    EXPECT_EQ(read_file(job->name_path), "greet\n");
    EXPECT_EQ(read_file(job->command_path), "echo hello\n");
    // Log and status are resolved but not created yet.
    EXPECT_FALSE(fs::exists(job->log_path));
    EXPECT_FALSE(fs::exists(job->status_path));
    EXPECT_EQ(job->state, JobState::Running);
}

TEST(JobStoreAllocate, NameDefaultsToCommand) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("", "ls -la /tmp");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->name, "ls -la /tmp");
    EXPECT_EQ(store.load(job->id).name, "ls -la /tmp");
}

TEST(JobStoreAllocate, RapidIdsAreDistinct) {
    TempRoot tmp; JobStore store(tmp.path);
    std::set<std::string> ids;
    for (int i=0;i<300;++i) {
        auto job = store.allocate("n", "true");
        ASSERT_TRUE(job.has_value());
        ids.insert(job->id);
    }
    EXPECT_EQ(ids.size(), 300u);
}

TEST(JobStoreAllocate, ConcurrentIdsAreDistinct) {
    TempRoot tmp; JobStore store(tmp.path);
    std::vector<std::vector<std::string>> per_thread(4);
    std::vector<std::thread> threads;
    for (int t=0;t<4;++t) {
        threads.emplace_back([&, t]{
            for (int i=0;i<50;++i) {
                auto job = store.allocate("n", "true");
                if (job) per_thread[t].push_back(job->id);
            }
        });
    }
    for (auto &th : threads) th.join();
    std::set<std::string> ids;
    for (auto &v : per_thread) { EXPECT_EQ(v.size(), 50u); ids.insert(v.begin(), v.end()); }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(JobStoreList, SubmissionOrder) {
    TempRoot tmp; JobStore store(tmp.path);
    auto a = store.allocate("first", "true");
    auto b = store.allocate("second", "true");
    auto c = store.allocate("third", "true");
    ASSERT_TRUE(a && b && c);
    auto listing = store.list();
    ASSERT_EQ(listing.size(), 3u);
    std::vector<std::string> names;
    for (const Job& j : listing) names.push_back(j.name);
    EXPECT_EQ(names, (std::vector<std::string>{"first", "second", "third"}));
}

TEST(JobStoreList, RestartableAndLazy) {
    TempRoot tmp; JobStore store(tmp.path);
    auto a = store.allocate("a", "true");
    ASSERT_TRUE(a);
    auto listing = store.list();
    EXPECT_EQ((*listing.begin()).state, JobState::Running);
    ASSERT_TRUE(store.write_status(*a, 0));
    // A second pass reads the record again.
    EXPECT_EQ((*listing.begin()).state, JobState::Succeeded);
}

TEST(JobStoreList, ForeignDirectoriesSortLast) {
    TempRoot tmp; JobStore store(tmp.path);
    fs::create_directory(tmp.path / "jobs" / "manual-job");
    auto a = store.allocate("a", "true");
    ASSERT_TRUE(a);
    write_file(tmp.path / "jobs" / "stray.txt", "x");
    auto listing = store.list();
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing.ids()[0], a->id);
    EXPECT_EQ(listing.ids()[1], "manual-job");
}

TEST(JobStoreList, EmptyWhenNoJobsDir) {
    TempRoot tmp;
    JobStore store(tmp.path / "missing");
    EXPECT_TRUE(store.list().empty());
}

TEST(JobStoreStatus, StatesFromDisk) {
    TempRoot tmp; JobStore store(tmp.path);
    auto ok = store.allocate("ok", "true");
    auto bad = store.allocate("bad", "false");
    ASSERT_TRUE(ok && bad);
    EXPECT_EQ(store.read_status(*ok).state, JobState::Running);
    EXPECT_FALSE(store.read_status(*ok).exit_code.has_value());

    ASSERT_TRUE(store.write_status(*ok, 0));
    ASSERT_TRUE(store.write_status(*bad, 3));
    EXPECT_EQ(read_file(ok->status_path), "exit 0\n");
    auto s1 = store.read_status(ok->id);
    EXPECT_EQ(s1.state, JobState::Succeeded);
    EXPECT_EQ(s1.exit_code, 0);
    auto s2 = store.read_status(bad->id);
    EXPECT_EQ(s2.state, JobState::Failed);
    EXPECT_EQ(s2.exit_code, 3);
    EXPECT_FALSE(fs::exists(bad->dir / "status.txt.tmp"));
}

TEST(JobStoreStatus, SentinelIsFailed) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("x", "x");
    ASSERT_TRUE(job);
    ASSERT_TRUE(store.write_status(*job, kExitSpawnFailed));
    auto st = store.read_status(*job);
    EXPECT_EQ(st.state, JobState::Failed);
    EXPECT_EQ(st.exit_code, kExitSpawnFailed);
}

TEST(JobStoreStatus, CorruptedIsUnknown) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("x", "x");
    ASSERT_TRUE(job);
    for (const char* content : {"", "exi", "exit ", "exit abc", "exit 1 2", "running\n"}) {
        write_file(job->status_path, content);
        auto st = store.read_status(*job);
        EXPECT_EQ(st.state, JobState::Unknown) << "content: '" << content << "'";
        EXPECT_FALSE(st.exit_code.has_value());
    }
}

TEST(JobStoreStatus, MissingDirectoryIsUnknown) {
    TempRoot tmp; JobStore store(tmp.path);
    EXPECT_EQ(store.read_status("1-2-3").state, JobState::Unknown);
    EXPECT_FALSE(store.find("1-2-3").has_value());
    EXPECT_FALSE(store.find("../jobs").has_value());
    EXPECT_FALSE(store.find("").has_value());
}

TEST(JobStoreStatus, WrittenAtMostOnce) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("x", "x");
    ASSERT_TRUE(job);
    EXPECT_TRUE(store.write_status(*job, 4));
    EXPECT_FALSE(store.write_status(*job, 0));
    EXPECT_EQ(store.read_status(*job).exit_code, 4);
}

TEST(JobStoreTail, BoundedByN) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("x", "x");
    ASSERT_TRUE(job);
    std::string content;
    for (int i=1;i<=10;++i) content += "line " + std::to_string(i) + "\n";
    write_file(job->log_path, content);

    auto last3 = store.tail_log(*job, 3);
    ASSERT_EQ(last3.size(), 3u);
    EXPECT_EQ(last3[0], "line 8");
    EXPECT_EQ(last3[2], "line 10");
    EXPECT_EQ(store.tail_log(*job, 50).size(), 10u);
    EXPECT_TRUE(store.tail_log(*job, 0).empty());
}

TEST(JobStoreTail, PartialLastLineAndMissingLog) {
    TempRoot tmp; JobStore store(tmp.path);
    auto job = store.allocate("x", "x");
    ASSERT_TRUE(job);
    EXPECT_TRUE(store.tail_log(*job, 5).empty());
    write_file(job->log_path, "a\nb\npartial");
    auto lines = store.tail_log(*job, 2);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "b");
    EXPECT_EQ(lines[1], "partial");
}

TEST(JobStatusLine, Parse) {
    EXPECT_EQ(parse_status_line("exit 0"), 0);
    EXPECT_EQ(parse_status_line("exit 127\n"), 127);
    EXPECT_EQ(parse_status_line("exit -1\n"), -1);
    EXPECT_FALSE(parse_status_line("exit 99999999999").has_value());
    EXPECT_FALSE(parse_status_line("Exit 0").has_value());
    EXPECT_FALSE(parse_status_line("exit +5").has_value());
    EXPECT_FALSE(parse_status_line("exit  5").has_value());
    EXPECT_FALSE(parse_status_line("exit -").has_value());
    EXPECT_FALSE(parse_status_line("exit 5x").has_value());
    EXPECT_EQ(format_status_line(2), "exit 2");
}

TEST(JobStoreAllocate, MetadataWriteFailureStillReturnsJob) {
    TempRoot tmp;
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        // Files may not grow past 16 bytes: the long name fails, the status fits.
        signal(SIGXFSZ, SIG_IGN);
        struct rlimit rl{16, 16};
        if (setrlimit(RLIMIT_FSIZE, &rl) != 0) _exit(2);
        JobStore store(tmp.path);
        auto job = store.allocate("a name far longer than sixteen bytes", "true");
        if (!job) _exit(3);
        if (store.read_status(*job).state != JobState::Running) _exit(4);
        if (!store.write_status(*job, kExitSpawnFailed)) _exit(5);
        if (store.read_status(job->id).state != JobState::Failed) _exit(6);
        _exit(0);
    }
    int st = 0;
    ASSERT_EQ(waitpid(pid, &st, 0), pid);
    ASSERT_TRUE(WIFEXITED(st));
    EXPECT_EQ(WEXITSTATUS(st), 0);
    auto listing = store_list_states(tmp.path);
    ASSERT_EQ(listing.size(), 1u);
    EXPECT_EQ(listing[0], JobState::Failed);
}
