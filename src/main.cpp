// jobrunner CLI: one-shot subcommands plus an interactive session
#include <jobrunner/config/config.hpp>
#include <jobrunner/env/environment.hpp>
#include <jobrunner/exec/process_runner.hpp>
#include <jobrunner/log/logger.hpp>
#include <jobrunner/report/status_reporter.hpp>
#include <jobrunner/store/job_store.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace jobrunner;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int){ g_interrupted = 1; }

namespace {

struct Session {
    const Environment& env;
    const JobStore& store;
    ProcessRunner& runner;
    const StatusReporter& reporter;
};

void usage(std::ostream& out) {
    out << "usage: jobrunner [--root DIR] [--non-interactive] [--exit-on-completion] [-v] <command>\n"
           "  run [-b] [-n NAME] [--] COMMAND...   run a command (background with -b)\n"
           "  jobs                                 list jobs\n"
           "  recent [N]                           most recent jobs first\n"
           "  status ID                            show one job\n"
           "  tail ID [N]                          last N lines of a job log\n"
           "  report                               export a report of every job\n"
           "  shell                                interactive session (default)\n";
}

void session_help(std::ostream& out) {
    out << "commands: run CMD | bg [-n NAME] CMD | jobs | recent [N] | status ID | tail ID [N] | report | help | exit\n";
}

// Exit statuses are 0..255; the reserved negative codes map to 255.
int process_status(int code) { return (code < 0 || code > 255) ? 255 : code; }

bool parse_count(const std::string& s, std::size_t& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    try { out = static_cast<std::size_t>(std::stoul(s)); } catch (const std::out_of_range&) { return false; }
    return true;
}

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

// Splits off the first whitespace separated word.
std::string next_word(std::string& rest) {
    rest = trim(rest);
    auto sp = rest.find_first_of(" \t");
    std::string w = rest.substr(0, sp);
    rest = sp == std::string::npos ? "" : trim(rest.substr(sp));
    return w;
}

int cmd_jobs(const Session& s) {
    s.reporter.print_summary(std::cout, s.reporter.summarize());
    return 0;
}

int cmd_recent(const Session& s, std::size_t n) {
    std::vector<JobSummary> rows;
    for (auto &j : s.reporter.recent(n)) rows.push_back(JobSummary{j.id, j.name, j.state, j.exit_code});
    s.reporter.print_summary(std::cout, rows);
    return 0;
}

int cmd_status(const Session& s, const std::string& id) {
    auto job = s.store.find(id);
    if (!job) { std::cerr << "status: no such job id: " << id << '\n'; return 1; }
    s.reporter.print_job(std::cout, *job);
    return 0;
}

int cmd_tail(const Session& s, const std::string& id, std::size_t n) {
    auto job = s.store.find(id);
    if (!job) { std::cerr << "tail: no such job id: " << id << '\n'; return 1; }
    for (auto &line : s.store.tail_log(*job, n)) std::cout << line << '\n';
    return 0;
}

int cmd_report(const Session& s) {
    auto path = s.reporter.export_report();
    if (!path) { std::cerr << "report: failed, see log\n"; return 1; }
    std::cout << "Report written: " << path->string() << '\n';
    return 0;
}

int cmd_run(Session& s, const std::string& command, bool background, const std::string& name) {
    if (trim(command).empty()) { std::cerr << "run: command required\n"; return 2; }
    ExecResult r = s.runner.execute(command, background, name);
    if (!background) {
        std::cout << "exit " << r.exit_code << '\n';
        return r.exit_code;
    }
    if (r.job_id.empty()) { std::cerr << "run: could not create a job record\n"; return r.exit_code; }
    std::cout << r.job_id << std::endl;
    // This process owns the job's capture task; stay until it has finished.
    s.runner.wait_all();
    auto st = s.store.read_status(r.job_id);
    int code = st.exit_code ? *st.exit_code : kExitLost;
    std::cout << "exit " << code << '\n';
    return code;
}

int run_session(Session& s) {
    bool interactive = s.env.is_interactive();
    int last = 0;
    if (interactive) {
        std::cout << "jobrunner - root " << s.store.root().string() << '\n';
        session_help(std::cout);
    }
    std::string line;
    while (true) {
        if (interactive) { std::cout << "jobrunner> "; std::cout.flush(); }
        if (!std::getline(std::cin, line)) break;
        if (g_interrupted) { std::cout << '\n'; g_interrupted = 0; }
        std::string rest = line;
        std::string verb = next_word(rest);
        if (verb.empty() || verb[0]=='#') continue;
        if (verb=="exit" || verb=="quit") break;
        else if (verb=="help") session_help(std::cout);
        else if (verb=="jobs") last = cmd_jobs(s);
        else if (verb=="report") last = cmd_report(s);
        else if (verb=="run") last = cmd_run(s, rest, false, "");
        else if (verb=="bg") {
            std::string name;
            if (rest.compare(0, 3, "-n ")==0) { next_word(rest); name = next_word(rest); }
            if (rest.empty()) { std::cerr << "bg: command required\n"; last = 2; continue; }
            ExecResult r = s.runner.execute(rest, true, name);
            if (r.job_id.empty()) { std::cerr << "bg: could not create a job record\n"; last = 1; continue; }
            std::cout << "Started: " << (name.empty() ? rest : name) << " (job-id: " << r.job_id << ")\n";
            last = 0;
        }
        else if (verb=="recent" || verb=="tail" || verb=="status") {
            std::string arg = next_word(rest);
            std::size_t n = s.env.config().tail_lines;
            if (verb=="recent") {
                if (!arg.empty() && !parse_count(arg, n)) { std::cerr << "recent: bad count\n"; last = 2; continue; }
                last = cmd_recent(s, n);
            } else if (arg.empty()) {
                std::cerr << verb << ": job id required\n"; last = 2;
            } else if (verb=="status") {
                last = cmd_status(s, arg);
            } else {
                std::string count = next_word(rest);
                if (!count.empty() && !parse_count(count, n)) { std::cerr << "tail: bad count\n"; last = 2; continue; }
                last = cmd_tail(s, arg, n);
            }
        }
        else { std::cerr << verb << ": unknown command (try help)\n"; last = 2; }
    }
    std::size_t active = s.runner.active_jobs();
    if (active > 0) {
        std::cout << "waiting for " << active << " background job(s)...\n";
        std::cout.flush();
    }
    s.runner.wait_all();
    return last;
}

} // namespace

int main(int argc, char* argv[]) {
    RunnerConfig cfg = load_config();
    bool verbose = false;
    int i = 1;
    for (; i<argc; ++i) {
        std::string a = argv[i];
        if (a=="-v" || a=="--verbose") verbose = true;
        else if (a=="--root" && i+1<argc) cfg.root_override = argv[++i];
        else if (a=="--non-interactive") cfg.force_non_interactive = true;
        else if (a=="--exit-on-completion") cfg.exit_on_completion = true;
        else if (a=="-h" || a=="--help") { usage(std::cout); return 0; }
        else break;
    }
    if (!logging::set_level(cfg.log_level)) logging::warn("unknown log level '{}'", cfg.log_level);
    logging::set_verbose(verbose);
    if (verbose && !logging::enabled(LogLevel::Info)) logging::set_level(LogLevel::Info);

    Environment env(cfg);
    fs::path root;
    try {
        root = env.resolve_root();
    } catch (const ConfigError& e) {
        std::cerr << "jobrunner: " << e.what() << '\n';
        return 78;
    }
    if (cfg.log_to_file && !logging::open_file(root / "jobrunner.log"))
        logging::warn("cannot open {}", (root / "jobrunner.log").string());

    JobStore store(root);
    ProcessRunner runner(store, cfg.shell);
    StatusReporter reporter(store);
    Session s{env, store, runner, reporter};

    std::string sub = i<argc ? argv[i++] : "shell";
    std::vector<std::string> args(argv + i, argv + argc);
    int code = 0;
    if (sub=="run") {
        bool background = false;
        std::string name;
        size_t k = 0;
        for (; k<args.size(); ++k) {
            if (args[k]=="-b" || args[k]=="--background") background = true;
            else if ((args[k]=="-n" || args[k]=="--name") && k+1<args.size()) name = args[++k];
            else if (args[k]=="--") { ++k; break; }
            else break;
        }
        std::ostringstream cmd;
        for (size_t j=k; j<args.size(); ++j) { if (j>k) cmd << ' '; cmd << args[j]; }
        code = cmd_run(s, cmd.str(), background, name);
    }
    else if (sub=="jobs") code = cmd_jobs(s);
    else if (sub=="report") code = cmd_report(s);
    else if (sub=="recent") {
        std::size_t n = cfg.tail_lines;
        if (!args.empty() && !parse_count(args[0], n)) { std::cerr << "recent: bad count\n"; return 2; }
        code = cmd_recent(s, n);
    }
    else if (sub=="status" || sub=="tail") {
        if (args.empty()) { std::cerr << sub << ": job id required\n"; return 2; }
        if (sub=="status") code = cmd_status(s, args[0]);
        else {
            std::size_t n = cfg.tail_lines;
            if (args.size()>1 && !parse_count(args[1], n)) { std::cerr << "tail: bad count\n"; return 2; }
            code = cmd_tail(s, args[0], n);
        }
    }
    else if (sub=="shell") {
        std::signal(SIGINT, sigint_handler);
        code = run_session(s);
    }
    else { usage(std::cerr); return 2; }

    // Without a terminal the code is only printed, unless exit-on-completion is set.
    if ((sub=="run" || sub=="shell") && !env.propagate_exit_code()) return 0;
    return process_status(code);
}
