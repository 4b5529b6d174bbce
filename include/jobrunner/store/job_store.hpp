/*
 * Job store - jobrunner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jobrunner/store/job.hpp>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace jobrunner {

class JobStore;

// Snapshot of the job ids present when list() was called, in submission
// order. Records are read from disk on dereference, so iterating again
// observes fresh state.
class JobListing {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Job;
        using difference_type = std::ptrdiff_t;
        using pointer = const Job*;
        using reference = Job;

        iterator(const JobStore* store, std::vector<std::string>::const_iterator it)
            : m_store(store), m_it(it) {}
        Job operator*() const;
        iterator& operator++() { ++m_it; return *this; }
        bool operator==(const iterator& o) const { return m_it == o.m_it; }
        bool operator!=(const iterator& o) const { return m_it != o.m_it; }
    private:
        const JobStore* m_store;
        std::vector<std::string>::const_iterator m_it;
    };

    iterator begin() const { return iterator(m_store, m_ids.begin()); }
    iterator end() const { return iterator(m_store, m_ids.end()); }
    std::size_t size() const { return m_ids.size(); }
    bool empty() const { return m_ids.empty(); }
    const std::vector<std::string>& ids() const { return m_ids; }

private:
    friend class JobStore;
    JobListing(const JobStore* store, std::vector<std::string> ids)
        : m_store(store), m_ids(std::move(ids)) {}
    const JobStore* m_store;
    std::vector<std::string> m_ids;
};

// Filesystem table of job records under <root>/jobs/<id>/.
class JobStore {
public:
    explicit JobStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return m_root; }
    const std::filesystem::path& jobs_dir() const { return m_jobs; }

    // Creates a fresh job directory and persists name and command. Once the
    // directory exists the job is returned even if those writes failed, so
    // the caller can still give it a status.
    std::optional<Job> allocate(const std::string& name, const std::string& command) const;

    JobListing list() const;
    std::optional<Job> find(const std::string& id) const;
    // Record for id, state resolved now. Missing directories give Unknown.
    Job load(const std::string& id) const;

    StatusRecord read_status(const Job& job) const;
    StatusRecord read_status(const std::string& id) const;

    // Up to the last n lines of the log as it is right now.
    std::vector<std::string> tail_log(const Job& job, std::size_t n) const;

    // At most once per job; the value is renamed into place.
    bool write_status(const Job& job, int exit_code) const;
    bool write_pid(const Job& job, pid_t pid) const;

    // <epoch-ms>-<pid>-<seq>
    static std::string make_id();

private:
    Job layout(const std::string& id) const;
    std::filesystem::path m_root;
    std::filesystem::path m_jobs;
};

} // namespace jobrunner
