/*
 * dircat C++ - Shared test helpers
 */
#ifndef dircat_TESTS_TEST_HELPERS_HPP
#define dircat_TESTS_TEST_HELPERS_HPP

#include <dircat/security/dns_resolver.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <thread>
#include <vector>
#include <climits>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dircat {
namespace testing_support {

// Offline resolver answering from a fixed table
class FakeDnsResolver : public DnsResolver {
public:
    FakeDnsResolver() : calls_(0), delay_ms_(0) {}

    void add(const std::string& host, const std::string& address) {
        IpAddress ip;
        if (IpAddress::parse(address, ip)) {
            table_[host].push_back(ip);
        }
    }

    void set_delay_ms(int ms) { delay_ms_ = ms; }
    int calls() const { return calls_.load(); }

    ResolveResult resolve(const std::string& host) override {
        ++calls_;
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        std::map<std::string, std::vector<IpAddress> >::const_iterator it = table_.find(host);
        if (it == table_.end()) {
            return ResolveResult::fail("Name or service not known");
        }
        return ResolveResult::ok(it->second);
    }

private:
    std::map<std::string, std::vector<IpAddress> > table_;
    std::atomic<int> calls_;
    int delay_ms_;
};

inline int remove_entry(const char* path, const struct stat*, int, struct FTW*) {
    return ::remove(path);
}

// mkdtemp directory removed (recursively) on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/dircat_test_XXXXXX";
        char* made = mkdtemp(tmpl);
        if (made) {
            char resolved[PATH_MAX];
            path_ = realpath(made, resolved) ? std::string(resolved) : std::string(made);
        }
    }

    ~TempDir() {
        if (!path_.empty()) {
            nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    std::string file(const std::string& name, const std::string& content = "data\n") const {
        std::string p = path_ + "/" + name;
        std::ofstream out(p.c_str());
        out << content;
        return p;
    }

    std::string dir(const std::string& name) const {
        std::string p = path_ + "/" + name;
        mkdir(p.c_str(), 0755);
        return p;
    }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    std::string path_;
};

} // namespace testing_support
} // namespace dircat

#endif // dircat_TESTS_TEST_HELPERS_HPP
