#include "../test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <toolguard/security_validator.hpp>
#include <vector>

using namespace toolguard;

// ============================================================================
// EXTRA: Multithreading Tests
// ============================================================================
//
// One SecurityValidator is shared by reader threads while a writer keeps
// replacing its configuration. Every reader must observe a whole configuration
// (old or new), never a mix, and validation must keep answering correctly.
// ============================================================================

namespace
{

const std::vector<std::string> kListA = {"alpha", "beta"};
const std::vector<std::string> kListB = {};

// Thread-safe failure collector
class FailureCollector
{
  public:
    void add(const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back(message);
    }

    std::vector<std::string> get() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> failures_;
};

} // anonymous namespace

TEST(MultithreadingTest, ReadersSeeWholeSnapshots)
{
    test::TempDir temp;
    auto workspace = temp.make_dir("workspace");

    SecurityValidator validator(workspace.string());
    validator.set_forbidden_commands(kListA);

    std::atomic<bool> stop{false};
    FailureCollector failures;

    std::thread writer(
        [&]
        {
            for (int i = 0; i < 500; ++i)
                validator.set_forbidden_commands(i % 2 == 0 ? kListB : kListA);
            stop = true;
        });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t)
    {
        readers.emplace_back(
            [&]
            {
                while (!stop)
                {
                    auto snapshot = validator.policy();
                    const auto& commands = snapshot->forbidden_commands();
                    if (commands != kListA && commands != kListB)
                        failures.add("torn forbidden_commands snapshot");

                    // Independent of the list being swapped
                    if (!validator.check_permission("bash", {{"command", "ls; id"}}))
                        failures.add("injection allowed during reconfiguration");
                    if (validator.check_permission("read", {{"path", "notes.md"}}))
                        failures.add("workspace path denied during reconfiguration");
                }
            });
    }

    writer.join();
    for (auto& reader : readers)
        reader.join();

    auto collected = failures.get();
    EXPECT_TRUE(collected.empty()) << collected.size() << " failures";
}

TEST(MultithreadingTest, ConcurrentValidationIsConsistent)
{
    test::TempDir temp;
    auto workspace = temp.make_dir("workspace");
    temp.write_file("workspace/data.txt");

    const SecurityValidator validator(workspace.string());
    std::atomic<int> mismatches{0};

    auto worker = [&]
    {
        for (int i = 0; i < 200; ++i)
        {
            if (validator.check_permission("delete", {{"path", "data.txt"}}))
                ++mismatches;
            auto denied = validator.check_permission("bash", {{"command", "shutdown now"}});
            if (!denied || denied->code() != ErrorCode::ForbiddenCommand)
                ++mismatches;
            auto traversal = validator.validate_path("../../etc/passwd");
            if (!traversal || traversal->code() != ErrorCode::PathTraversal)
                ++mismatches;
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back(worker);
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(mismatches.load(), 0);
}

TEST(MultithreadingTest, AuditCallbackRunsOnCallingThreads)
{
    test::TempDir temp;
    SecurityValidator validator(temp.path().string());

    std::atomic<int> events{0};
    validator.set_audit_callback([&events](const AuditEvent&) { ++events; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&validator]
            {
                for (int i = 0; i < 50; ++i)
                    (void)validator.check_permission("bash", {{"command", "ls"}});
            });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(events.load(), 200);
}
