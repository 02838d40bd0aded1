#include "test_common.h"
#include "hive/file_lock.h"

#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using hive::FileLock;
using hive::ScopedFileLock;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "hive_test_file_lock";
    std::error_code ec;
    fs::remove_all(dir, ec);

    // Test 1: a second lock on the same path waits until the first is released
    {
        fs::path p = dir / "a" / "b.lock";
        FileLock first(p);
        std::string err;
        expect_true(first.try_lock_for(100, &err), "first lock should succeed: " + err);
        expect_true(fs::exists(p), "lock file and parent dirs should be created");

        FileLock second(p);
        expect_true(!second.try_lock_for(50), "second lock must time out while the first is held");

        first.unlock();
        expect_true(!first.held(), "unlock should release");
        expect_true(second.try_lock_for(100), "second lock should succeed after release");
    }

    // Test 2: ScopedFileLock gives mutual exclusion between threads
    {
        fs::path p = dir / "counter.lock";
        int counter = 0;
        std::atomic<int> inside{0};
        std::atomic<bool> overlap{false};
        std::vector<std::thread> ths;
        for (int t = 0; t < 4; t++) {
            ths.emplace_back([&] {
                for (int i = 0; i < 50; i++) {
                    ScopedFileLock lock(p, "test");
                    if (inside.fetch_add(1) != 0) overlap.store(true);
                    counter++;
                    inside.fetch_sub(1);
                }
            });
        }
        for (auto& th : ths) th.join();
        expect_true(!overlap.load(), "two threads held the lock at once");
        expect_eq_ll(counter, 200, "every increment should land");
    }

    // Test 3: destructor releases
    {
        fs::path p = dir / "scoped.lock";
        {
            ScopedFileLock lock(p, "test");
        }
        FileLock again(p);
        expect_true(again.try_lock_for(50), "lock should be free after scope exit");
    }

    fs::remove_all(dir, ec);
    std::cout << "test_file_lock: ALL PASSED\n";
    return 0;
}
