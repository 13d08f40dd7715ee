#ifndef DS_TEST_HPP
#define DS_TEST_HPP

#include <iostream>
#include <fstream>
#include <string>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <vector>
#include <cstdlib>
#include <cstdio>
#include <ftw.h>
#include <sys/stat.h>

namespace ds {
namespace test {

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void registerTest(const std::string& name, std::function<void()> test) {
        tests_.push_back({name, test});
    }

    int run() {
        int failed = 0;
        int passed = 0;

        std::cout << "Running " << tests_.size() << " tests...\n\n";

        for (const auto& t : tests_) {
            std::cout << "[ RUN      ] " << t.name << "\n";
            try {
                t.test();
                std::cout << "[       OK ] " << t.name << "\n";
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[  FAILED  ] " << t.name << "\n";
                std::cout << "  Error: " << e.what() << "\n";
                failed++;
            }
        }

        std::cout << "\n";
        std::cout << "Tests passed: " << passed << "\n";
        std::cout << "Tests failed: " << failed << "\n";

        return failed > 0 ? 1 : 0;
    }

private:
    struct Test {
        std::string name;
        std::function<void()> test;
    };

    std::vector<Test> tests_;
};

class TestCase {
public:
    TestCase(const std::string& name, std::function<void()> test) {
        TestRunner::instance().registerTest(name, test);
    }
};

inline void assertTrue(bool condition, const std::string& message = "") {
    if (!condition) {
        throw std::runtime_error("Assertion failed: " + message);
    }
}

inline void assertEqual(long long expected, long long actual, const std::string& message = "") {
    if (expected != actual) {
        throw std::runtime_error("Expected " + std::to_string(expected) +
                               ", got " + std::to_string(actual) + ". " + message);
    }
}

inline void assertEqual(const std::string& expected, const std::string& actual,
                       const std::string& message = "") {
    if (expected != actual) {
        throw std::runtime_error("Expected '" + expected + "', got '" + actual + "'. " + message);
    }
}

inline void assertContains(const std::string& haystack, const std::string& needle,
                           const std::string& message = "") {
    if (haystack.find(needle) == std::string::npos) {
        throw std::runtime_error("'" + haystack + "' does not contain '" + needle + "'. " + message);
    }
}

// Fresh directory under /tmp
inline std::string makeTempDir() {
    char tmpl[] = "/tmp/devsession-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    if (!dir) {
        throw std::runtime_error("mkdtemp failed");
    }
    return dir;
}

inline void writeFile(const std::string& path, const std::string& content, mode_t mode = 0644) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write " + path);
    }
    out << content;
    out.close();
    chmod(path.c_str(), mode);
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return "";
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

inline void removeTree(const std::string& path) {
    nftw(path.c_str(), [](const char* p, const struct stat*, int, struct FTW*) {
        return ::remove(p);
    }, 16, FTW_DEPTH | FTW_PHYS);
}

#define TEST(name) \
    static void test_##name(); \
    static ds::test::TestCase testcase_##name(#name, test_##name); \
    static void test_##name()

#define ASSERT_TRUE(cond, message) ds::test::assertTrue((cond), (message))
#define ASSERT_EQUALS(expected, actual, message) ds::test::assertEqual((expected), (actual), (message))
#define ASSERT_CONTAINS(haystack, needle, message) ds::test::assertContains((haystack), (needle), (message))

} // namespace test
} // namespace ds

#endif // DS_TEST_HPP
