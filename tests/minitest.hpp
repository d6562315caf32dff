#pragma once
#include <fmt/core.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// Mini harness: TEST(nome) registra il caso, run_all() li esegue tutti.
namespace minitest {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
    Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({ name, std::move(fn) }); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Esegue un caso: true se passa. Qualsiasi eccezione (anche non std) è un fallimento.
inline bool run_one(const TestCase& t) {
    try {
        t.fn();
        fmt::print("[PASS] {}\n", t.name);
        return true;
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "[FAIL] {}: {}\n", t.name, e.what());
    }
    catch (...) {
        fmt::print(stderr, "[FAIL] {}: unknown exception\n", t.name);
    }
    return false;
}

inline int run_all() {
    int failed = 0, passed = 0;
    for (auto& t : registry()) {
        if (run_one(t)) ++passed;
        else ++failed;
    }
    fmt::print("\n{} passed, {} failed\n", passed, failed);
    return failed == 0 ? 0 : 1;
}

} // namespace minitest

#define TEST(name) \
    static void name(); \
    static ::minitest::Registrar name##_registrar{ #name, name }; \
    static void name()

#define ASSERT_TRUE(expr) do { if (!(expr)) throw ::minitest::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if ((expr)) throw ::minitest::AssertionError(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if (!((a) == (b))) throw ::minitest::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } while(0)
#define ASSERT_NE(a,b) do { if (!((a) != (b))) throw ::minitest::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } while(0)

// Verifica che stmt lanci un'eccezione di tipo ex_type
#define ASSERT_THROWS(stmt, ex_type) do { \
    bool _thrown = false; \
    try { stmt; } catch (const ex_type&) { _thrown = true; } \
    if (!_thrown) throw ::minitest::AssertionError(std::string("ASSERT_THROWS failed: ") + #stmt " !-> " #ex_type); \
} while(0)
