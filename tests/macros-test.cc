#include <late-core/macros.hh>

#include <nexus/test.hh>

// =========================================================================================================
// Preprocessor-level checks
// =========================================================================================================

#if defined(LC_COMPILER_MSVC) + defined(LC_COMPILER_CLANG) + defined(LC_COMPILER_GCC) != 1
#error "expected exactly one compiler family"
#endif

// the debug break in assert.hh relies on this to pick raise(SIGTRAP)
#if defined(LC_OS_LINUX) && !defined(__linux__)
#error "LC_OS_LINUX defined outside of Linux"
#endif

#if !defined(LC_ASSERT_ENABLED) || (LC_ASSERT_ENABLED != 0 && LC_ASSERT_ENABLED != 1)
#error "LC_ASSERT_ENABLED must always be defined as 0 or 1"
#endif

#if (defined(LC_DEBUG) || defined(LC_RELWITHDEBINFO) || defined(LC_ENABLE_ASSERT_IN_RELEASE)) && !LC_ASSERT_ENABLED
#error "checked build mode but LC_ASSERT_ENABLED is 0"
#endif

namespace
{
enum class bus
{
    i2c,
    spi,
};

int clock_divider(bus b)
{
    switch (b)
    {
    case bus::i2c: return 4;
    case bus::spi: return 2;
    }
    LC_BUILTIN_UNREACHABLE;
}

LC_FORCE_INLINE int scaled(int v)
{
    return v * 3;
}

LC_COLD_FUNC int report_count(int& counter)
{
    return ++counter;
}
} // namespace

// =========================================================================================================
// Runtime tests
// =========================================================================================================

TEST("macros - test build enables contract checks")
{
    CHECK(LC_ASSERT_ENABLED == 1);
}

TEST("macros - hosted Linux is detected")
{
#ifdef __linux__
    bool linux_detected = false;
#ifdef LC_OS_LINUX
    linux_detected = true;
#endif
    CHECK(linux_detected);
#else
    CHECK(true);
#endif
}

TEST("macros - function attributes keep semantics")
{
    CHECK(clock_divider(bus::i2c) == 4);
    CHECK(clock_divider(bus::spi) == 2);
    CHECK(scaled(5) == 15);

    int counter = 0;
    CHECK(report_count(counter) == 1);
}

TEST("macros - LC_UNUSED type-checks without evaluating")
{
    int writes = 0;
    LC_UNUSED(++writes);
    LC_UNUSED(report_count(writes));
    CHECK(writes == 0);
}
