#define BOOST_TEST_MODULE probe_test
#include <boost/test/unit_test.hpp>

#include "libsplitbench/alloc_counter.h"
#include "libsplitbench/probe.h"
#include "test_utils.h"

#include <chrono>
#include <new>

using namespace splitbench;
using splitbench_test::Scripted_probe;

BOOST_AUTO_TEST_SUITE(system_probe_tests)

BOOST_AUTO_TEST_CASE(construction_succeeds_with_counter_linked)
{
    BOOST_CHECK_NO_THROW(System_probe());
}

BOOST_AUTO_TEST_CASE(clock_is_monotonic)
{
    System_probe probe;
    Probe::Time_point prev = probe.now();
    for (int i = 0; i < 1000; ++i) {
        Probe::Time_point cur = probe.now();
        BOOST_CHECK(cur >= prev);
        prev = cur;
    }
}

BOOST_AUTO_TEST_CASE(collection_count_follows_allocations)
{
    System_probe probe;

    uint64_t before = probe.collection_count();
    void* volatile p = ::operator new(32);
    void* volatile q = ::operator new[](64);
    ::operator delete[](q);
    ::operator delete(p);
    uint64_t after = probe.collection_count();

    BOOST_CHECK_EQUAL(after - before, 2u);
}

BOOST_AUTO_TEST_CASE(collection_count_ignores_deallocations)
{
    System_probe probe;

    void* volatile p = ::operator new(16);
    uint64_t before = probe.collection_count();
    ::operator delete(p);
    uint64_t after = probe.collection_count();

    BOOST_CHECK_EQUAL(after, before);
}

BOOST_AUTO_TEST_CASE(nothrow_allocations_are_counted)
{
    uint64_t before = alloc_counter::allocation_calls();
    void* volatile p = ::operator new(8, std::nothrow);
    uint64_t after = alloc_counter::allocation_calls();
    ::operator delete(p, std::nothrow);

    BOOST_CHECK(p != nullptr);
    BOOST_CHECK_EQUAL(after - before, 1u);
}

BOOST_AUTO_TEST_CASE(zero_byte_allocation_is_counted)
{
    uint64_t before = alloc_counter::allocation_calls();
    void* volatile p = ::operator new(0);
    uint64_t after = alloc_counter::allocation_calls();
    ::operator delete(p);

    BOOST_CHECK(p != nullptr);
    BOOST_CHECK_EQUAL(after - before, 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(stopwatch_tests)

BOOST_AUTO_TEST_CASE(never_started_reports_zero)
{
    Scripted_probe probe;
    Stopwatch sw(probe);
    sw.stop();

    BOOST_CHECK(!sw.running());
    BOOST_CHECK(sw.elapsed() == std::chrono::nanoseconds(0));
    BOOST_CHECK_EQUAL(probe.now_calls(), 0);
}

BOOST_AUTO_TEST_CASE(start_stop_measures_probe_time)
{
    Scripted_probe probe(std::chrono::milliseconds(7));
    Stopwatch sw(probe);

    sw.start();
    BOOST_CHECK(sw.running());
    sw.stop();

    BOOST_CHECK(!sw.running());
    BOOST_CHECK(sw.elapsed() == std::chrono::milliseconds(7));
    BOOST_CHECK_EQUAL(probe.now_calls(), 2);
}

BOOST_AUTO_TEST_CASE(second_start_is_ignored)
{
    Scripted_probe probe(std::chrono::milliseconds(1));
    Stopwatch sw(probe);

    sw.start();
    sw.start();
    sw.stop();

    BOOST_CHECK_EQUAL(probe.now_calls(), 2);
    BOOST_CHECK(sw.elapsed() == std::chrono::milliseconds(1));
}

BOOST_AUTO_TEST_CASE(restart_accumulates)
{
    Scripted_probe probe(std::chrono::milliseconds(2));
    Stopwatch sw(probe);

    sw.start();
    sw.stop();
    sw.start();
    sw.stop();

    BOOST_CHECK(sw.elapsed() == std::chrono::milliseconds(4));
}

BOOST_AUTO_TEST_CASE(system_clock_elapsed_non_negative)
{
    System_probe probe;
    Stopwatch sw(probe);
    sw.start();
    sw.stop();
    BOOST_CHECK(sw.elapsed() >= std::chrono::nanoseconds(0));
}

BOOST_AUTO_TEST_SUITE_END()

// vim:ts=2:sw=2:et
