// guest_demo.cpp - RISC-V guest exercising the rvix process syscalls
//
// Cross-compile with:
//   riscv64-linux-gnu-g++ -static -O2 -o guest_demo guest_demo.cpp
//
// Run:
//   rvix ./guest_demo

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#define GREEN "\033[32m"
#define RED   "\033[31m"
#define RESET "\033[0m"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name, condition) do { \
    if (condition) { \
        printf(GREEN "[PASS]" RESET " %s\n", name); \
        tests_passed++; \
    } else { \
        printf(RED "[FAIL]" RESET " %s\n", name); \
        tests_failed++; \
    } \
} while(0)

// Syscall numbers, see runtime/abi.hpp
enum : long {
    SYS_thread_sleep = 500,
    SYS_poll_oneoff  = 501,
    SYS_proc_fork    = 502,
    SYS_proc_join    = 504,
    SYS_proc_exit    = 505,
    SYS_proc_signal  = 506,
    SYS_proc_id      = 507,
    SYS_proc_parent  = 508,
    SYS_sched_yield  = 509,
};

static long rv_syscall(long n, long a0 = 0, long a1 = 0, long a2 = 0, long a3 = 0) {
    register long r_a0 asm("a0") = a0;
    register long r_a1 asm("a1") = a1;
    register long r_a2 asm("a2") = a2;
    register long r_a3 asm("a3") = a3;
    register long r_a7 asm("a7") = n;
    asm volatile("ecall"
                 : "+r"(r_a0)
                 : "r"(r_a1), "r"(r_a2), "r"(r_a3), "r"(r_a7)
                 : "memory");
    return r_a0;
}

static uint64_t now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000000ULL + uint64_t(ts.tv_nsec);
}

struct Subscription {
    uint64_t userdata;
    uint8_t tag;
    uint8_t pad[7];
    uint32_t clock_id;
    uint32_t pad2;
    uint64_t timeout;
    uint64_t precision;
    uint16_t flags;
    uint8_t pad3[6];
};
static_assert(sizeof(Subscription) == 48, "subscription layout");

struct Event {
    uint64_t userdata;
    uint16_t error;
    uint8_t type;
    uint8_t pad[5];
    uint64_t nbytes;
    uint16_t flags;
    uint8_t pad2[6];
};
static_assert(sizeof(Event) == 32, "event layout");

void test_ids() {
    printf("\n=== Testing process ids ===\n");

    uint32_t pid = 0, ppid = 1;
    TEST("proc_id succeeds", rv_syscall(SYS_proc_id, (long)&pid) == 0);
    TEST("pid > 0", pid > 0);
    TEST("proc_parent succeeds", rv_syscall(SYS_proc_parent, 0, (long)&ppid) == 0);
    printf("  pid=%u ppid=%u\n", pid, ppid);
}

void test_sleep() {
    printf("\n=== Testing thread_sleep ===\n");

    uint64_t start = now_ns();
    long ret = rv_syscall(SYS_thread_sleep, 20'000'000);  // 20 ms
    uint64_t elapsed = now_ns() - start;
    TEST("thread_sleep returns success", ret == 0);
    TEST("slept at least 20ms", elapsed >= 20'000'000);
    printf("  slept %lu us\n", (unsigned long)(elapsed / 1000));

    TEST("sched_yield returns success", rv_syscall(SYS_sched_yield) == 0);
}

void test_poll_clock() {
    printf("\n=== Testing poll_oneoff ===\n");

    Subscription sub;
    memset(&sub, 0, sizeof(sub));
    sub.userdata = 0x1234;
    sub.tag = 0;          // clock
    sub.clock_id = 1;     // monotonic
    sub.timeout = 5'000'000;

    Event ev;
    memset(&ev, 0, sizeof(ev));
    uint64_t nevents = 0;
    long ret = rv_syscall(SYS_poll_oneoff, (long)&sub, (long)&ev, 1, (long)&nevents);
    TEST("poll_oneoff returns success", ret == 0);
    TEST("one clock event", nevents == 1);
    TEST("event carries userdata", ev.userdata == 0x1234 && ev.type == 0);

    ret = rv_syscall(SYS_poll_oneoff, (long)&sub, (long)&ev, 0, (long)&nevents);
    TEST("zero subscriptions is EINVAL", ret == 28);
}

void test_fork(bool copy) {
    printf("\n=== Testing proc_fork (%s) ===\n", copy ? "copy" : "lazy");

    volatile int marker = 42;
    uint32_t child = 0xdead;
    long ret = rv_syscall(SYS_proc_fork, copy ? 1 : 0, (long)&child);
    if (ret == 0 && child == 0) {
        // In the child
        marker = 7;
        rv_syscall(SYS_proc_exit, marker + 3);
        __builtin_unreachable();
    }
    TEST("proc_fork returns success", ret == 0);
    TEST("parent sees child pid", child != 0 && child != 0xdead);
    if (copy) {
        TEST("child writes stay in the child", marker == 42);
    }

    uint32_t joined = child;
    int32_t status = -1;
    ret = rv_syscall(SYS_proc_join, (long)&joined, 0, (long)&status);
    TEST("proc_join returns success", ret == 0);
    TEST("joined the forked child", joined == child);
    TEST("child exit code observed", status == 10);
    printf("  child pid=%u status=%d\n", child, status);

    joined = child;
    TEST("second join reports ECHILD", rv_syscall(SYS_proc_join, (long)&joined, 1, (long)&status) == 12);
}

void test_signal() {
    printf("\n=== Testing proc_signal ===\n");

    uint32_t child = 0;
    long ret = rv_syscall(SYS_proc_fork, 1, (long)&child);
    if (ret == 0 && child == 0) {
        // Sleeps until killed
        rv_syscall(SYS_thread_sleep, 10'000'000'000L);
        rv_syscall(SYS_proc_exit, 0);
        __builtin_unreachable();
    }
    TEST("signal 0 probes the child", rv_syscall(SYS_proc_signal, child, 0) == 0);
    TEST("SIGTERM delivered", rv_syscall(SYS_proc_signal, child, 15) == 0);

    uint32_t joined = child;
    int32_t status = 0;
    rv_syscall(SYS_proc_join, (long)&joined, 0, (long)&status);
    TEST("killed child exits with 128+15", status == 143);
    TEST("unknown pid is ESRCH", rv_syscall(SYS_proc_signal, 99999, 15) == 71);
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    printf("rvix guest test suite (RISC-V)\n");

    test_ids();
    test_sleep();
    test_poll_clock();
    test_fork(true);
    test_fork(false);
    test_signal();

    printf("\nResults: " GREEN "%d passed" RESET ", " RED "%d failed" RESET "\n",
           tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
