#include "fork.hpp"
#include "fake_guest.hpp"
#include "proc.hpp"

#include <gtest/gtest.h>

namespace rvix {
namespace {

using namespace std::chrono_literals;
using test::FakeGuest;
using test::Harness;
using test::Instruction;
using test::Journal;
using test::Program;
using test::exit_with;
using test::frame;
using test::record;
using test::sys;

// Stack frame used by the fork programs:
//   sp+0  pid slot
//   sp+8  join status
//   sp+16 marker
constexpr uint32_t MARKER = 0xCAFE0001;

RuntimeConfig fast_config() {
    RuntimeConfig config;
    config.poll_interval = 10ms;
    return config;
}

Instruction fork_call(bool copy) {
    return sys([copy](ThreadEnv& e, FakeGuest& g) { return proc_fork(e, copy, g.sp()); });
}

Instruction join_slot() {
    return sys([](ThreadEnv& e, FakeGuest& g) { return proc_join(e, g.sp(), 0, g.sp() + 8); });
}

// Skips to `target` in the parent, falls through in the child
Instruction parent_goes_to(uint64_t target) {
    return [target](FakeGuest& g) {
        if (g.load_u32(g.sp()) != 0) g.jump(target);
    };
}

TEST(CopyForkTest, ChildResumesWithZeroAndParentJoinsIt) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    auto s = h.start("copy", {
        /* 0 */ frame(64),
        /* 1 */ [](FakeGuest& g) {
            g.store_u32(g.sp() + 16, MARKER);
            g.global = 5;
        },
        /* 2 */ fork_call(true),
        /* 3 */ record(journal, "after_fork", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.load_u32(g.sp()), g.load_u32(g.sp() + 16), g.global,
                                         g.a0()};
        }),
        /* 4 */ parent_goes_to(8),
        /* 5 */ [](FakeGuest& g) { g.env().fds().pipe(); },
        /* 6 */ record(journal, "child_fds", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.env().fds().size()};
        }),
        /* 7 */ exit_with(10),
        /* 8 */ join_slot(),
        /* 9 */ record(journal, "joined", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.a0(), g.load_u32(g.sp() + 8), g.load_u32(g.sp()),
                                         g.env().fds().size(), g.env().process().children().size()};
        }),
        /* 10 */ exit_with(0),
    });

    ASSERT_EQ(h.wait(s.process), 0);

    auto after = journal->find("after_fork");
    ASSERT_EQ(after.size(), 2u);
    const auto& parent = after[0].pid == s.process->pid() ? after[0] : after[1];
    const auto& child = after[0].pid == s.process->pid() ? after[1] : after[0];
    ASSERT_NE(child.pid, s.process->pid());

    EXPECT_EQ(parent.values, (std::vector<uint64_t>{child.pid, MARKER, 5, 0}));
    EXPECT_EQ(child.values, (std::vector<uint64_t>{0, MARKER, 5, 0}));

    auto child_fds = journal->find("child_fds");
    ASSERT_EQ(child_fds.size(), 1u);
    EXPECT_EQ(child_fds[0].values[0], 5u);

    auto joined = journal->find("joined");
    ASSERT_EQ(joined.size(), 1u);
    // Distinct tables: the child's pipe never reached the parent
    EXPECT_EQ(joined[0].values, (std::vector<uint64_t>{0, 10, child.pid, 3, 0}));
}

TEST(CopyForkTest, ChildParentIsTheForkingProcess) {
    Harness h(fast_config());
    auto s = h.start("parentage", {
        frame(64),
        fork_call(true),
        parent_goes_to(5),
        sys([](ThreadEnv& e, FakeGuest& g) { return proc_parent(e, 0, g.sp() + 16); }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 16))); },
        join_slot(),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 8))); },
    });

    EXPECT_EQ(h.wait(s.process), static_cast<ExitCode>(s.process->pid()));
}

TEST(LazyForkTest, ChildBorrowsExecutionUntilExit) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    auto s = h.start("vfork", {
        /* 0 */ frame(64),
        /* 1 */ [](FakeGuest& g) {
            g.store_u32(g.sp() + 16, MARKER);
            g.global = 5;
        },
        /* 2 */ fork_call(false),
        /* 3 */ parent_goes_to(7),
        /* 4 */ record(journal, "child"),
        /* 5 */ [](FakeGuest& g) {
            g.write_value<uint32_t>(FakeGuest::HEAP, 0xBEEF);
            g.store_u32(g.sp() + 16, 0xDEAD);
            g.global = 99;
        },
        /* 6 */ sys([](ThreadEnv& e, FakeGuest&) { return proc_exit(e, 10); }),
        /* 7 */ record(journal, "parent", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.load_u32(g.sp()), g.load_u32(g.sp() + 16),
                                         g.read_value<uint32_t>(FakeGuest::HEAP), g.global, g.a0()};
        }),
        /* 8 */ join_slot(),
        /* 9 */ [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 8))); },
    });

    ASSERT_EQ(h.wait(s.process), 10);

    auto child = journal->find("child");
    ASSERT_EQ(child.size(), 1u);
    EXPECT_NE(child[0].pid, s.process->pid());

    auto parent = journal->find("parent");
    ASSERT_EQ(parent.size(), 1u);
    EXPECT_EQ(parent[0].pid, s.process->pid());
    // Stack and store come back; memory outside the stack keeps the child's write
    EXPECT_EQ(parent[0].values, (std::vector<uint64_t>{child[0].pid, MARKER, 0xBEEF, 5, 0}));
}

TEST(LazyForkTest, ExecStartsChildImageAndResumesParent) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    h.add_program("/bin/child", {
        record(journal, "exec", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.args().size(),
                                         g.args().size() == 2 && g.args()[1] == "x"};
        }),
        exit_with(3),
    }, AddressWidth::Bits64, true);

    auto s = h.start("spawner", {
        /* 0 */ frame(64),
        /* 1 */ fork_call(false),
        /* 2 */ parent_goes_to(5),
        /* 3 */ sys([](ThreadEnv& e, FakeGuest&) {
            return proc_exec(e, "/bin/child", {"/bin/child", "x"});
        }),
        /* 4 */ exit_with(100),  // exec failed
        /* 5 */ record(journal, "parent", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.load_u32(g.sp()), g.a0()};
        }),
        /* 6 */ join_slot(),
        /* 7 */ [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 8))); },
    });

    ASSERT_EQ(h.wait(s.process), 3);

    auto exec = journal->find("exec");
    ASSERT_EQ(exec.size(), 1u);
    EXPECT_NE(exec[0].pid, s.process->pid());
    EXPECT_EQ(exec[0].values, (std::vector<uint64_t>{2, 1}));

    auto parent = journal->find("parent");
    ASSERT_EQ(parent.size(), 1u);
    EXPECT_EQ(parent[0].values, (std::vector<uint64_t>{exec[0].pid, 0}));
}

TEST(LazyForkTest, NestedForkInsideVforkCopies) {
    Harness h(fast_config());
    auto s = h.start("nested", {
        /* 0 */ frame(64),
        /* 1 */ fork_call(false),
        /* 2 */ parent_goes_to(9),
        // vfork child: forks again, which must copy
        /* 3 */ [](FakeGuest& g) {
            if (!g.env().vfork) g.exit(50);
        },
        /* 4 */ fork_call(false),
        /* 5 */ parent_goes_to(7),
        /* 6 */ exit_with(4),
        /* 7 */ join_slot(),
        /* 8 */ [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 8)) + 20); },
        /* 9 */ join_slot(),
        /* 10 */ [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.load_u32(g.sp() + 8))); },
    });

    // grandchild exits 4, the vfork child 24
    EXPECT_EQ(h.wait(s.process), 24);
}

TEST(ExecTest, ExecWithoutVforkReplacesTheImage) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    h.add_program("/bin/next", {
        record(journal, "next", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.args().size(), g.args()[0] == "/bin/next"};
        }),
        exit_with(7),
    }, AddressWidth::Bits64, true);

    auto s = h.start("image", {
        sys([](ThreadEnv& e, FakeGuest&) { return proc_exec(e, "/bin/next", {}); }),
        exit_with(100),
    });

    ASSERT_EQ(h.wait(s.process), 7);
    auto next = journal->find("next");
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].pid, s.process->pid());
    EXPECT_EQ(next[0].values, (std::vector<uint64_t>{1, 1}));
}

TEST(ExecTest, MissingFileIsNoent) {
    Harness h(fast_config());
    auto s = h.start("missing", {
        sys([](ThreadEnv& e, FakeGuest&) { return proc_exec(e, "/bin/nothing", {}); }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.a0())); },
    });
    EXPECT_EQ(h.wait(s.process), exit_code_from(Errno::Noent));
}

TEST(ExecTest, NonElfIsNoexec) {
    Harness h(fast_config());
    h.fs->add_virtual_file("/bin/script", std::string("#!/bin/sh\necho hi\n"));
    auto s = h.start("script", {
        sys([](ThreadEnv& e, FakeGuest&) { return proc_exec(e, "/bin/script", {}); }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.a0())); },
    });
    EXPECT_EQ(h.wait(s.process), exit_code_from(Errno::Noexec));
}

// a0, pid slot and number of children after a fork the runtime refused
Program refused_fork(std::shared_ptr<Journal> journal, Instruction setup) {
    return {
        frame(64),
        std::move(setup),
        fork_call(true),
        record(journal, "refused", [](FakeGuest& g) {
            return std::vector<uint64_t>{g.a0(), g.load_u32(g.sp()),
                                         g.env().process().children().size()};
        }),
        exit_with(0),
    };
}

TEST(ForkFailureTest, TaskLimitRefusesTheChild) {
    RuntimeConfig config = fast_config();
    config.max_tasks = 1;
    Harness h(config);
    auto journal = std::make_shared<Journal>();
    auto s = h.start("limited", refused_fork(journal, [](FakeGuest&) {}));

    ASSERT_EQ(h.wait(s.process), 0);
    auto refused = journal->find("refused");
    ASSERT_EQ(refused.size(), 1u);
    EXPECT_EQ(refused[0].values,
              (std::vector<uint64_t>{static_cast<uint64_t>(Errno::Again), 0, 0}));
}

TEST(ForkFailureTest, MemoryCopyFailureIsAgain) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    auto s = h.start("noclone", refused_fork(journal, [](FakeGuest& g) { g.fail_clone = true; }));

    ASSERT_EQ(h.wait(s.process), 0);
    auto refused = journal->find("refused");
    ASSERT_EQ(refused.size(), 1u);
    EXPECT_EQ(refused[0].values,
              (std::vector<uint64_t>{static_cast<uint64_t>(Errno::Again), 0, 0}));
}

class PidSlotTest : public ::testing::TestWithParam<bool> {};

TEST_P(PidSlotTest, SlotOutsideTheStackTerminates) {
    Harness h(fast_config());
    auto journal = std::make_shared<Journal>();
    const bool copy = GetParam();
    auto s = h.start("heapslot", {
        frame(64),
        sys([copy](ThreadEnv& e, FakeGuest&) { return proc_fork(e, copy, FakeGuest::HEAP); }),
        record(journal, "continued"),
        exit_with(0),
    });

    EXPECT_EQ(h.wait(s.process), exit_code_from(Errno::Memviolation));
    EXPECT_TRUE(journal->find("continued").empty());
    EXPECT_TRUE(s.process->children().empty());
}

TEST_P(PidSlotTest, UnwritableSlotIsMemviolation) {
    Harness h(fast_config());
    const bool copy = GetParam();
    auto s = h.start("badslot", {
        frame(64),
        sys([copy](ThreadEnv& e, FakeGuest&) { return proc_fork(e, copy, 0x10); }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.a0())); },
    });

    EXPECT_EQ(h.wait(s.process), exit_code_from(Errno::Memviolation));
    EXPECT_TRUE(s.process->children().empty());
}

INSTANTIATE_TEST_SUITE_P(BothModes, PidSlotTest, ::testing::Values(true, false),
                         [](const auto& info) { return info.param ? "Copy" : "Lazy"; });

}  // namespace
}  // namespace rvix
