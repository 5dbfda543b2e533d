#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "jobs.hpp"

using namespace bgjobs;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// Tracks how many jobs run at once
struct concurrency_tracker {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  void enter() {
    int now = ++current;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
  }

  void leave() { --current; }
};

static std::size_t count_lines(const std::string &text, const std::string &needle) {
  std::size_t count = 0;
  for (auto pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

// =============================================================================
// Completion Barrier Tests
// =============================================================================

void test_barrier() {
  TEST("jobs rejects limit 0 and -1 without running logic") {
    for (std::ptrdiff_t bad : {std::ptrdiff_t{0}, std::ptrdiff_t{-1}}) {
      int calls = 0;
      bool threw = false;
      try {
        jobs(bad, [&](job_manager &) { ++calls; });
      } catch (const configuration_error &e) {
        threw = std::string(e.what()).find("> 0") != std::string::npos;
      }
      assert(threw);
      assert(calls == 0);
    }

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("jobs returns logic result") {
    int value = jobs(2, [](job_manager &) { return 17; });
    assert(value == 17);

    std::string text = jobs(1, [](job_manager &mgr) {
      auto part = mgr.background([] { return std::string("back"); });
      return part.read() + "ground";
    });
    assert(text == "background");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("jobs waits for outstanding work") {
    std::atomic<bool> finished{false};

    auto start = std::chrono::steady_clock::now();
    jobs(2, [&](job_manager &mgr) {
      mgr.background([&] {
        std::this_thread::sleep_for(80ms);
        finished = true;
      });
      // Logic returns at once; the barrier has to hold
    });
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(finished);
    assert(elapsed >= 75ms);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("jobs never exceeds the limit") {
    constexpr std::ptrdiff_t limit = 3;
    concurrency_tracker tracker;

    jobs(limit, [&](job_manager &mgr) {
      for (int i = 0; i < 15; ++i) {
        mgr.background([&] {
          tracker.enter();
          std::this_thread::sleep_for(5ms);
          tracker.leave();
        });
        assert(mgr.in_flight() <= limit);
      }
    });

    assert(tracker.peak.load() >= 1);
    assert(tracker.peak.load() <= limit);
    assert(tracker.current.load() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("launch past the limit blocks until a slot frees") {
    constexpr std::ptrdiff_t limit = 2;
    bg_result<void> gate;
    std::atomic<bool> extra_launched{false};

    jobs(limit, [&](job_manager &mgr) {
      for (std::ptrdiff_t i = 0; i < limit; ++i) {
        mgr.background([gate] { gate.read(); });
      }
      assert(mgr.in_flight() == limit);

      std::thread launcher([&]() {
        mgr.background([] {});
        extra_launched = true;
      });

      std::this_thread::sleep_for(50ms);
      assert(!extra_launched);

      gate.write();
      launcher.join();
      assert(extra_launched);
    });

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("jobs drains even when logic throws") {
    std::atomic<bool> finished{false};
    bool caught = false;

    try {
      jobs(2, [&](job_manager &mgr) {
        mgr.background([&] {
          std::this_thread::sleep_for(40ms);
          finished = true;
        });
        throw std::runtime_error("logic failed");
      });
    } catch (const std::runtime_error &e) {
      caught = std::string(e.what()) == "logic failed";
    }

    assert(caught);
    assert(finished);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("jobs from config") {
    jobs_config cfg;
    cfg.limit = 4;
    int launched = jobs(cfg, [](job_manager &mgr) {
      assert(mgr.limit() == 4);
      for (int i = 0; i < 6; ++i)
        mgr.background([] {});
      return static_cast<int>(mgr.launched());
    });
    assert(launched == 6);

    cfg.limit = 0;
    bool threw = false;
    try {
      jobs(cfg, [](job_manager &) {});
    } catch (const configuration_error &) {
      threw = true;
    }
    assert(threw);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Job Launcher Tests
// =============================================================================

void test_launcher() {
  TEST("background returns the job's value") {
    jobs(2, [](job_manager &mgr) {
      auto result = mgr.background([] { return 99; });
      assert(result.read() == 99);
      assert(result.read() == 99); // Repeated reads agree
      assert(result.ready());
    });

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background distinct values regardless of order") {
    constexpr int k = 10;
    std::vector<bg_result<int>> results = jobs(3, [](job_manager &mgr) {
      std::vector<bg_result<int>> out;
      for (int i = 0; i < k; ++i) {
        out.push_back(mgr.background([i] {
          std::this_thread::sleep_for(std::chrono::milliseconds((k - i) % 4));
          return i * 10;
        }));
      }
      return out;
    });

    // Results outlive the job group
    std::set<int> seen;
    for (auto &r : results) {
      seen.insert(r.read());
    }
    assert(seen.size() == k);
    for (int i = 0; i < k; ++i) {
      assert(seen.count(i * 10) == 1);
    }

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background returns before the job finishes") {
    jobs(1, [](job_manager &mgr) {
      bg_result<void> gate;
      auto start = std::chrono::steady_clock::now();
      auto result = mgr.background([gate] {
        gate.read();
        return 1;
      });
      auto elapsed = std::chrono::steady_clock::now() - start;

      assert(elapsed < 50ms);
      assert(!result.ready());
      gate.write();
      assert(result.read() == 1);
    });

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background passes a private copy of the context") {
    execution_context parent = execution_context{}.with_env("STAGE", "build");
    bg_result<void> gate;

    jobs(2, [&](job_manager &mgr) {
      auto seen = mgr.background(parent, [gate](const execution_context &ctx) {
        gate.read();
        return ctx.env("STAGE").value_or("");
      });

      // Changing the parent after launch must not reach the job
      parent = parent.with_env("STAGE", "deploy");
      gate.write();

      assert(seen.read() == "build");
    });
    assert(parent.env("STAGE") == "deploy");

    int base = 5;
    int doubled = jobs(1, [&](job_manager &mgr) {
      return mgr.background(base, [](const int &b) { return b * 2; }).read();
    });
    assert(doubled == 10);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background move-only work") {
    auto payload = std::make_unique<int>(31);
    int value = jobs(1, [&](job_manager &mgr) {
      return mgr.background([p = std::move(payload)] { return *p; }).read();
    });
    assert(value == 31);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background copies a reference result") {
    const std::string name = "artifact.tar";
    const execution_context ctx = execution_context{}.with_env("OUT", "dist");

    auto [plain, from_ctx] = jobs(2, [&](job_manager &mgr) {
      auto a = mgr.background([&name]() -> const std::string & { return name; });
      auto b = mgr.background(ctx, [](const execution_context &c) -> const execution_context & {
        return c;
      });
      static_assert(std::is_same_v<decltype(a), bg_result<std::string>>);
      static_assert(std::is_same_v<decltype(b), bg_result<execution_context>>);
      return std::make_pair(a.read(), b.read());
    });
    assert(plain == "artifact.tar");
    assert(from_ctx.env("OUT").value_or("") == "dist");

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("nested background from inside a job") {
    int total = jobs(3, [](job_manager &mgr) {
      auto outer = mgr.background([&mgr] {
        auto inner = mgr.background([] { return 2; });
        return inner.read() + 1;
      });
      return outer.read();
    });
    assert(total == 3);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("background on a closed group is rejected") {
    job_manager mgr(2);
    mgr.background([] {});
    mgr.wait();
    assert(mgr.state() == job_group_state::closed);
    assert(mgr.in_flight() == 0);

    bool threw = false;
    try {
      mgr.background([] {});
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);
    assert(mgr.launched() == 1);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("only the group's own jobs launch while it drains") {
    job_manager mgr(2);
    bg_result<void> gate;

    auto outer = mgr.background([&mgr, gate] {
      gate.read();
      // Runs after wait() has started draining
      return mgr.background([] { return 4; }).read() + 1;
    });

    std::thread waiter([&mgr]() { mgr.wait(); });
    while (mgr.state() == job_group_state::open) {
      std::this_thread::sleep_for(1ms);
    }
    assert(mgr.state() == job_group_state::draining);

    bool threw = false;
    try {
      mgr.background([] {});
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);

    gate.write();
    waiter.join();

    assert(outer.read() == 5);
    assert(mgr.state() == job_group_state::closed);
    assert(mgr.launched() == 2);
    assert(mgr.in_flight() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Failure Propagation Tests
// =============================================================================

void test_failures() {
  TEST("failed job surfaces once after the drain") {
    std::ostringstream log_output;
    default_logger().set_sink(&log_output);
    default_logger().set_level(log_level::error);

    std::atomic<bool> sibling_done{false};
    bg_result<int> failed_result;
    bool caught = false;
    std::size_t failure_count = 0;

    try {
      jobs(2, [&](job_manager &mgr) {
        failed_result = mgr.background([]() -> int {
          throw std::runtime_error("compile step failed");
        });
        mgr.background([&] {
          std::this_thread::sleep_for(30ms);
          sibling_done = true;
        });
      });
    } catch (const job_failure &e) {
      caught = true;
      failure_count = e.count();
      assert(std::string(e.what()).find("compile step failed") !=
             std::string::npos);
    }

    default_logger().set_sink(nullptr);
    default_logger().set_level(log_level::warn);

    assert(caught);
    assert(failure_count == 1);
    assert(sibling_done);
    assert(count_lines(log_output.str(), "background job failed") == 1);

    // The result carries the failure instead of blocking forever
    assert(failed_result.has_failed());
    bool rethrown = false;
    try {
      (void)failed_result.read();
    } catch (const std::runtime_error &e) {
      rethrown = std::string(e.what()) == "compile step failed";
    }
    assert(rethrown);

    PASS();
  } catch (const std::exception &e) {
    default_logger().set_sink(nullptr);
    FAIL(e.what());
  }

  TEST("one failure entry per failed job") {
    default_logger().set_level(log_level::off);
    std::size_t failures = 0;
    std::atomic<int> succeeded{0};

    try {
      jobs(2, [&](job_manager &mgr) {
        for (int i = 0; i < 6; ++i) {
          mgr.background([i, &succeeded] {
            if (i % 2 == 0)
              throw std::runtime_error("job " + std::to_string(i));
            ++succeeded;
          });
        }
      });
    } catch (const job_failure &e) {
      failures = e.count();
      std::set<std::string> messages;
      for (const auto &f : e.failures()) {
        messages.insert(describe_exception(f));
      }
      assert(messages.size() == 3);
      assert(messages.count("job 0") == 1);
      assert(messages.count("job 2") == 1);
      assert(messages.count("job 4") == 1);
    }
    default_logger().set_level(log_level::warn);

    assert(failures == 3);
    assert(succeeded == 3);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("failed job still releases its slot") {
    default_logger().set_level(log_level::off);
    job_manager mgr(1);

    mgr.background([] { throw std::runtime_error("first"); });
    // Would block forever if the failed job kept the slot
    auto second = mgr.background([] { return 2; });
    assert(second.read() == 2);

    bool threw = false;
    try {
      mgr.wait();
    } catch (const job_failure &e) {
      threw = e.count() == 1;
      bool first = false;
      try {
        e.rethrow_first();
      } catch (const std::runtime_error &inner) {
        first = std::string(inner.what()) == "first";
      }
      assert(first);
    }
    default_logger().set_level(log_level::warn);

    assert(threw);
    assert(mgr.failure_count() == 0); // Handed over to job_failure

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("logic exception takes precedence over job failures") {
    default_logger().set_level(log_level::off);
    bool logic_error_seen = false;

    try {
      jobs(2, [](job_manager &mgr) {
        mgr.background([] { throw std::runtime_error("job"); });
        throw std::invalid_argument("logic");
      });
    } catch (const std::invalid_argument &e) {
      logic_error_seen = std::string(e.what()) == "logic";
    } catch (const job_failure &) {
      logic_error_seen = false;
    }
    default_logger().set_level(log_level::warn);

    assert(logic_error_seen);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Job Group Tests ===" << std::endl << std::endl;

  std::cout << "--- Completion Barrier Tests ---" << std::endl;
  test_barrier();
  std::cout << std::endl;

  std::cout << "--- Job Launcher Tests ---" << std::endl;
  test_launcher();
  std::cout << std::endl;

  std::cout << "--- Failure Propagation Tests ---" << std::endl;
  test_failures();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
