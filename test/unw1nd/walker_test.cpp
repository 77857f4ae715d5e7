#include <doctest/doctest.h>

#include <array>
#include <string>
#include <vector>

#if defined(__x86_64__) && defined(__linux__)
#include <csignal>

#include <dlfcn.h>
#include <signal.h>
#include <ucontext.h>
#endif

#include "cfi_fixtures.hpp"
#include "unw1nd/walker/walker.hpp"

using unw1nd::tagged_word;
using unw1nd::walk_control;
using unw1nd::registers::x86_64_frame_registers;
using unw1nd_test::emit;
namespace dw = llvm::dwarf;

namespace {

// collects trace lines so tests can see what the walker reported
struct recording_logger {
  std::shared_ptr<std::vector<std::string>> lines = std::make_shared<std::vector<std::string>>();

  bool enabled(unw1nd::log::log_level) const noexcept { return true; }
  void write(unw1nd::log::log_level, std::string_view message) const { lines->emplace_back(message); }
};

x86_64_frame_registers regs(unw1nd::word bp, unw1nd::word sp, unw1nd::word ip) {
  return x86_64_frame_registers(tagged_word::valid(bp), tagged_word::valid(sp), tagged_word::valid(ip));
}

/**
 * three nested frames A -> B -> C. B and C save the caller's frame pointer at
 * cfa-16 and the return address at cfa-8, with cfa = sp + 16. A has no entry,
 * so it is the oldest frame the table knows about.
 */
struct nested_frames {
  std::shared_ptr<unw1nd_test::synthetic_cfi> cfi = unw1nd_test::synthetic_cfi::create();
  unw1nd_test::map_reader memory;

  nested_frames() {
    emit(cfi->common_program(), dw::DW_CFA_def_cfa, {7, 16});
    emit(cfi->common_program(), dw::DW_CFA_offset, {16, 1});
    emit(cfi->common_program(), dw::DW_CFA_offset, {6, 2});

    // C's frame: cfa 0x7010
    memory.words[0x7008] = 0x2010;
    memory.words[0x7000] = 0x7200;
    // B's frame: cfa 0x7020
    memory.words[0x7018] = 0x1010;
    memory.words[0x7010] = 0x7300;
  }

  unw1nd::options configuration() {
    const auto& c = cfi->add_descriptor(0x3000, 0x100);
    const auto& b = cfi->add_descriptor(0x2000, 0x100);
    unw1nd::options out;
    out.add_entry(cfi->entry(c)).add_entry(cfi->entry(b));
    return out;
  }

  static x86_64_frame_registers start() { return regs(0x7100, 0x7000, 0x3010); }
};

} // namespace

TEST_CASE("walk visits every frame innermost first") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  std::vector<x86_64_frame_registers> seen;
  const auto walked = walker.walk(nested_frames::start(), [&](const x86_64_frame_registers& frame) {
    seen.push_back(frame);
  });

  REQUIRE(seen.size() == 3);
  CHECK(seen[0] == nested_frames::start());
  CHECK(seen[1] == regs(0x7200, 0x7010, 0x2010));
  CHECK(seen[2] == regs(0x7300, 0x7020, 0x1010));

  CHECK(walked.error.code == unw1nd::error_code::no_unwind_info_for_address);
  CHECK(walked.error.address == 0x1010);
  CHECK(walker.reader().reads == 4);
}

TEST_CASE("walk stops when the callback breaks") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  std::vector<unw1nd::word> ips;
  const auto walked = walker.walk(nested_frames::start(), [&](const x86_64_frame_registers& frame) {
    ips.push_back(frame.ip().value());
    return ips.size() == 2 ? walk_control::break_walk : walk_control::continue_walk;
  });

  REQUIRE(walked.ok());
  CHECK(walked.value == walk_control::break_walk);
  CHECK((ips == std::vector<unw1nd::word>{0x3010, 0x2010}));
  // one step between the two frames, nothing after the break
  CHECK(walker.reader().reads == 2);
}

TEST_CASE("walk calls back on the start frame before stepping") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  int calls = 0;
  const auto walked = walker.walk(nested_frames::start(), [&](const x86_64_frame_registers& frame) {
    ++calls;
    CHECK(frame == nested_frames::start());
    return false;
  });

  REQUIRE(walked.ok());
  CHECK(calls == 1);
  CHECK(walker.reader().reads == 0);
}

TEST_CASE("walk callbacks returning results stop on failure") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  int calls = 0;
  const auto walked = walker.walk(nested_frames::start(), [&](const x86_64_frame_registers&) {
    ++calls;
    if (calls == 2) {
      return unw1nd::error_result<int>(unw1nd::make_error(unw1nd::error_code::invalid_tagged_word, "stop here"));
    }
    return unw1nd::ok_result(calls);
  });

  REQUIRE(walked.ok());
  CHECK(calls == 2);
  CHECK(walked.value.error.code == unw1nd::error_code::invalid_tagged_word);
}

TEST_CASE("options accepts a batch of entries") {
  nested_frames frames;
  const auto& c = frames.cfi->add_descriptor(0x3000, 0x100);
  const auto& b = frames.cfi->add_descriptor(0x2000, 0x100);
  const std::vector<unw1nd::table::unwind_entry> batch = {frames.cfi->entry(c), frames.cfi->entry(b)};

  unw1nd::options configuration;
  configuration.add_entries(batch);
  CHECK(configuration.table().size() == 2);
  CHECK_FALSE(configuration.table().frozen());

  auto walker = std::move(configuration).build_with(frames.memory, unw1nd::log::ignore_logs{});
  const auto stepped = walker.walk_one(nested_frames::start());
  REQUIRE(stepped.ok());
  CHECK(stepped.value.ip() == tagged_word::valid(0x2010));
}

TEST_CASE("walk_one without an entry leaves the walker usable") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  const auto missing = walker.walk_one(regs(0, 0x7000, 0x9000));
  CHECK(missing.error.code == unw1nd::error_code::no_unwind_info_for_address);
  CHECK(missing.error.address == 0x9000);

  const auto stepped = walker.walk_one(nested_frames::start());
  REQUIRE(stepped.ok());
  CHECK(stepped.value == regs(0x7200, 0x7010, 0x2010));

  // the end of an entry belongs to nobody
  CHECK(walker.walk_one(regs(0, 0x7000, 0x3100)).error.code == unw1nd::error_code::no_unwind_info_for_address);
}

TEST_CASE("walk_one rejects an unknown instruction pointer") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});

  const x86_64_frame_registers lost(tagged_word::valid(1), tagged_word::valid(2), tagged_word::invalid());
  CHECK(walker.walk_one(lost).error.code == unw1nd::error_code::invalid_tagged_word);
}

TEST_CASE("walk_one surfaces decoder errors and recovers") {
  auto cfi = unw1nd_test::synthetic_cfi::create();
  emit(cfi->common_program(), dw::DW_CFA_def_cfa, {7, 16});
  auto& broken = cfi->add_descriptor(0x5000, 0x10);
  emit(broken.cfis(), dw::DW_CFA_restore_state);
  auto& fine = cfi->add_descriptor(0x6000, 0x10);

  unw1nd::options configuration;
  configuration.add_entry(cfi->entry(broken)).add_entry(cfi->entry(fine));
  auto walker = std::move(configuration).build_with(unw1nd_test::map_reader{}, unw1nd::log::ignore_logs{});

  const auto failed = walker.walk_one(regs(0, 0x7000, 0x5004));
  CHECK(failed.error.code == unw1nd::error_code::decoder_error);
  CHECK(failed.error.cfi == unw1nd::cfi_error::remember_stack_underflow);

  const auto stepped = walker.walk_one(regs(0x55, 0x7000, 0x6004));
  REQUIRE(stepped.ok());
  CHECK(stepped.value.sp() == tagged_word::valid(0x7010));
  CHECK(stepped.value.bp() == tagged_word::valid(0x55));
  CHECK(stepped.value.ip().is_invalid());
}

TEST_CASE("walker relocates entries decoded from eh_frame bytes") {
  unw1nd::options configuration;
  const auto added =
      configuration.add_entries_from_eh_frame(0x400000, unw1nd_test::sample_section_address, unw1nd_test::sample_eh_frame());
  REQUIRE(added.ok());
  CHECK(added.value == 1);
  REQUIRE(configuration.table().size() == 1);
  CHECK(configuration.table().entries()[0].range.start == 0x401000);
  CHECK(configuration.table().entries()[0].range.end == 0x401020);

  unw1nd_test::map_reader memory;
  memory.words[0x8008] = 0x402000;
  memory.words[0x8000] = 0x9000;
  auto walker = std::move(configuration).build_with(memory, unw1nd::log::ignore_logs{});

  // after push %rbp: cfa = rsp + 16
  const auto stepped = walker.walk_one(regs(0x1, 0x8000, 0x401002));
  REQUIRE(stepped.ok());
  CHECK(stepped.value == regs(0x9000, 0x8010, 0x402000));

  // after mov %rsp,%rbp: cfa = rbp + 16
  const auto framed = walker.walk_one(regs(0x8000, 0x7000, 0x401010));
  REQUIRE(framed.ok());
  CHECK(framed.value == regs(0x9000, 0x8010, 0x402000));
}

TEST_CASE("options reports undecodable eh_frame bytes") {
  unw1nd::options configuration;
  const std::vector<uint8_t> garbage = {0x0c, 0x00, 0x00, 0x00, 0xff, 0xff, 0x00, 0x00};
  const auto added = configuration.add_entries_from_eh_frame(0, 0x1000, garbage);
  CHECK(added.error.code == unw1nd::error_code::decoder_error);
  CHECK(configuration.table().empty());
}

TEST_CASE("walker traces each step through its logger") {
  nested_frames frames;
  recording_logger logger;
  auto walker = frames.configuration().build_with(frames.memory, logger);

  REQUIRE(walker.walk_one(nested_frames::start()).ok());
  REQUIRE_FALSE(walker.walk_one(regs(0, 0, 0x9000)).ok());

  REQUIRE(logger.lines->size() == 2);
  CHECK((*logger.lines)[0] == "step ip=0x2010 sp=0x7010 bp=0x7200");
  CHECK((*logger.lines)[1] == "stop: no entry ip=0x9000 sp=0x0 bp=0x0");
}

TEST_CASE("walker gives its configuration back") {
  nested_frames frames;
  auto walker = frames.configuration().build_with(frames.memory, unw1nd::log::ignore_logs{});
  CHECK(walker.table().frozen());
  CHECK(walker.table().entries()[0].range.start == 0x2000);

  auto parts = std::move(walker).reconfigure();
  CHECK(parts.configuration.table().size() == 2);

  parts.configuration.clear_entries();
  auto rebuilt = std::move(parts.configuration).build_with(parts.reader, parts.logger);
  CHECK(rebuilt.table().empty());
  CHECK(rebuilt.walk_one(nested_frames::start()).error.code == unw1nd::error_code::no_unwind_info_for_address);
}

#if defined(__x86_64__) && defined(__linux__)
TEST_CASE("walker unwinds its own stack") {
  using unw1nd::registers::frame_registers;

  unw1nd::options configuration;
  REQUIRE(configuration.find_eh_frame_entries() > 0);
  auto walker = std::move(configuration).build();

  size_t frames = 0;
  const auto walked = frame_registers::with_current([&](const frame_registers& start) {
    return walker.walk(start, [&](const frame_registers& frame) {
      CHECK(frame.ip().is_valid());
      ++frames;
      return frames < 256;
    });
  });

  // the capturing frame and at least this test case's frame
  CHECK(frames >= 2);
  if (!walked.ok()) {
    CHECK(walked.error.code != unw1nd::error_code::platform_capture_failed);
  }
}

namespace {

// state shared with the SIGPROF handler, only touched by it while it runs
struct signal_walk {
  static constexpr size_t max_frames = 64;

  unw1nd::walker<>* walker = nullptr;
  std::array<unw1nd::registers::frame_registers, max_frames> frames{};
  size_t count = 0;
  unw1nd::error_info end{};
};

signal_walk g_signal_walk{};

void walk_from_sigprof(int, siginfo_t*, void* raw_context) {
  using unw1nd::registers::frame_registers;

  g_signal_walk.count = 0;
  const auto start = frame_registers::from_native_context(*static_cast<const ucontext_t*>(raw_context));
  if (!start.ok()) {
    g_signal_walk.end = start.error;
    return;
  }

  const auto outcome = g_signal_walk.walker->walk(start.value, [](const frame_registers& frame) {
    g_signal_walk.frames[g_signal_walk.count++] = frame;
    return g_signal_walk.count < signal_walk::max_frames ? walk_control::continue_walk : walk_control::break_walk;
  });
  g_signal_walk.end = outcome.error;
}

// raises SIGPROF and reports where control comes back to in the caller
[[gnu::noinline]] unw1nd::word raise_sigprof(int& raised) {
  raised = ::raise(SIGPROF);
  asm volatile("" ::: "memory");
  return reinterpret_cast<unw1nd::word>(__builtin_return_address(0));
}

const void* module_base(unw1nd::word address) {
  Dl_info info{};
  if (::dladdr(reinterpret_cast<const void*>(address), &info) == 0) {
    return nullptr;
  }
  return info.dli_fbase;
}

} // namespace

TEST_CASE("walker unwinds from a signal handler context") {
  unw1nd::options configuration;
  REQUIRE(configuration.find_eh_frame_entries() > 0);
  auto walker = std::move(configuration).build();

  g_signal_walk = signal_walk{};
  g_signal_walk.walker = &walker;

  struct sigaction action {};
  struct sigaction previous {};
  action.sa_sigaction = walk_from_sigprof;
  action.sa_flags = SA_SIGINFO;
  sigemptyset(&action.sa_mask);
  REQUIRE(::sigaction(SIGPROF, &action, &previous) == 0);

  int raised = -1;
  const unw1nd::word return_address = raise_sigprof(raised);
  ::sigaction(SIGPROF, &previous, nullptr);
  g_signal_walk.walker = nullptr;

  REQUIRE(raised == 0);
  const size_t count = g_signal_walk.count;
  REQUIRE(count >= 3);
  // the walk ends at the outermost frame or the frame limit, not on a decode or read failure
  CHECK((g_signal_walk.end.code == unw1nd::error_code::ok ||
         g_signal_walk.end.code == unw1nd::error_code::no_unwind_info_for_address ||
         g_signal_walk.end.code == unw1nd::error_code::invalid_tagged_word));

  // interrupted inside raise or whatever it calls in libc
  REQUIRE(g_signal_walk.frames[0].ip().is_valid());
  const void* libc_raise = ::dlsym(RTLD_DEFAULT, "raise");
  REQUIRE(libc_raise != nullptr);
  const void* libc_base = module_base(reinterpret_cast<unw1nd::word>(libc_raise));
  REQUIRE(libc_base != nullptr);
  CHECK(module_base(g_signal_walk.frames[0].ip().value()) == libc_base);

  bool found_caller = false;
  for (size_t i = 1; i < count; ++i) {
    if (g_signal_walk.frames[i].ip() == tagged_word::valid(return_address)) {
      found_caller = true;
      break;
    }
  }
  CHECK(found_caller);
}
#endif
