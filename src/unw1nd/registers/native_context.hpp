#pragma once

#include <ucontext.h>

#include "unw1nd/types.hpp"

namespace unw1nd::registers {

/**
 * @brief pull frame, stack and instruction pointers out of a machine context
 * @details works on contexts from getcontext and on the third argument of an
 * SA_SIGINFO handler. returns false where the layout is unknown.
 */
inline bool read_native_frame(const ucontext_t& context, word& bp, word& sp, word& ip) noexcept {
#if defined(__linux__) && defined(__x86_64__)
  bp = static_cast<word>(context.uc_mcontext.gregs[REG_RBP]);
  sp = static_cast<word>(context.uc_mcontext.gregs[REG_RSP]);
  ip = static_cast<word>(context.uc_mcontext.gregs[REG_RIP]);
  return true;
#elif defined(__linux__) && defined(__i386__)
  bp = static_cast<word>(context.uc_mcontext.gregs[REG_EBP]);
  sp = static_cast<word>(context.uc_mcontext.gregs[REG_ESP]);
  ip = static_cast<word>(context.uc_mcontext.gregs[REG_EIP]);
  return true;
#elif defined(__APPLE__) && defined(__x86_64__)
  if (!context.uc_mcontext) {
    return false;
  }
  bp = static_cast<word>(context.uc_mcontext->__ss.__rbp);
  sp = static_cast<word>(context.uc_mcontext->__ss.__rsp);
  ip = static_cast<word>(context.uc_mcontext->__ss.__rip);
  return true;
#else
  (void) context;
  bp = sp = ip = 0;
  return false;
#endif
}

} // namespace unw1nd::registers
