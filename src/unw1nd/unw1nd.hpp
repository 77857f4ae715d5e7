#pragma once

#include "unw1nd/config/unwind_config.hpp"
#include "unw1nd/control.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/log/unwind_logger.hpp"
#include "unw1nd/memory/process_memory.hpp"
#include "unw1nd/registers/registers.hpp"
#include "unw1nd/tagged_word.hpp"
#include "unw1nd/walker/options.hpp"
#include "unw1nd/walker/walker.hpp"
