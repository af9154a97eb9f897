/**
 * @file Assert.hpp
 * @brief Debug-only invariant checks routed through the Log facade.
 *
 * MTS_ASSERT guards internal invariants of the engine (a folded sample
 * outside its domain, a table index past the grid). It compiles to nothing
 * unless MTS_DEBUG is defined. Bad input is reported through
 * core::Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_CORE_ASSERT_HPP
    #define MTS_CORE_ASSERT_HPP

    #include "Log.hpp"

    #include <cstdlib>
    #include <source_location>
    #include <string>

namespace mts::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    Log::fatal("assert",
        std::string(loc.file_name()) + ":" + std::to_string(loc.line()) +
        " in " + loc.function_name() + ": '" + expr + "' does not hold");
    std::abort();
}

} // namespace mts::core::detail

    #ifdef MTS_DEBUG
        #define MTS_ASSERT(cond)                                          \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::mts::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define MTS_ASSERT(cond) ((void)0)
    #endif

#endif // MTS_CORE_ASSERT_HPP
