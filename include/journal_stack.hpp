/**
 * @file journal_stack.hpp
 * @brief Stack walking used to find the caller of a logging operation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Walking is split in two steps with very different costs:
 * - collect() captures raw program counters of the current thread (cheap)
 * - symbolize() maps one program counter to file, line and function (expensive,
 *   reads symbol tables and debug information)
 *
 * The caller resolver runs collect() on every logging call and symbolize()
 * only once per distinct program counter.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

#include <boost/stacktrace.hpp>

namespace sjournal
{

/**
 * @brief Source location of one stack frame
 */
struct call_frame
{
    std::string file;     ///< Source file, empty when no debug information is available
    uint32_t line{0};     ///< Source line, 0 when unknown
    std::string function; ///< Demangled function name, empty when unknown
};

/**
 * @brief Interface for capturing and symbolizing the current call stack
 *
 * Implementations must be safe to call from several threads at once.
 */
class stack_walker
{
  public:
    virtual ~stack_walker() = default;

    /**
     * @brief Capture program counters of the calling thread
     * @param skip Number of frames above the caller of collect() to omit
     * @param out Destination array
     * @param max_frames Capacity of @p out
     * @return Number of program counters stored, innermost first
     */
    virtual size_t collect(size_t skip, std::uintptr_t *out, size_t max_frames) = 0;

    /**
     * @brief Resolve a program counter previously returned by collect()
     */
    virtual call_frame symbolize(std::uintptr_t pc) = 0;
};

/**
 * @brief Default walker backed by Boost.Stacktrace
 *
 * Source file and line come from debug information when the binary has it;
 * function names come from the dynamic symbol table otherwise.
 */
class boost_stack_walker final : public stack_walker
{
  public:
    size_t collect(size_t skip, std::uintptr_t *out, size_t max_frames) override
    {
        if (!out || max_frames == 0) return 0;

        // +1 drops this function's own frame
        boost::stacktrace::stacktrace trace(skip + 1, max_frames);

        size_t count = 0;
        for (const auto &frame : trace)
        {
            if (count == max_frames) break;
            out[count++] = reinterpret_cast<std::uintptr_t>(frame.address());
        }
        return count;
    }

    call_frame symbolize(std::uintptr_t pc) override
    {
        if (pc == 0) return {};

        // Captured addresses are return addresses and point just past the call
        boost::stacktrace::frame frame(reinterpret_cast<boost::stacktrace::frame::native_frame_ptr_t>(pc - 1));

        call_frame result;
        result.function = frame.name();
        result.file     = frame.source_file();
        result.line     = static_cast<uint32_t>(frame.source_line());
        return result;
    }
};

} // namespace sjournal
