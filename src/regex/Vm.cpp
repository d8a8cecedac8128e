#include "regex/Vm.hpp"
#include <new>
#include <vector>

namespace relite::regex {

const char* describe(RunError e) {
    switch (e) {
        case RunError::NONE:          return "no error";
        case RunError::THREAD_LIMIT:  return "thread limit exceeded";
        case RunError::STEP_LIMIT:    return "step limit exceeded";
        case RunError::OUT_OF_MEMORY: return "out of memory growing thread set";
    }
    return "unknown error";
}

std::optional<bool> run(const Program& prog, std::string_view input,
                        const RunLimits& limits, RunError* err, RunStats* stats) {
    if (err) *err = RunError::NONE;
    RunStats st{};

    auto finish = [&](std::optional<bool> result, RunError e) -> std::optional<bool> {
        if (err) *err = e;
        if (stats) *stats = st;
        return result;
    };

    if (prog.empty()) return finish(false, RunError::NONE);

    // Owned by this call only; released on every return below.
    std::vector<Thread> threads;

    try {
        threads.reserve(16);
        threads.push_back({0, 0, 0});
        st.peak_threads = 1;

        while (!threads.empty()) {
            ++st.sweeps;
            // Survivors are compacted to [0, w). Threads appended by SPLIT land
            // past the read cursor and are visited later in this same sweep.
            std::size_t w = 0;
            for (std::size_t r = 0; r < threads.size(); ++r) {
                Thread t = threads[r];
                bool alive = true;
                for (;;) {
                    ++st.steps;
                    if (limits.max_steps && st.steps > limits.max_steps)
                        return finish(std::nullopt, RunError::STEP_LIMIT);

                    const Instruction& ins = prog[t.pc];
                    switch (ins.op) {
                        case Op::CHAR:
                            if (t.sp < input.size() && (uint8_t)input[t.sp] == ins.ch) {
                                ++t.pc;
                                ++t.sp;
                                t.idle = 0;
                            } else {
                                alive = false;
                            }
                            break;
                        case Op::ANY:
                            if (t.sp < input.size()) {
                                ++t.pc;
                                ++t.sp;
                                t.idle = 0;
                            } else {
                                alive = false;
                            }
                            break;
                        case Op::MATCH:
                            return finish(true, RunError::NONE);
                        case Op::JMP:
                            if (t.idle >= prog.size()) {
                                alive = false;
                                break;
                            }
                            ++t.idle;
                            t.pc = ins.x;
                            continue;
                        case Op::SPLIT: {
                            if (t.idle >= prog.size()) {
                                alive = false;
                                break;
                            }
                            ++t.idle;
                            std::size_t live = w + (threads.size() - r) + 1;
                            if (limits.max_threads && live > limits.max_threads)
                                return finish(std::nullopt, RunError::THREAD_LIMIT);
                            t.pc = ins.x;
                            threads.push_back({ins.y, t.idle, t.sp});
                            if (live > st.peak_threads) st.peak_threads = live;
                            break;
                        }
                    }
                    break;
                }
                if (alive) threads[w++] = t;
            }
            threads.resize(w);
        }
    } catch (const std::bad_alloc&) {
        return finish(std::nullopt, RunError::OUT_OF_MEMORY);
    }

    return finish(false, RunError::NONE);
}

std::ptrdiff_t search(const Program& prog, std::string_view input,
           const RunLimits& limits, RunError* err) {
    if (err) *err = RunError::NONE;
    for (std::size_t start = 0; start <= input.size(); ++start) {
        RunError e = RunError::NONE;
        auto r = run(prog, input.substr(start), limits, &e);
        if (!r) {
            if (err) *err = e;
            return -1;
        }
        if (*r) return (std::ptrdiff_t)start;
    }
    return -1;
}

} // namespace relite::regex
