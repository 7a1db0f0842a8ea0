#pragma once
#include <functional>
#include <iostream>
#include <string>

namespace compost {

// ---------- Typed log / message bus ----------
enum class LogKind { Info, Warning, Event, Weather };

struct LogMsg {
    LogKind     kind;
    std::string text;
};

using LogSink = std::function<void(const LogMsg&)>;

inline void console_sink(const LogMsg& m) {
    std::cout << m.text << '\n';
}
inline void null_sink(const LogMsg&) {}

struct StepOpts {
    bool    spawn_random_events = true;  // forecast sets this to false
    LogSink sink                 = console_sink;
};

// Helper to emit messages safely
inline void emit(const StepOpts& opt, LogKind k, std::string text) {
    if (opt.sink) opt.sink(LogMsg{k, std::move(text)});
}

inline StepOpts quietOpts() {
    StepOpts opt;
    opt.spawn_random_events = false;
    opt.sink = null_sink;
    return opt;
}

} // namespace compost
