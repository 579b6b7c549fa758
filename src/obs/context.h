#pragma once

#include <string>

namespace csvsentry::obs {

// Request-scoped fields merged into every log line emitted on this thread.
struct Context {
    std::string request_id;
    std::string operation;
    std::string upload_name;
};

inline thread_local Context g_context{};
inline thread_local bool g_context_set = false;

inline auto GetContext() -> const Context& {
    return g_context;
}

inline auto HasContext() -> bool {
    return g_context_set;
}

inline auto SetContext(const Context& ctx) -> void {
    g_context = ctx;
    g_context_set = true;
}

inline auto ClearContext() -> void {
    g_context = Context{};
    g_context_set = false;
}

inline auto UpdateUploadName(const std::string& upload_name) -> void {
    g_context.upload_name = upload_name;
    g_context_set = true;
}

class ScopedContext {
public:
    explicit ScopedContext(const Context& ctx)
        : prev_(g_context), prev_set_(g_context_set) {
        SetContext(ctx);
    }

    ~ScopedContext() {
        if (prev_set_) {
            g_context = prev_;
            g_context_set = true;
        } else {
            ClearContext();
        }
    }

    ScopedContext(const ScopedContext&) = delete;
    auto operator=(const ScopedContext&) -> ScopedContext& = delete;

private:
    Context prev_{};
    bool prev_set_ = false;
};

} // namespace csvsentry::obs
