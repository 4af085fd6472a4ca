#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <lua.hpp>

// Evaluates a Lua expression over the time variable `t`, with the signal
// functions available as globals. Compiled expressions are cached per thread.
class ExpressionEngine {
public:
    explicit ExpressionEngine(const std::string& expression);
    ~ExpressionEngine() = default;

    double evaluate(double t);

    const std::string& expression() const;

    // Disable copy and move
    ExpressionEngine(const ExpressionEngine&) = delete;
    ExpressionEngine& operator=(const ExpressionEngine&) = delete;

private:
    // Thread-local context
    struct ThreadLocalContext {
        lua_State* lua_vm = nullptr;
        std::unordered_map<std::string, int> template_cache;

        ThreadLocalContext();
        ~ThreadLocalContext();
    };

    struct ExpressionState {
        std::string expression;
    };

    std::unique_ptr<ExpressionState> state_;

    static ThreadLocalContext& get_thread_context();

    // Compiled function reference for expression, compiling on first use
    static int get_function_ref(const std::string& expression, ThreadLocalContext& context);
};
