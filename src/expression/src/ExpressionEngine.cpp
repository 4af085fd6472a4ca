#include "ExpressionEngine.hpp"
#include "SignalLuaFunctions.hpp"
#include <stdexcept>

// --------------------------
// ThreadLocalContext implementation
// --------------------------
ExpressionEngine::ThreadLocalContext::ThreadLocalContext() {
    lua_vm = luaL_newstate();
    if (!lua_vm) throw std::runtime_error("Failed to create Lua state");

    luaL_openlibs(lua_vm);
    register_SignalLuaFunctions(lua_vm);
}

ExpressionEngine::ThreadLocalContext::~ThreadLocalContext() {
    if (lua_vm) {
        for (auto& [_, ref] : template_cache) {
            if (ref != LUA_NOREF) {
                luaL_unref(lua_vm, LUA_REGISTRYINDEX, ref);
            }
        }

        lua_close(lua_vm);
    }
}

ExpressionEngine::ThreadLocalContext& ExpressionEngine::get_thread_context() {
    thread_local ThreadLocalContext context;
    return context;
}

int ExpressionEngine::get_function_ref(const std::string& expression, ThreadLocalContext& context) {
    auto& cache = context.template_cache;
    auto it = cache.find(expression);
    if (it != cache.end()) {
        return it->second;
    }

    lua_State* L = context.lua_vm;
    std::string full_expr = "return " + expression;

    if (luaL_loadstring(L, full_expr.c_str())) {
        std::string err = lua_tostring(L, -1);
        lua_pop(L, 1);
        throw std::runtime_error("Compile error: " + err);
    }

    int ref = luaL_ref(L, LUA_REGISTRYINDEX);
    cache[expression] = ref;
    return ref;
}

// --------------------------
// ExpressionEngine implementation
// --------------------------
ExpressionEngine::ExpressionEngine(const std::string& expression) {
    auto& context = get_thread_context();

    state_ = std::make_unique<ExpressionState>();
    state_->expression = expression;

    // Compile now so syntax errors surface at construction
    get_function_ref(expression, context);
}

const std::string& ExpressionEngine::expression() const {
    return state_->expression;
}

double ExpressionEngine::evaluate(double t) {
    auto& context = get_thread_context();
    lua_State* L = context.lua_vm;

    // Each thread compiles into its own Lua state
    const int ref = get_function_ref(state_->expression, context);

    lua_pushnumber(L, t);
    lua_setglobal(L, "t");

    lua_rawgeti(L, LUA_REGISTRYINDEX, ref);

    if (lua_pcall(L, 0, 1, 0)) {
        std::string err = lua_tostring(L, -1);
        lua_pop(L, 1);
        throw std::runtime_error("Runtime error: " + err);
    }

    if (lua_type(L, -1) != LUA_TNUMBER) {
        std::string type_name = luaL_typename(L, -1);
        lua_pop(L, 1);
        throw std::runtime_error("Expression '" + state_->expression + "' returned " + type_name + ", expected number");
    }

    double result = lua_tonumber(L, -1);
    lua_pop(L, 1);
    return result;
}
