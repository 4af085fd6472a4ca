#include "SignalLuaFunctions.hpp"
#include "DoubleContext.hpp"
#include "SignalFunctions.hpp"
#include <exception>

namespace {

// C++ exceptions must not cross the Lua boundary; the message is moved onto
// the Lua stack and raised once no C++ object is left alive in this frame.
template <typename Fn>
int push_result(lua_State* L, Fn&& fn) {
    try {
        lua_pushnumber(L, fn());
        return 1;
    } catch (const std::exception& e) {
        lua_pushstring(L, e.what());
    }
    return lua_error(L);
}

}

int SignalLuaFunctions::lua_squarew(lua_State* L) {
    const double t = luaL_checknumber(L, 1);
    const double amplitude = luaL_optnumber(L, 2, 1.0);
    const double period = luaL_optnumber(L, 3, 1.0);

    return push_result(L, [&] {
        return SignalFunctions::square_wave(DoubleContext::instance(), t, amplitude, period);
    });
}

int SignalLuaFunctions::lua_trianglew(lua_State* L) {
    const double t = luaL_checknumber(L, 1);
    const double amplitude = luaL_optnumber(L, 2, 1.0);
    const double period = luaL_optnumber(L, 3, 1.0);

    return push_result(L, [&] {
        return SignalFunctions::triangle_wave(DoubleContext::instance(), t, amplitude, period);
    });
}

int SignalLuaFunctions::lua_sawtoothw(lua_State* L) {
    const double t = luaL_checknumber(L, 1);
    const double amplitude = luaL_optnumber(L, 2, 1.0);
    const double period = luaL_optnumber(L, 3, 1.0);

    return push_result(L, [&] {
        return SignalFunctions::sawtooth_wave(DoubleContext::instance(), t, amplitude, period);
    });
}

int SignalLuaFunctions::lua_unit_triangle(lua_State* L) {
    const double t = luaL_checknumber(L, 1);
    const double amplitude = luaL_optnumber(L, 2, 1.0);

    lua_pushnumber(L, SignalFunctions::unit_triangle_pulse(t, amplitude));
    return 1;
}

int SignalLuaFunctions::lua_sigmoidw(lua_State* L) {
    const double t = luaL_checknumber(L, 1);
    const double amplitude = luaL_optnumber(L, 2, 1.0);

    return push_result(L, [&] {
        return SignalFunctions::sigmoid_wave(DoubleContext::instance(), t, amplitude);
    });
}

void register_SignalLuaFunctions(lua_State* L) {
    lua_register(L, "squarew", SignalLuaFunctions::lua_squarew);
    lua_register(L, "trianglew", SignalLuaFunctions::lua_trianglew);
    lua_register(L, "sawtoothw", SignalLuaFunctions::lua_sawtoothw);
    lua_register(L, "unit_triangle", SignalLuaFunctions::lua_unit_triangle);
    lua_register(L, "sigmoidw", SignalLuaFunctions::lua_sigmoidw);
}
