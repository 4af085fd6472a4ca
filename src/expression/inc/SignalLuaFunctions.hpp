#pragma once
#include <lua.hpp>

// Lua bindings of the signal functions, evaluated in host precision.
// Optional arguments default like their C++ counterparts:
//   squarew(t [, A [, P]])   trianglew(t [, A [, P]])   sawtoothw(t [, A [, P]])
//   unit_triangle(t [, A])   sigmoidw(t [, A])
class SignalLuaFunctions {
public:
    static int lua_squarew(lua_State* L);
    static int lua_trianglew(lua_State* L);
    static int lua_sawtoothw(lua_State* L);
    static int lua_unit_triangle(lua_State* L);
    static int lua_sigmoidw(lua_State* L);
};

void register_SignalLuaFunctions(lua_State* L);
