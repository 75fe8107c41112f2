#pragma once

// Turns the argument into a string literal as written.
#define AOC23_STRINGIFY_NX(x) #x

// Turns the expanded argument into a string literal. Used for paths passed in as compile
// definitions, e.g. AOC23_STRINGIFY(INPUT_DIR).
#define AOC23_STRINGIFY(x) AOC23_STRINGIFY_NX(x)
